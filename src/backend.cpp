#include "redline/backend.hpp"

#include "redline/consts.hpp"
#include "redline/errors.hpp"
#include "redline/fs.hpp"
#include "redline/records.hpp"

#include <exception>
#include <string>

namespace redline {

FileHistoryBackend::FileHistoryBackend(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path FileHistoryBackend::path_for(std::string_view document_id) const {
  std::string name(document_id);
  name += consts::kHistoryExt;
  return dir_ / name;
}

std::vector<TextVersion> FileHistoryBackend::load(std::string_view document_id) {
  const auto path = path_for(document_id);
  if (!fs::exists(path))
    return {};
  try {
    return parse_history(fs::read_text(path));
  } catch (const std::exception &e) {
    throw PersistenceFault("cannot load " + path.string() + ": " + e.what());
  }
}

void FileHistoryBackend::store(std::string_view document_id,
                               const std::vector<TextVersion> &history) {
  const auto path = path_for(document_id);
  try {
    fs::write_text_atomic(path, dump_history(history));
  } catch (const std::exception &e) {
    throw PersistenceFault("cannot write " + path.string() + ": " + e.what());
  }
}

void FileHistoryBackend::remove(std::string_view document_id) {
  const auto path = path_for(document_id);
  try {
    fs::remove_file(path);
  } catch (const std::exception &e) {
    throw PersistenceFault(e.what());
  }
}

} // namespace redline
