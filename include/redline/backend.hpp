#pragma once
#include "redline/version.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace redline {

// Where document histories live. Implementations must be safe to call
// concurrently for different document ids.
class HistoryBackend {
public:
  virtual ~HistoryBackend() = default;

  // Stored history, or empty if the document has none.
  // Throws PersistenceFault if it exists but cannot be read or parsed.
  virtual std::vector<TextVersion> load(std::string_view document_id) = 0;

  // Replace the stored history. Throws PersistenceFault on failure.
  virtual void store(std::string_view document_id, const std::vector<TextVersion> &history) = 0;

  // Drop the stored history (no error if absent). Throws PersistenceFault on failure.
  virtual void remove(std::string_view document_id) = 0;
};

// One JSON file per document: <dir>/<document_id>.json, rewritten in full on every store.
class FileHistoryBackend final : public HistoryBackend {
public:
  explicit FileHistoryBackend(std::filesystem::path dir);

  std::vector<TextVersion> load(std::string_view document_id) override;
  void store(std::string_view document_id, const std::vector<TextVersion> &history) override;
  void remove(std::string_view document_id) override;

  [[nodiscard]] std::filesystem::path path_for(std::string_view document_id) const;

private:
  std::filesystem::path dir_;
};

} // namespace redline
