#include "redline/version_store.hpp"

#include "redline/errors.hpp"
#include "redline/log.hpp"
#include "redline/text.hpp"
#include "redline/time.hpp"
#include "redline/util.hpp"

#include <algorithm>

namespace redline {

namespace {

constexpr std::string_view kComponent = "store";

void validate_text(std::string_view what, std::string_view text) {
  if (!text::is_valid_utf8(text))
    throw ValidationError(std::string(what) + " is not valid UTF-8");
}

const TextVersion *find_version(const std::vector<TextVersion> &history,
                                std::string_view version_id) {
  const auto it = std::ranges::find_if(
      history, [&](const TextVersion &v) { return v.version_id == version_id; });
  return it == history.end() ? nullptr : &*it;
}

} // namespace

VersionStore::VersionStore(std::unique_ptr<HistoryBackend> backend, CompareOptions options)
    : backend_(std::move(backend)), options_(options) {}

VersionStore::VersionStore(const Settings &settings)
    : VersionStore(std::make_unique<FileHistoryBackend>(settings.versions_dir),
                   CompareOptions{.granularity = diff::Granularity::Char,
                                  .max_input_chars = settings.max_input_chars,
                                  .autojunk = settings.autojunk}) {}

std::shared_ptr<VersionStore::Slot> VersionStore::slot_for(std::string_view document_id) {
  std::lock_guard lock(table_mu_);
  auto it = slots_.find(document_id);
  if (it == slots_.end()) {
    it = slots_.emplace(std::string(document_id), std::make_shared<Slot>()).first;
  }
  return it->second;
}

void VersionStore::drop_if_empty(std::string_view document_id,
                                 const std::shared_ptr<Slot> &slot) {
  std::lock_guard table_lock(table_mu_);
  const auto it = slots_.find(document_id);
  // New holders only come through the table, so nobody else has this slot.
  if (it == slots_.end() || it->second != slot || slot.use_count() != 2)
    return;
  std::lock_guard lock(slot->mu);
  if (slot->history.empty())
    slots_.erase(it);
}

void VersionStore::ensure_loaded(Slot &slot, std::string_view document_id) {
  if (slot.loaded)
    return;
  try {
    slot.history = backend_->load(document_id);
  } catch (const PersistenceFault &e) {
    log::warn(kComponent, std::string(e.what()) + "; treating '" + std::string(document_id) +
                              "' as empty");
    slot.history.clear();
  }
  slot.loaded = true;
}

TextVersion VersionStore::save(std::string_view document_id, std::string_view content,
                               std::optional<std::string> label,
                               std::optional<std::string> style) {
  validate_document_id(document_id);
  validate_text("content", content);
  if (label)
    validate_text("label", *label);
  if (style)
    validate_text("style", *style);

  const auto slot = slot_for(document_id);
  std::lock_guard lock(slot->mu);
  ensure_loaded(*slot, document_id);

  // Timestamps never go backwards within one history.
  std::string timestamp = timeutil::iso8601_now();
  if (!slot->history.empty() && timestamp < slot->history.back().timestamp)
    timestamp = slot->history.back().timestamp;

  TextVersion version{.version_id = make_version_id(content, timestamp),
                      .content = std::string(content),
                      .timestamp = std::move(timestamp),
                      .label = std::move(label),
                      .style = std::move(style)};
  if (find_version(slot->history, version.version_id)) {
    log::warn(kComponent, "version id " + version.version_id + " already present in '" +
                              std::string(document_id) + "'; lookups return the earlier one");
  }

  std::vector<TextVersion> updated = slot->history;
  updated.push_back(version);
  try {
    backend_->store(document_id, updated);
  } catch (const PersistenceFault &e) {
    log::error(kComponent, e.what());
    throw;
  }
  slot->history = std::move(updated);
  log::debug(kComponent, "saved " + version.version_id + " to '" + std::string(document_id) + "'");
  return version;
}

std::vector<TextVersion> VersionStore::list(std::string_view document_id) {
  validate_document_id(document_id);
  const auto slot = slot_for(document_id);
  std::vector<TextVersion> history;
  {
    std::lock_guard lock(slot->mu);
    ensure_loaded(*slot, document_id);
    history = slot->history;
  }
  if (history.empty())
    drop_if_empty(document_id, slot);
  return history;
}

std::optional<TextVersion> VersionStore::get(std::string_view document_id,
                                             std::string_view version_id) {
  validate_document_id(document_id);
  validate_version_id(version_id);
  const auto slot = slot_for(document_id);
  std::optional<TextVersion> found;
  bool empty = false;
  {
    std::lock_guard lock(slot->mu);
    ensure_loaded(*slot, document_id);
    if (const TextVersion *v = find_version(slot->history, version_id))
      found = *v;
    empty = slot->history.empty();
  }
  if (empty)
    drop_if_empty(document_id, slot);
  return found;
}

std::optional<DiffResult> VersionStore::compare_versions(std::string_view document_id,
                                                         std::string_view version_id_a,
                                                         std::string_view version_id_b) {
  return compare_versions(document_id, version_id_a, version_id_b, options_.granularity);
}

std::optional<DiffResult> VersionStore::compare_versions(std::string_view document_id,
                                                         std::string_view version_id_a,
                                                         std::string_view version_id_b,
                                                         diff::Granularity granularity) {
  const auto a = get(document_id, version_id_a);
  const auto b = get(document_id, version_id_b);
  if (!a || !b)
    return std::nullopt;

  CompareOptions options = options_;
  options.granularity = granularity;
  return compare(a->content, b->content, options);
}

void VersionStore::clear(std::string_view document_id) {
  validate_document_id(document_id);
  const auto slot = slot_for(document_id);
  {
    std::lock_guard lock(slot->mu);
    slot->history.clear();
    slot->loaded = true;
    try {
      backend_->remove(document_id);
    } catch (const PersistenceFault &e) {
      // Re-read on next access; the file may still be there.
      slot->loaded = false;
      log::error(kComponent, std::string(e.what()) + "; '" + std::string(document_id) +
                                 "' not cleared");
    }
  }
  drop_if_empty(document_id, slot);
}

} // namespace redline
