#pragma once
#include "redline/backend.hpp"
#include "redline/config.hpp"
#include "redline/engine.hpp"
#include "redline/version.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redline {

/**
 * Ordered, per-document history of immutable snapshots.
 *
 * Each document id has its own lock; saves and clears of one document are
 * serialized, different documents proceed independently. Reads that fail
 * degrade to an empty history and are logged.
 */
class VersionStore {
public:
  explicit VersionStore(std::unique_ptr<HistoryBackend> backend, CompareOptions options = {});

  // File-backed store under settings.versions_dir.
  explicit VersionStore(const Settings &settings);

  VersionStore(const VersionStore &) = delete;
  VersionStore &operator=(const VersionStore &) = delete;

  // Append a snapshot and rewrite the document's stored history.
  // Throws ValidationError on a bad id or non-UTF-8 text, and PersistenceFault
  // if the history could not be written (the snapshot is then not kept).
  TextVersion save(std::string_view document_id, std::string_view content,
                   std::optional<std::string> label = std::nullopt,
                   std::optional<std::string> style = std::nullopt);

  // Oldest first. Empty if the document has no readable history.
  [[nodiscard]] std::vector<TextVersion> list(std::string_view document_id);

  [[nodiscard]] std::optional<TextVersion> get(std::string_view document_id,
                                               std::string_view version_id);

  // std::nullopt if either version is missing.
  [[nodiscard]] std::optional<DiffResult> compare_versions(std::string_view document_id,
                                                           std::string_view version_id_a,
                                                           std::string_view version_id_b);
  [[nodiscard]] std::optional<DiffResult> compare_versions(std::string_view document_id,
                                                           std::string_view version_id_a,
                                                           std::string_view version_id_b,
                                                           diff::Granularity granularity);

  // Forget the document in memory and in storage. No error if it has no history;
  // a storage fault is logged and the document is re-read on next access.
  void clear(std::string_view document_id);

private:
  struct Slot {
    std::mutex mu;
    bool loaded = false;
    std::vector<TextVersion> history;
  };

  std::shared_ptr<Slot> slot_for(std::string_view document_id);
  // Forget an empty slot nobody else holds. Caller must not hold slot->mu.
  void drop_if_empty(std::string_view document_id, const std::shared_ptr<Slot> &slot);
  // Caller holds slot.mu.
  void ensure_loaded(Slot &slot, std::string_view document_id);

  std::unique_ptr<HistoryBackend> backend_;
  CompareOptions options_;

  std::mutex table_mu_;
  std::map<std::string, std::shared_ptr<Slot>, std::less<>> slots_;
};

} // namespace redline
