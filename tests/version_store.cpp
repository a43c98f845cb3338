#include "redline/version_store.hpp"

#include "redline/errors.hpp"
#include "redline/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

template <typename E, typename F> static bool throws(F &&f) {
  try {
    f();
  } catch (const E &) {
    return true;
  }
  return false;
}

// Backend whose writes can be made to fail.
class FlakyBackend : public redline::HistoryBackend {
public:
  bool fail_writes = false;
  int loads = 0;
  std::map<std::string, std::vector<redline::TextVersion>, std::less<>> data;

  std::vector<redline::TextVersion> load(std::string_view id) override {
    ++loads;
    auto it = data.find(id);
    return it == data.end() ? std::vector<redline::TextVersion>{} : it->second;
  }
  void store(std::string_view id, const std::vector<redline::TextVersion> &h) override {
    if (fail_writes)
      throw redline::PersistenceFault("disk full");
    data[std::string(id)] = h;
  }
  void remove(std::string_view id) override {
    if (fail_writes)
      throw redline::PersistenceFault("read-only");
    data.erase(std::string(id));
  }
};

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("redline_store_" + std::to_string(std::random_device{}()));
  redline::Settings settings{.versions_dir = root / "versions",
                             .max_input_chars = 1000,
                             .autojunk = true,
                             .log_level = redline::log::Level::Warn};
  std::ostringstream log_out;
  redline::log::set_sink(&log_out);

  try {
    // Round trip and ordering
    {
      redline::VersionStore store{settings};
      const auto v1 = store.save("paper", "hello", "v1");
      check(v1.version_id.size() == 12, "version id is 12 hex chars");
      check(v1.label == "v1" && !v1.style, "label kept, style absent");
      const auto got = store.get("paper", v1.version_id);
      check(got && got->content == "hello", "get returns saved content");

      const auto v2 = store.save("paper", "world", std::nullopt, "Nature-style");
      const auto history = store.list("paper");
      check(history.size() == 2 && history[0] == v1 && history[1] == v2, "history in save order");
      check(history[0].timestamp <= history[1].timestamp, "timestamps non-decreasing");

      // Same content twice is two entries.
      const auto v3 = store.save("paper", "hello");
      check(store.list("paper").size() == 3, "no dedup of identical content");
      check(v3.version_id != v1.version_id, "identical content gets a fresh id");

      check(!store.get("paper", "000000000000"), "unknown id is not found");
      check(store.list("unknown-doc").empty(), "unknown document lists empty");
    }

    // Persisted layout
    {
      const fs::path file = settings.versions_dir / "paper.json";
      check(fs::exists(file), "history file exists");
      const auto j = nlohmann::json::parse(slurp(file));
      check(j.is_array() && j.size() == 3, "file is an array of three versions");
      check(j[0].at("content") == "hello" && j[0].at("label") == "v1" && j[0].at("style").is_null(),
            "first record fields");
      check(j[1].at("label").is_null() && j[1].at("style") == "Nature-style",
            "second record fields");
      check(j[0].contains("version_id") && j[0].contains("timestamp"), "id and timestamp stored");
    }

    // A new store reads the same history back
    {
      redline::VersionStore reopened{settings};
      const auto history = reopened.list("paper");
      check(history.size() == 3 && history[1].content == "world", "history survives reopen");

      const auto diff = reopened.compare_versions("paper", history[0].version_id,
                                                  history[1].version_id);
      check(diff.has_value(), "compare_versions finds both");
      if (diff) {
        check(diff->version_a_preview == "hello" && diff->version_b_preview == "world",
              "compare_versions previews");
        check(diff->similarity == 0.2, "hello/world similarity");
      }
      check(!reopened.compare_versions("paper", history[0].version_id, "ffffffffffff"),
            "compare_versions with a missing id is not found");

      const auto by_line = reopened.compare_versions("paper", history[0].version_id,
                                                     history[2].version_id,
                                                     redline::diff::Granularity::Line);
      check(by_line && by_line->segments.size() == 1 &&
                by_line->segments[0].kind == redline::diff::SegmentKind::Equal,
            "line compare of identical versions");
    }

    // Clearing
    {
      redline::VersionStore store{settings};
      store.clear("paper");
      check(store.list("paper").empty(), "list empty after clear");
      check(!fs::exists(settings.versions_dir / "paper.json"), "file removed by clear");
      store.clear("paper"); // idempotent
      store.clear("never-saved");
      check(redline::VersionStore{settings}.list("paper").empty(), "clear is durable");
    }

    // Corrupt file degrades to empty and is logged
    {
      fs::create_directories(settings.versions_dir);
      std::ofstream(settings.versions_dir / "broken.json") << "{ not json";
      std::ofstream(settings.versions_dir / "wrong-shape.json") << R"([{"content": 1}])";
      log_out.str("");
      redline::VersionStore store{settings};
      check(store.list("broken").empty(), "corrupt file lists empty");
      check(store.list("wrong-shape").empty(), "wrong-shape file lists empty");
      check(log_out.str().find("warn: store:") != std::string::npos, "corrupt file logged");

      // Saving over it starts a fresh history.
      store.save("broken", "fresh");
      check(redline::VersionStore{settings}.list("broken").size() == 1, "save replaces corrupt file");
    }

    // Files written by other tools with missing label/style still load
    {
      std::ofstream(settings.versions_dir / "legacy.json")
          << R"([{"version_id":"abc123abc123","content":"old","timestamp":"2024-01-01T00:00:00"}])";
      redline::VersionStore store{settings};
      const auto v = store.get("legacy", "abc123abc123");
      check(v && v->content == "old" && !v->label && !v->style, "legacy record loads");
    }

    // Validation happens before any state change
    {
      redline::VersionStore store{settings};
      check(throws<redline::ValidationError>([&] { store.save("", "x"); }), "empty doc id");
      check(throws<redline::ValidationError>([&] { store.save("../etc", "x"); }), "path doc id");
      check(throws<redline::ValidationError>([&] { store.save("a/b", "x"); }), "slash doc id");
      check(throws<redline::ValidationError>([&] { store.save(".hidden", "x"); }), "dot doc id");
      check(throws<redline::ValidationError>([&] { store.save("doc", "bad \xFF"); }),
            "non-UTF-8 content");
      check(throws<redline::ValidationError>([&] { (void)store.get("doc", "no/pe"); }),
            "malformed version id");
      check(!fs::exists(settings.versions_dir / "doc.json"), "rejected save wrote nothing");
    }

    // Oversized stored versions surface the limit on compare
    {
      redline::VersionStore store{settings};
      const auto small = store.save("big", "tiny");
      const auto large = store.save("big", std::string(1001, 'x'));
      check(throws<redline::ResourceLimitExceeded>(
                [&] { (void)store.compare_versions("big", small.version_id, large.version_id); }),
            "compare_versions honours the input cap");
    }

    // Failed writes roll back and surface as PersistenceFault
    {
      auto backend = std::make_unique<FlakyBackend>();
      FlakyBackend *raw = backend.get();
      redline::VersionStore store{std::move(backend)};
      store.save("d", "one");
      raw->fail_writes = true;
      check(throws<redline::PersistenceFault>([&] { store.save("d", "two"); }),
            "write failure raised");
      check(store.list("d").size() == 1, "failed save not kept in memory");
      log_out.str("");
      bool threw = false;
      try {
        store.clear("d");
      } catch (const std::exception &) {
        threw = true;
      }
      check(!threw, "remove failure is not raised from clear");
      check(log_out.str().find("error: store:") != std::string::npos, "remove failure logged");
      raw->fail_writes = false;
      check(store.list("d").size() == 1, "history still readable after failed clear");
      store.clear("d");
      check(store.list("d").empty(), "clear succeeds once storage recovers");
    }

    // Lookups of unknown documents leave nothing resident
    {
      auto backend = std::make_unique<FlakyBackend>();
      FlakyBackend *raw = backend.get();
      redline::VersionStore store{std::move(backend)};
      (void)store.list("ghost");
      (void)store.get("ghost", "abc123");
      check(raw->loads == 2, "empty document is not kept after a lookup");

      store.save("kept", "text");
      const int before = raw->loads;
      (void)store.list("kept");
      (void)store.list("kept");
      check(raw->loads == before, "non-empty document stays resident");

      store.clear("kept");
      (void)store.list("kept");
      check(raw->loads == before + 1, "cleared document is forgotten");
      check(raw->data.find("kept") == raw->data.end(), "cleared document removed from storage");
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    ++failures;
  }

  redline::log::set_sink(nullptr);
  std::error_code ec;
  fs::remove_all(root, ec);

  if (failures) {
    std::cerr << failures << " store check(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
