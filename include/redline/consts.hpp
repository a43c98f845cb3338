#pragma once
#include <cstddef>
#include <string_view>

namespace redline::consts {

// Directory and file names
inline constexpr std::string_view kWorkDir     = ".redline";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kVersionsDir = "versions";
inline constexpr std::string_view kHistoryExt  = ".json";

// Environment overrides for the config file
inline constexpr std::string_view kEnvVersionsDir   = "REDLINE_VERSIONS_DIR";
inline constexpr std::string_view kEnvMaxInputChars = "REDLINE_MAX_INPUT_CHARS";
inline constexpr std::string_view kEnvLogLevel      = "REDLINE_LOG_LEVEL";

// ——— Version ids ———
inline constexpr std::size_t kVersionIdLen    = 12; // hex chars kept from the MD5 digest
inline constexpr std::size_t kMaxVersionIdLen = 64;
inline constexpr std::size_t kMaxDocumentIdLen = 128;

// ——— Comparison ———
inline constexpr std::size_t kPreviewChars        = 50;
inline constexpr std::string_view kPreviewEllipsis = "...";
inline constexpr std::size_t kDefaultMaxInputChars = 200000;
inline constexpr double kRatioScale               = 10000.0; // 4 decimal digits

// Popular-unit heuristic: only for sequences at least this long
inline constexpr std::size_t kAutojunkMinLen = 200;

// ——— History file JSON keys ———
inline constexpr const char *kKeyVersionId = "version_id";
inline constexpr const char *kKeyContent   = "content";
inline constexpr const char *kKeyTimestamp = "timestamp";
inline constexpr const char *kKeyLabel     = "label";
inline constexpr const char *kKeyStyle     = "style";
inline constexpr int kJsonIndent = 2;

// ——— HTML markup ———
inline constexpr std::string_view kDeleteOpen =
    "<span class=\"diff-delete\" style=\"background:#ffcccc;text-decoration:line-through;\">";
inline constexpr std::string_view kInsertOpen = "<span class=\"diff-insert\" style=\"background:#ccffcc;\">";
inline constexpr std::string_view kSpanClose  = "</span>";
inline constexpr std::string_view kLineBreak  = "<br>";

} // namespace redline::consts
