#include "cli/registry.hpp"

int cmd_init(const redline::Settings &, const std::vector<std::string> &);
int cmd_save(const redline::Settings &, const std::vector<std::string> &);
int cmd_log(const redline::Settings &, const std::vector<std::string> &);
int cmd_show(const redline::Settings &, const std::vector<std::string> &);
int cmd_compare(const redline::Settings &, const std::vector<std::string> &);
int cmd_diff(const redline::Settings &, const std::vector<std::string> &);
int cmd_clear(const redline::Settings &, const std::vector<std::string> &);

namespace redline::cli {

void register_all_commands() {
  register_command({.name = "init",
                    .usage = "",
                    .summary = "Create .redline/config and the versions directory",
                    .fn = ::cmd_init});
  register_command({.name = "save",
                    .usage = "<doc> <file|-> [--label L] [--style S]",
                    .summary = "Save a new version of a document",
                    .fn = ::cmd_save});
  register_command({.name = "log",
                    .usage = "<doc>",
                    .summary = "List the versions of a document",
                    .fn = ::cmd_log});
  register_command({.name = "show",
                    .usage = "<doc> <version>",
                    .summary = "Print one version",
                    .fn = ::cmd_show});
  register_command({.name = "compare",
                    .usage = "<file-a|-> <file-b|-> [--lines] [--html]",
                    .summary = "Compare two files",
                    .fn = ::cmd_compare});
  register_command({.name = "diff",
                    .usage = "<doc> <version-a> <version-b> [--lines] [--html]",
                    .summary = "Compare two saved versions",
                    .fn = ::cmd_diff});
  register_command({.name = "clear",
                    .usage = "<doc>",
                    .summary = "Delete a document's history",
                    .fn = ::cmd_clear});
}

} // namespace redline::cli
