#include "cli/common.hpp"
#include "redline/engine.hpp"
#include "redline/records.hpp"

#include <iostream>
#include <string>

int cmd_compare(const redline::Settings &settings, const std::vector<std::string> &args) {
  const auto parsed = redline::cli::parse_diff_args(args, 2);
  const std::string text_a = redline::cli::read_input(parsed.positional[0]);
  const std::string text_b = redline::cli::read_input(parsed.positional[1]);
  const redline::CompareOptions options{.granularity = parsed.granularity,
                                        .max_input_chars = settings.max_input_chars,
                                        .autojunk = settings.autojunk};
  const auto result = redline::compare(text_a, text_b, options);
  if (parsed.html)
    std::cout << result.html_diff << "\n";
  else
    std::cout << nlohmann::json(result).dump(2) << "\n";
  return redline::cli::kExitOk;
}
