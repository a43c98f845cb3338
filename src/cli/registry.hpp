#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace redline::cli {

void register_command(const Command &cmd);
const Command *find_command(std::string_view name);

// Command list with synopses.
void print_usage(std::ostream &out);

// Load the workspace settings, run the command and turn whatever it throws
// into a message on stderr and an exit status.
int run_command(const Command &cmd, const std::vector<std::string> &args);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace redline::cli
