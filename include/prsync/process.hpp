#pragma once
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace prsync {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

// Runs argv[0] from PATH in cwd. env entries are set on top of the inherited
// environment; an empty value unsets the variable.
CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd,
                      const std::unordered_map<std::string, std::string> &env =
                          {});

std::string join_args(const std::vector<std::string> &argv);

std::string trim(std::string s);

} // namespace prsync
