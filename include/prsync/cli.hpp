#pragma once
#include <prsync/suffix.hpp>
#include <prsync/types.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prsync {

inline constexpr const char *kDefaultBot =
    "github-actions[bot] <41898282+github-actions[bot]@users.noreply.github.com>";

struct RunConfig {
  std::filesystem::path path = ".";
  std::vector<std::string> add_paths;
  std::string commit_message = "[prsync] automated change";
  Identity committer;
  std::optional<Identity> author; // nullopt: git user.name/user.email
  bool signoff = false;
  bool sign_commits = false;

  std::string branch = "prsync/patch";
  SuffixStrategy branch_suffix = SuffixStrategy::None;
  std::optional<std::string> base;
  bool delete_branch = false;
  std::optional<std::string> push_to_fork; // owner/repo
  std::string remote = "origin";

  std::string title = "Changes by prsync";
  std::string body;
  std::vector<std::string> labels;
  std::vector<std::string> assignees;
  std::vector<std::string> reviewers;
  std::vector<std::string> team_reviewers;
  int milestone = 0;
  bool draft = false;
  bool maintainer_can_modify = true;

  std::string token;
  std::string repository; // owner/repo, empty: derived from the remote URL
  std::string api_url = "https://api.github.com";
  int http_retries = 3;
  int http_backoff_ms = 500;

  bool verbose = false;
  std::optional<std::filesystem::path> log_file;
  std::size_t log_rotate_max = 10 * 1024 * 1024;
  std::size_t log_rotate_files = 3;
};

struct CmdSync {
  RunConfig cfg;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdSync, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// process environment
std::optional<std::string> getenv_lookup(const std::string &name);

// Flags first, then INPUT_<NAME> from the environment.
ParseResult parse_cli(int argc, char **argv,
                      const EnvLookup &env = getenv_lookup);

// comma or newline separated, trimmed, empty items dropped
std::vector<std::string> split_list(const std::string &value);

} // namespace prsync
