#include "support.hpp"

#include <prsync/cli.hpp>
#include <prsync/errors.hpp>
#include <prsync/outputs.hpp>

#include <map>
#include <sstream>
#include <vector>

using namespace prsync;

namespace {

struct Argv {
  std::vector<std::string> store;
  std::vector<char *> ptrs;

  Argv(std::initializer_list<std::string> args) : store(args) {}
  int argc() const { return static_cast<int>(store.size()); }
  char **argv() {
    ptrs.clear();
    for (auto &s : store)
      ptrs.push_back(s.data());
    return ptrs.data();
  }
};

EnvLookup env_of(std::map<std::string, std::string> vars) {
  return [vars](const std::string &name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end())
      return std::nullopt;
    return it->second;
  };
}

ParseResult parse(Argv a, std::map<std::string, std::string> vars = {}) {
  return parse_cli(a.argc(), a.argv(), env_of(std::move(vars)));
}

const RunConfig &sync_cfg(const ParseResult &r) {
  INFO(r.error);
  REQUIRE(r.cmd);
  REQUIRE(std::holds_alternative<CmdSync>(*r.cmd));
  return std::get<CmdSync>(*r.cmd).cfg;
}

} // namespace

TEST_CASE("commands") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"prsync"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"prsync", "--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"prsync", "version"}).cmd));

  auto r = parse({"prsync", "deploy"});
  REQUIRE_FALSE(r.cmd);
  REQUIRE(r.error == "unknown command: deploy");
}

TEST_CASE("defaults") {
  auto r = parse({"prsync", "sync"});
  auto &c = sync_cfg(r);
  REQUIRE(c.branch == "prsync/patch");
  REQUIRE(c.remote == "origin");
  REQUIRE_FALSE(c.base);
  REQUIRE_FALSE(c.author);
  REQUIRE(c.committer.email ==
          "41898282+github-actions[bot]@users.noreply.github.com");
  REQUIRE(c.branch_suffix == SuffixStrategy::None);
  REQUIRE_FALSE(c.delete_branch);
  REQUIRE(c.maintainer_can_modify);
  REQUIRE(c.api_url == "https://api.github.com");
  REQUIRE(c.add_paths.empty());
}

TEST_CASE("flags in both spellings") {
  auto r = parse({"prsync", "sync", "--branch", "bot/deps", "--base=main",
                  "--add-paths", "src, docs/*.md", "--labels=a,b",
                  "--delete-branch", "--draft=false", "--milestone", "4",
                  "--author", "Jane <jane@example.com>", "-v",
                  "--branch-suffix=short-commit-hash"});
  auto &c = sync_cfg(r);
  REQUIRE(c.branch == "bot/deps");
  REQUIRE(c.base == std::optional<std::string>("main"));
  REQUIRE(c.add_paths == std::vector<std::string>{"src", "docs/*.md"});
  REQUIRE(c.labels == std::vector<std::string>{"a", "b"});
  REQUIRE(c.delete_branch);
  REQUIRE_FALSE(c.draft);
  REQUIRE(c.milestone == 4);
  REQUIRE(c.author->name == "Jane");
  REQUIRE(c.author->email == "jane@example.com");
  REQUIRE(c.verbose);
  REQUIRE(c.branch_suffix == SuffixStrategy::ShortCommitHash);
}

TEST_CASE("action inputs from the environment") {
  auto r = parse({"prsync", "sync", "--title", "from flag"},
                 {{"INPUT_TITLE", "from env"},
                  {"INPUT_BRANCH", "env/branch"},
                  {"INPUT_DELETE_BRANCH", "true"},
                  {"INPUT_TEAM-REVIEWERS", "acme/core\nacme/docs"},
                  {"INPUT_BASE", "   "},
                  {"GITHUB_TOKEN", "ghs_x"},
                  {"GITHUB_REPOSITORY", "acme/widgets"},
                  {"GITHUB_WORKSPACE", "/work/space"}});
  auto &c = sync_cfg(r);
  REQUIRE(c.title == "from flag");
  REQUIRE(c.branch == "env/branch");
  REQUIRE(c.delete_branch);
  REQUIRE(c.team_reviewers ==
          std::vector<std::string>{"acme/core", "acme/docs"});
  REQUIRE_FALSE(c.base);
  REQUIRE(c.token == "ghs_x");
  REQUIRE(c.repository == "acme/widgets");
  REQUIRE(c.path == fs::path("/work/space"));
}

TEST_CASE("relative path resolves against the workspace") {
  auto r = parse({"prsync", "sync", "--path", "sub/repo"},
                 {{"GITHUB_WORKSPACE", "/ws"}});
  REQUIRE(sync_cfg(r).path == fs::path("/ws/sub/repo"));

  auto abs = parse({"prsync", "sync", "--path", "/elsewhere"},
                   {{"GITHUB_WORKSPACE", "/ws"}});
  REQUIRE(sync_cfg(abs).path == fs::path("/elsewhere"));
}

TEST_CASE("body from a file") {
  auto d = mkd("cli_body");
  put(d / "body.md", "line one\nline two\n");
  auto r = parse({"prsync", "sync", "--body-path", (d / "body.md").string()});
  REQUIRE(sync_cfg(r).body == "line one\nline two\n");

  auto missing =
      parse({"prsync", "sync", "--body-path", (d / "nope.md").string()});
  REQUIRE_FALSE(missing.cmd);
  REQUIRE(missing.error.find("body-path") != std::string::npos);
}

TEST_CASE("invalid input is reported") {
  auto err = [](Argv a) {
    auto r = parse(std::move(a));
    REQUIRE_FALSE(r.cmd);
    return r.error;
  };
  REQUIRE(err({"prsync", "sync", "--draft=maybe"}).find("draft") !=
          std::string::npos);
  REQUIRE(err({"prsync", "sync", "--milestone", "x"}).find("milestone") !=
          std::string::npos);
  REQUIRE(err({"prsync", "sync", "--milestone", "2147483648"}) ==
          "invalid configuration for 'milestone': must be at most 2147483647");
  REQUIRE(err({"prsync", "sync", "--http-backoff-ms=99999999999"}).find(
              "at most") != std::string::npos);
  REQUIRE(err({"prsync", "sync", "--http-retries", "0"}).find(
              "http-retries") != std::string::npos);
  REQUIRE(err({"prsync", "sync", "--committer", "nobody"}).find(
              "committer") != std::string::npos);
  REQUIRE(err({"prsync", "sync", "--branch-suffix", "uuid"}).find(
              "branch-suffix") != std::string::npos);
  REQUIRE(err({"prsync", "sync", "--branch="}).find("branch") !=
          std::string::npos);
  REQUIRE(err({"prsync", "sync", "--frobnicate"}) ==
          "sync: unknown flag --frobnicate");
  REQUIRE(err({"prsync", "sync", "--title"}) ==
          "sync: --title requires a value");
  REQUIRE(err({"prsync", "sync", "stray"}) ==
          "sync: unexpected argument 'stray'");
}

TEST_CASE("list splitting") {
  REQUIRE(split_list("") == std::vector<std::string>{});
  REQUIRE(split_list(" a ,, b\n\nc ") ==
          std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("pull request operation") {
  REQUIRE(pull_request_operation(SyncAction::Closed, false, true) == "closed");
  REQUIRE(pull_request_operation(SyncAction::Created, true, false) ==
          "created");
  REQUIRE(pull_request_operation(SyncAction::Updated, false, true) ==
          "updated");
  REQUIRE(pull_request_operation(SyncAction::Created, false, true) ==
          "updated");
  REQUIRE(pull_request_operation(SyncAction::NotUpdated, false, true) ==
          "none");
  REQUIRE(pull_request_operation(SyncAction::Updated, false, false) == "none");
}

TEST_CASE("outputs without an output file") {
  RunOutputs o;
  o.number = 12;
  o.url = "https://example.com/pr/12";
  o.operation = "created";
  o.branch = "prsync/patch";
  std::ostringstream ss;
  write_outputs(o, std::nullopt, ss);
  auto s = ss.str();
  REQUIRE(s.find("pull-request-number=12\n") != std::string::npos);
  REQUIRE(s.find("pull-request-operation=created\n") != std::string::npos);
  REQUIRE(s.find("pull-request-commits-verified=false\n") !=
          std::string::npos);
}

TEST_CASE("outputs appended as delimited blocks") {
  auto d = mkd("cli_outputs");
  auto file = d / "github_output";
  put(file, "existing=1\n");

  RunOutputs o;
  o.operation = "updated";
  o.head_sha = "abc123";
  std::ostringstream unused;
  write_outputs(o, file, unused);
  REQUIRE(unused.str().empty());

  auto text = slurp(file);
  REQUIRE(text.rfind("existing=1\n", 0) == 0);
  std::istringstream in(text.substr(11));
  std::map<std::string, std::string> values;
  std::string header;
  while (std::getline(in, header)) {
    auto mark = header.find("<<");
    REQUIRE(mark != std::string::npos);
    auto key = header.substr(0, mark);
    auto delim = header.substr(mark + 2);
    REQUIRE(delim.rfind("ghadelimiter_", 0) == 0);
    std::string value, line;
    bool first = true;
    while (std::getline(in, line) && line != delim) {
      value += (first ? "" : "\n") + line;
      first = false;
    }
    REQUIRE(line == delim);
    values[key] = value;
  }
  REQUIRE(values.size() == 6);
  REQUIRE(values["pull-request-operation"] == "updated");
  REQUIRE(values["pull-request-head-sha"] == "abc123");
  REQUIRE(values["pull-request-number"].empty());
}
