#include <prsync/errors.hpp>
#include <prsync/git.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace prsync {

static const char *scope_flag(ConfigScope s) {
  return s == ConfigScope::Global ? "--global" : "--local";
}

static std::vector<std::string> split_lines(const std::string &s) {
  std::vector<std::string> v;
  std::istringstream ss(s);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      v.push_back(line);
  }
  return v;
}

static void append_pathspecs(std::vector<std::string> &args,
                             const std::vector<std::string> &pathspecs) {
  if (pathspecs.empty())
    return;
  args.push_back("--");
  args.insert(args.end(), pathspecs.begin(), pathspecs.end());
}

GitClient::GitClient(fs::path root) : root_(std::move(root)) {
  if (const char *v = std::getenv("PRSYNC_SHOW_GIT_OUTPUT"))
    show_output_ = std::string(v) == "true" || std::string(v) == "1";
}

GitClient GitClient::open(const fs::path &path) {
  fs::path abs = fs::absolute(path);
  auto r = run_command({"git", "rev-parse", "--show-toplevel"}, abs,
                       {{"LC_ALL", "C"}});
  if (r.exit_code != 0)
    throw VersionControlFailure("git rev-parse --show-toplevel (" +
                                    abs.string() + ")",
                                r.exit_code, trim(r.err));
  return GitClient(fs::path(trim(r.out)));
}

CmdResult GitClient::exec(const std::vector<std::string> &args,
                          const Env &env) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  Env full{{"LC_ALL", "C"},
           {"GIT_TERMINAL_PROMPT", "0"},
           {"GIT_EDITOR", "true"}};
  for (auto &[k, v] : env)
    full[k] = v;

  spdlog::debug("[git] {}", join_args(args));
  auto r = run_command(argv, root_, full);
  if (show_output_) {
    if (!r.out.empty())
      spdlog::info("[git] {}", trim(r.out));
    if (!r.err.empty())
      spdlog::info("[git] {}", trim(r.err));
  }
  return r;
}

std::string GitClient::run(const std::vector<std::string> &args,
                           const Env &env) const {
  auto r = exec(args, env);
  if (r.exit_code != 0) {
    std::string output = trim(r.err);
    if (output.empty())
      output = trim(r.out);
    throw VersionControlFailure("git " + join_args(args), r.exit_code, output);
  }
  return r.out;
}

std::string GitClient::version() { return trim(run({"--version"})); }

CheckoutState GitClient::current_ref() {
  CheckoutState st;
  auto r = exec({"symbolic-ref", "-q", "--short", "HEAD"});
  if (r.exit_code == 0)
    st.branch = trim(r.out);
  else if (r.exit_code != 1)
    throw VersionControlFailure("git symbolic-ref -q --short HEAD",
                                r.exit_code, trim(r.err));
  st.commit = trim(run({"rev-parse", "HEAD"}));
  return st;
}

std::optional<std::string> GitClient::rev_parse(const std::string &rev) {
  auto r = exec({"rev-parse", "-q", "--verify", rev + "^{commit}"});
  if (r.exit_code != 0)
    return std::nullopt;
  return trim(r.out);
}

std::string GitClient::short_hash(const std::string &rev) {
  return trim(run({"rev-parse", "--short", rev}));
}

bool GitClient::branch_exists(const std::string &name) {
  auto r = exec({"rev-parse", "-q", "--verify", "refs/heads/" + name});
  return r.exit_code == 0;
}

std::optional<std::string> GitClient::remote_tip(const std::string &remote,
                                                 const std::string &name) {
  auto out = run({"ls-remote", "--heads", remote, "refs/heads/" + name});
  for (auto &line : split_lines(out)) {
    auto tab = line.find('\t');
    if (tab == std::string::npos)
      continue;
    if (line.substr(tab + 1) == "refs/heads/" + name)
      return line.substr(0, tab);
  }
  return std::nullopt;
}

void GitClient::fetch(const std::string &remote,
                      const std::vector<std::string> &refspecs) {
  std::vector<std::string> args{"fetch", "-q", "--no-tags", remote};
  args.insert(args.end(), refspecs.begin(), refspecs.end());
  run(args);
}

void GitClient::checkout(const std::string &ref) {
  run({"checkout", "-q", ref});
}

void GitClient::checkout_detached(const std::string &commit) {
  run({"checkout", "-q", "--detach", commit});
}

void GitClient::force_checkout(const CheckoutState &state) {
  if (state.branch)
    run({"checkout", "-q", "-f", *state.branch});
  else
    run({"checkout", "-q", "-f", "--detach", state.commit});
}

void GitClient::create_branch(const std::string &name,
                              const std::string &from) {
  run({"checkout", "-q", "-B", name, from});
}

void GitClient::delete_branch(const std::string &name) {
  run({"branch", "-q", "-D", name});
}

void GitClient::set_branch(const std::string &name,
                           const std::optional<std::string> &commit) {
  if (commit)
    run({"update-ref", "refs/heads/" + name, *commit});
  else
    run({"update-ref", "-d", "refs/heads/" + name});
}

bool GitClient::diff(const std::vector<std::string> &pathspecs) {
  return !changed_paths(pathspecs).empty();
}

std::vector<std::string>
GitClient::changed_paths(const std::vector<std::string> &pathspecs) {
  std::vector<std::string> args{"status", "--porcelain=v1", "-z",
                                "--untracked-files=all"};
  append_pathspecs(args, pathspecs);
  auto out = run(args);

  // entries are "XY path\0", renames and copies carry "orig\0" afterwards
  std::vector<std::string> paths;
  size_t pos = 0;
  while (pos < out.size()) {
    auto end = out.find('\0', pos);
    if (end == std::string::npos)
      end = out.size();
    std::string entry = out.substr(pos, end - pos);
    pos = end + 1;
    if (entry.size() < 4)
      continue;
    char x = entry[0];
    paths.push_back(entry.substr(3));
    if (x == 'R' || x == 'C') {
      auto skip = out.find('\0', pos);
      pos = skip == std::string::npos ? out.size() : skip + 1;
    }
  }
  return paths;
}

std::string GitClient::stage_and_commit(
    const std::vector<std::string> &pathspecs, const std::string &message,
    const Identity &author, const Identity &committer, bool signoff,
    bool sign) {
  std::vector<std::string> add{"add", "-A"};
  append_pathspecs(add, pathspecs);
  run(add);

  std::vector<std::string> commit{"commit", "-q", "-m", message};
  if (signoff)
    commit.push_back("--signoff");
  if (sign)
    commit.push_back("-S");
  // only the given paths: other staged edits stay staged and out of the commit
  append_pathspecs(commit, pathspecs);

  run(commit, {{"GIT_AUTHOR_NAME", author.name},
               {"GIT_AUTHOR_EMAIL", author.email},
               {"GIT_COMMITTER_NAME", committer.name},
               {"GIT_COMMITTER_EMAIL", committer.email}});
  return trim(run({"rev-parse", "HEAD"}));
}

void GitClient::apply_uncommitted(const std::string &commit) {
  run({"cherry-pick", "--no-commit", commit});
  run({"reset", "-q"});
}

bool GitClient::path_exists(const std::string &git_path) const {
  auto r = exec({"rev-parse", "--git-path", git_path});
  if (r.exit_code != 0)
    return false;
  fs::path p(trim(r.out));
  if (p.is_relative())
    p = root_ / p;
  std::error_code ec;
  return fs::exists(p, ec);
}

std::vector<std::string> GitClient::unmerged_paths() const {
  auto r = exec({"diff", "--name-only", "--diff-filter=U"});
  if (r.exit_code != 0)
    return {};
  return split_lines(r.out);
}

InProgress GitClient::in_progress_operation() {
  if (path_exists("rebase-merge") || path_exists("rebase-apply"))
    return InProgress::Rebase;
  if (path_exists("CHERRY_PICK_HEAD"))
    return InProgress::CherryPick;
  return InProgress::None;
}

MergeResult GitClient::rebase(const std::string &onto) {
  std::vector<std::string> args{"rebase", "-q", "--strategy-option=theirs",
                                onto};
  auto r = exec(args);
  if (r.exit_code == 0)
    return MergeResult::Success;
  if (in_progress_operation() == InProgress::Rebase ||
      !unmerged_paths().empty()) {
    spdlog::debug("[git] rebase onto {} stopped on conflict", onto);
    return MergeResult::Conflict;
  }
  throw VersionControlFailure("git " + join_args(args), r.exit_code,
                              trim(r.err.empty() ? r.out : r.err));
}

void GitClient::abort_rebase() { run({"rebase", "--abort"}); }

MergeResult GitClient::cherry_pick(const std::string &commit) {
  std::vector<std::string> args{"cherry-pick", "--keep-redundant-commits",
                                "--strategy-option=theirs", commit};
  auto r = exec(args);
  if (r.exit_code == 0)
    return MergeResult::Success;
  if (in_progress_operation() == InProgress::CherryPick ||
      !unmerged_paths().empty()) {
    spdlog::debug("[git] cherry-pick {} stopped on conflict", commit);
    return MergeResult::Conflict;
  }
  throw VersionControlFailure("git " + join_args(args), r.exit_code,
                              trim(r.err.empty() ? r.out : r.err));
}

void GitClient::abort_cherry_pick() { run({"cherry-pick", "--abort"}); }

std::string GitClient::tree_hash(const std::string &ref) {
  return trim(run({"rev-parse", ref + "^{tree}"}));
}

bool GitClient::is_ancestor(const std::string &ancestor,
                            const std::string &descendant) {
  std::vector<std::string> args{"merge-base", "--is-ancestor", ancestor,
                                descendant};
  auto r = exec(args);
  if (r.exit_code == 0)
    return true;
  if (r.exit_code == 1)
    return false;
  throw VersionControlFailure("git " + join_args(args), r.exit_code,
                              trim(r.err));
}

int GitClient::count_commits(const std::string &from, const std::string &to) {
  auto out = trim(run({"rev-list", "--count", from + ".." + to}));
  try {
    return std::stoi(out);
  } catch (const std::exception &) {
    throw VersionControlFailure("git rev-list --count " + from + ".." + to, 0,
                                "unexpected output: " + out);
  }
}

bool GitClient::stash_push(const std::string &message) {
  auto out = run({"stash", "push", "--include-untracked", "-m", message});
  return out.find("No local changes to save") == std::string::npos;
}

void GitClient::stash_pop() {
  auto r = exec({"stash", "pop", "-q", "--index"});
  if (r.exit_code == 0)
    return;
  spdlog::debug("[git] stash pop --index failed, popping without index: {}",
                trim(r.err));
  run({"stash", "pop", "-q"});
}

PushResult GitClient::push(const PushRequest &req) {
  std::vector<std::string> args{"push", "--porcelain"};
  if (req.lease)
    args.push_back("--force-with-lease=" + req.remote_ref + ":" + *req.lease);
  args.push_back(req.remote);
  args.push_back(req.local_ref + ":" + req.remote_ref);

  auto r = exec(args);
  PushResult res;
  res.output = trim(r.out + r.err);
  if (r.exit_code == 0) {
    res.accepted = true;
    return res;
  }
  for (const char *marker :
       {"[rejected]", "stale info", "non-fast-forward", "fetch first"}) {
    if (res.output.find(marker) != std::string::npos) {
      res.rejected = true;
      return res;
    }
  }
  throw VersionControlFailure("git " + join_args(args), r.exit_code,
                              res.output);
}

PushResult
GitClient::delete_remote_branch(const std::string &remote,
                                const std::string &branch,
                                const std::optional<std::string> &lease) {
  return push(PushRequest{remote, "", "refs/heads/" + branch, lease});
}

std::vector<std::string> GitClient::config_get_all(const std::string &key,
                                                   ConfigScope scope) {
  std::vector<std::string> args{"config", scope_flag(scope), "-z",
                                "--get-all", key};
  auto r = exec(args);
  if (r.exit_code == 1)
    return {};
  if (r.exit_code != 0)
    throw VersionControlFailure("git " + join_args(args), r.exit_code,
                                trim(r.err));
  std::vector<std::string> values;
  size_t pos = 0;
  while (pos < r.out.size()) {
    auto end = r.out.find('\0', pos);
    if (end == std::string::npos)
      end = r.out.size();
    values.push_back(r.out.substr(pos, end - pos));
    pos = end + 1;
  }
  return values;
}

void GitClient::config_set(const std::string &key, const std::string &value,
                           ConfigScope scope) {
  run({"config", scope_flag(scope), "--replace-all", key, value});
}

void GitClient::config_add(const std::string &key, const std::string &value,
                           ConfigScope scope) {
  run({"config", scope_flag(scope), "--add", key, value});
}

void GitClient::config_unset_all(const std::string &key, ConfigScope scope) {
  std::vector<std::string> args{"config", scope_flag(scope), "--unset-all",
                                key};
  auto r = exec(args);
  // 5: the key was not set
  if (r.exit_code != 0 && r.exit_code != 5)
    throw VersionControlFailure("git " + join_args(args), r.exit_code,
                                trim(r.err));
}

std::optional<std::string> GitClient::remote_url(const std::string &remote) {
  auto r = exec({"remote", "get-url", remote});
  if (r.exit_code != 0)
    return std::nullopt;
  return trim(r.out);
}

void GitClient::set_remote(const std::string &remote, const std::string &url) {
  if (remote_url(remote))
    run({"remote", "set-url", remote, url});
  else
    run({"remote", "add", remote, url});
}

} // namespace prsync
