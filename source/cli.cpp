#include <prsync/cli.hpp>
#include <prsync/errors.hpp>
#include <prsync/process.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string_view>

namespace prsync {

static const std::vector<std::string_view> kValueFlags = {
    "path",          "add-paths",        "commit-message", "committer",
    "author",        "branch",           "branch-suffix",  "base",
    "push-to-fork",  "remote",           "title",          "body",
    "body-path",     "labels",           "assignees",      "reviewers",
    "team-reviewers", "milestone",       "token",          "repository",
    "api-url",       "http-retries",     "http-backoff-ms", "log-file",
    "log-rotate-max", "log-rotate-files"};

static const std::vector<std::string_view> kBoolFlags = {
    "signoff", "sign-commits", "delete-branch", "draft",
    "maintainer-can-modify", "verbose"};

static constexpr long long kIntMax = std::numeric_limits<int>::max();

static bool known(const std::vector<std::string_view> &v, std::string_view n) {
  return std::find(v.begin(), v.end(), n) != v.end();
}

std::optional<std::string> getenv_lookup(const std::string &name) {
  const char *v = std::getenv(name.c_str());
  if (!v)
    return std::nullopt;
  return std::string(v);
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  std::string cur;
  auto flush = [&] {
    auto t = trim(cur);
    if (!t.empty())
      items.push_back(t);
    cur.clear();
  };
  for (char c : value) {
    if (c == ',' || c == '\n')
      flush();
    else
      cur += c;
  }
  flush();
  return items;
}

static bool parse_bool(const std::string &name, const std::string &v) {
  std::string s = trim(v);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "true" || s == "1" || s == "yes")
    return true;
  if (s == "false" || s == "0" || s == "no" || s.empty())
    return false;
  throw ConfigurationError(name, "expected true or false, got '" + v + "'");
}

static long long
parse_number(const std::string &name, const std::string &v, long long min,
             long long max = std::numeric_limits<long long>::max()) {
  long long n = 0;
  try {
    size_t used = 0;
    n = std::stoll(trim(v), &used);
    if (used != trim(v).size())
      throw std::invalid_argument(v);
  } catch (const std::logic_error &) {
    throw ConfigurationError(name, "expected a number, got '" + v + "'");
  }
  if (n < min)
    throw ConfigurationError(name, "must be at least " + std::to_string(min));
  if (n > max)
    throw ConfigurationError(name, "must be at most " + std::to_string(max));
  return n;
}

static std::string env_name(std::string name, bool underscores) {
  for (auto &c : name) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (underscores && c == '-')
      c = '_';
  }
  return "INPUT_" + name;
}

static std::string read_file(const std::string &name,
                             const std::filesystem::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    throw ConfigurationError(name, "cannot read " + p.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static RunConfig build_config(const std::map<std::string, std::string> &flags,
                              const EnvLookup &env) {
  auto get = [&](const std::string &name) -> std::optional<std::string> {
    auto it = flags.find(name);
    if (it != flags.end())
      return it->second;
    for (bool underscores : {false, true}) {
      auto v = env(env_name(name, underscores));
      if (v && !trim(*v).empty())
        return *v;
    }
    return std::nullopt;
  };
  auto get_env = [&](const char *name) -> std::optional<std::string> {
    auto v = env(name);
    if (v && !v->empty())
      return v;
    return std::nullopt;
  };

  RunConfig c;
  auto workspace = get_env("GITHUB_WORKSPACE");
  std::filesystem::path path = get("path").value_or(".");
  if (workspace && path.is_relative())
    path = std::filesystem::path(*workspace) / path;
  c.path = path.lexically_normal();
  if (!c.path.has_filename() && c.path.has_relative_path())
    c.path = c.path.parent_path();

  if (auto v = get("add-paths"))
    c.add_paths = split_list(*v);
  if (auto v = get("commit-message"))
    c.commit_message = *v;
  c.committer = parse_identity(get("committer").value_or(kDefaultBot),
                               "committer");
  if (auto v = get("author"))
    c.author = parse_identity(*v, "author");
  if (auto v = get("signoff"))
    c.signoff = parse_bool("signoff", *v);
  if (auto v = get("sign-commits"))
    c.sign_commits = parse_bool("sign-commits", *v);

  if (auto v = get("branch"))
    c.branch = trim(*v);
  if (c.branch.empty())
    throw ConfigurationError("branch", "cannot be empty");
  if (auto v = get("branch-suffix"))
    c.branch_suffix = parse_suffix_strategy(trim(*v));
  if (auto v = get("base"))
    c.base = trim(*v);
  if (auto v = get("delete-branch"))
    c.delete_branch = parse_bool("delete-branch", *v);
  if (auto v = get("push-to-fork"))
    c.push_to_fork = trim(*v);
  if (auto v = get("remote"))
    c.remote = trim(*v);

  if (auto v = get("title"))
    c.title = *v;
  if (auto v = get("body"))
    c.body = *v;
  if (auto v = get("body-path"))
    c.body = read_file("body-path", trim(*v));
  if (auto v = get("labels"))
    c.labels = split_list(*v);
  if (auto v = get("assignees"))
    c.assignees = split_list(*v);
  if (auto v = get("reviewers"))
    c.reviewers = split_list(*v);
  if (auto v = get("team-reviewers"))
    c.team_reviewers = split_list(*v);
  if (auto v = get("milestone"))
    c.milestone = static_cast<int>(parse_number("milestone", *v, 0, kIntMax));
  if (auto v = get("draft"))
    c.draft = parse_bool("draft", *v);
  if (auto v = get("maintainer-can-modify"))
    c.maintainer_can_modify = parse_bool("maintainer-can-modify", *v);

  if (auto v = get("token"))
    c.token = trim(*v);
  else if (auto t = get_env("GITHUB_TOKEN"))
    c.token = *t;
  if (auto v = get("repository"))
    c.repository = trim(*v);
  else if (auto r = get_env("GITHUB_REPOSITORY"))
    c.repository = *r;
  if (auto v = get("api-url"))
    c.api_url = trim(*v);
  else if (auto a = get_env("GITHUB_API_URL"))
    c.api_url = *a;
  if (auto v = get("http-retries"))
    c.http_retries = static_cast<int>(parse_number("http-retries", *v, 1, kIntMax));
  if (auto v = get("http-backoff-ms"))
    c.http_backoff_ms =
        static_cast<int>(parse_number("http-backoff-ms", *v, 0, kIntMax));

  if (auto v = get("verbose"))
    c.verbose = parse_bool("verbose", *v);
  if (auto v = get("log-file"))
    c.log_file = std::filesystem::path(trim(*v));
  if (auto v = get("log-rotate-max"))
    c.log_rotate_max =
        static_cast<std::size_t>(parse_number("log-rotate-max", *v, 1));
  if (auto v = get("log-rotate-files"))
    c.log_rotate_files =
        static_cast<std::size_t>(parse_number("log-rotate-files", *v, 1));
  return c;
}

ParseResult parse_cli(int argc, char **argv, const EnvLookup &env) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }
  if (cmd != "sync") {
    r.error = "unknown command: " + cmd;
    return r;
  }

  std::map<std::string, std::string> flags;
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    if (a == "-v") {
      flags["verbose"] = "true";
      continue;
    }
    if (a.rfind("--", 0) != 0) {
      r.error = "sync: unexpected argument '" + a + "'";
      return r;
    }
    std::string name = a.substr(2);
    std::optional<std::string> value;
    auto eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }

    if (known(kBoolFlags, name)) {
      flags[name] = value.value_or("true");
    } else if (known(kValueFlags, name)) {
      if (!value) {
        if (i + 1 >= argc) {
          r.error = "sync: --" + name + " requires a value";
          return r;
        }
        value = argv[++i];
      }
      flags[name] = *value;
    } else {
      r.error = "sync: unknown flag --" + name;
      return r;
    }
  }

  try {
    r.cmd = CmdSync{build_config(flags, env)};
  } catch (const ConfigurationError &e) {
    r.error = e.what();
  }
  return r;
}

} // namespace prsync
