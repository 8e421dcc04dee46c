#include <prsync/errors.hpp>
#include <prsync/remote.hpp>

#include <spdlog/spdlog.h>

#include <regex>

namespace prsync {

static std::string strip_git_suffix(std::string s) {
  while (!s.empty() && s.back() == '/')
    s.pop_back();
  if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0)
    s.erase(s.size() - 4);
  return s;
}

std::optional<RemoteDetail> parse_remote_url(const std::string &url) {
  static const std::regex https_re(R"(^https?://(?:[^@/]+@)?([^/]+)/(.+)$)");
  static const std::regex scp_re(R"(^(?:[^@/]+@)?([^:/]+):(?!//)(.+)$)");
  static const std::regex ssh_re(R"(^ssh://(?:[^@/]+@)?([^/]+)/(.+)$)");
  static const std::regex git_re(R"(^git://([^/]+)/(.+)$)");

  std::smatch m;
  RemoteDetail d;
  if (std::regex_match(url, m, https_re))
    d.protocol = "https";
  else if (std::regex_match(url, m, ssh_re))
    d.protocol = "ssh";
  else if (std::regex_match(url, m, git_re))
    d.protocol = "git";
  else if (std::regex_match(url, m, scp_re))
    d.protocol = "ssh";
  else
    return std::nullopt;

  d.host = m[1].str();
  d.repository = strip_git_suffix(m[2].str());
  if (d.repository.find('/') == std::string::npos)
    return std::nullopt;
  return d;
}

std::string fork_url(const RemoteDetail &origin,
                     const std::string &repository) {
  if (origin.protocol == "https")
    return "https://" + origin.host + "/" + repository;
  if (origin.protocol == "git")
    return "git://" + origin.host + "/" + repository + ".git";
  return "git@" + origin.host + ":" + repository + ".git";
}

std::string extraheader_key(const std::string &origin_url) {
  auto d = parse_remote_url(origin_url);
  if (d && d->protocol == "https")
    return "http.https://" + d->host + "/.extraheader";
  return "http." + origin_url + ".extraheader";
}

std::string base64_encode(const std::string &in) {
  static const char tbl[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((in.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                 (static_cast<unsigned char>(in[i + 1]) << 8) |
                 static_cast<unsigned char>(in[i + 2]);
    out += tbl[(v >> 18) & 63];
    out += tbl[(v >> 12) & 63];
    out += tbl[(v >> 6) & 63];
    out += tbl[v & 63];
  }
  if (i + 1 == in.size()) {
    unsigned v = static_cast<unsigned char>(in[i]) << 16;
    out += tbl[(v >> 18) & 63];
    out += tbl[(v >> 12) & 63];
    out += "==";
  } else if (i + 2 == in.size()) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                 (static_cast<unsigned char>(in[i + 1]) << 8);
    out += tbl[(v >> 18) & 63];
    out += tbl[(v >> 12) & 63];
    out += tbl[(v >> 6) & 63];
    out += '=';
  }
  return out;
}

std::string basic_auth_header(const std::string &token) {
  return "AUTHORIZATION: basic " + base64_encode("x-access-token:" + token);
}

std::string RemoteSubmitter::configure_fork(const std::string &origin_remote,
                                            const std::string &repository,
                                            const std::string &fork_remote) {
  auto origin = vcs_.remote_url(origin_remote);
  if (!origin)
    throw ConfigurationError("remote", "remote '" + origin_remote +
                                           "' is not configured");
  auto detail = parse_remote_url(*origin);
  if (!detail)
    throw ConfigurationError("push-to-fork",
                             "cannot derive a fork URL from '" + *origin + "'");
  if (repository.find('/') == std::string::npos)
    throw ConfigurationError("push-to-fork",
                             "expected owner/repository, got '" + repository +
                                 "'");

  auto url = fork_url(*detail, repository);
  vcs_.set_remote(fork_remote, url);
  spdlog::info("[push] remote {} -> {}", fork_remote, url);
  return fork_remote;
}

PushReceipt RemoteSubmitter::push(const SyncOutcome &outcome,
                                  const std::string &remote) {
  PushReceipt rc;
  rc.remote = remote;
  rc.branch = outcome.branch;
  rc.local_head = outcome.head;
  rc.forced = outcome.rewritten;

  const std::string ref = "refs/heads/" + outcome.branch;
  PushRequest req{remote, ref, ref, std::nullopt};
  if (outcome.rewritten)
    req.lease = outcome.expected_remote_tip.value_or("");

  spdlog::info("[push] {} {} to {}{}", outcome.branch, outcome.head, remote,
               rc.forced ? " (with lease)" : "");
  auto res = vcs_.push(req);
  if (res.rejected) {
    ConcurrentUpdateRejected e(ref, res.output);
    e.set_step("push");
    throw e;
  }

  rc.remote_tip = verified_tip(remote, outcome.branch);
  if (!rc.verified())
    spdlog::warn("[push] remote reports {} at {}, expected {}", ref,
                 rc.remote_tip.value_or("(absent)"), rc.local_head);
  return rc;
}

void RemoteSubmitter::remove_branch(
    const std::string &remote, const std::string &branch,
    const std::optional<std::string> &expected_tip) {
  if (!expected_tip) {
    spdlog::debug("[push] {} not on {}, nothing to delete", branch, remote);
    return;
  }
  spdlog::info("[push] deleting {} on {}", branch, remote);
  auto res = vcs_.delete_remote_branch(remote, branch, expected_tip);
  if (res.rejected) {
    ConcurrentUpdateRejected e("refs/heads/" + branch, res.output);
    e.set_step("close");
    throw e;
  }
}

std::optional<std::string>
RemoteSubmitter::verified_tip(const std::string &remote,
                              const std::string &branch) {
  return vcs_.remote_tip(remote, branch);
}

} // namespace prsync
