#pragma once
#include <prsync/types.hpp>
#include <prsync/vcs.hpp>

#include <optional>
#include <string>

namespace prsync {

struct RemoteDetail {
  std::string protocol;   // "https", "ssh" or "git"
  std::string host;
  std::string repository; // owner/name, no ".git"
};

// https://[user@]host/owner/repo[.git], git@host:owner/repo[.git],
// ssh://[user@]host/owner/repo[.git], git://host/owner/repo[.git]
std::optional<RemoteDetail> parse_remote_url(const std::string &url);

// URL of `repository` on the origin's host, spelled in the origin's protocol
std::string fork_url(const RemoteDetail &origin, const std::string &repository);

// git config key carrying an extra HTTP header for the origin's server
std::string extraheader_key(const std::string &origin_url);

// "AUTHORIZATION: basic <base64(x-access-token:token)>"
std::string basic_auth_header(const std::string &token);

std::string base64_encode(const std::string &in);

struct PushReceipt {
  std::string remote;
  std::string branch;
  std::string local_head;
  std::optional<std::string> remote_tip; // as reported by the remote afterwards
  bool forced = false;

  bool verified() const { return remote_tip && *remote_tip == local_head; }
};

class RemoteSubmitter {
public:
  explicit RemoteSubmitter(VersionControlClient &vcs) : vcs_(vcs) {}

  // Adds or re-points `fork_remote` at `repository` on the origin's host.
  // Returns the remote name to push to.
  std::string configure_fork(const std::string &origin_remote,
                             const std::string &repository,
                             const std::string &fork_remote = "fork");

  // Plain push, or force-with-lease against the expected remote tip when the
  // branch history was rewritten. ConcurrentUpdateRejected on rejection.
  PushReceipt push(const SyncOutcome &outcome, const std::string &remote);

  // Deletes the remote branch unless it moved away from expected_tip.
  void remove_branch(const std::string &remote, const std::string &branch,
                     const std::optional<std::string> &expected_tip);

  std::optional<std::string> verified_tip(const std::string &remote,
                                          const std::string &branch);

private:
  VersionControlClient &vcs_;
};

} // namespace prsync
