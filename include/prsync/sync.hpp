#pragma once
#include <prsync/types.hpp>
#include <prsync/vcs.hpp>

#include <exception>
#include <optional>
#include <string>

namespace prsync {

struct SyncRequest {
  std::string branch;              // already suffixed
  std::optional<std::string> base; // nullopt: the current checkout
  std::string remote = "origin";   // remote holding the branch
  std::string base_remote = "origin";
  bool delete_on_empty = false;
};

// Owns the checkout while the synchronizer moves HEAD around. The caller's
// pending edits are parked as a commit on an ephemeral branch plus a stash;
// release() or rollback() puts them back on the starting checkout. The
// destructor rolls back unless one of them already ran.
class WorkspaceLease {
public:
  WorkspaceLease(VersionControlClient &vcs, CheckoutState origin);
  ~WorkspaceLease();

  WorkspaceLease(const WorkspaceLease &) = delete;
  WorkspaceLease &operator=(const WorkspaceLease &) = delete;

  // Commits the change set on `ephemeral` (created at the origin commit) and
  // stashes every edit the commit leaves behind. Returns the change commit.
  const std::string &park(const ChangeSet &cs, const std::string &ephemeral);

  // previous: local tip before this run, nullopt when the ref did not exist
  void track_target(const std::string &name,
                    std::optional<std::string> previous);
  // the tracked target ref goes back to its previous value on release()
  void discard_target();

  const CheckoutState &origin() const { return origin_; }
  const std::string &change_commit() const { return change_commit_; }

  // success path: target ref kept; throws the first restore failure
  void release();
  // failure path: target ref restored too; failures are only logged
  void rollback();

private:
  void restore(bool keep_target, std::exception_ptr &first);

  VersionControlClient &vcs_;
  CheckoutState origin_;
  std::string ephemeral_;
  std::string change_commit_;
  bool stashed_{false};
  bool secured_{false}; // every pending edit is in the commit or the stash
  std::optional<std::string> target_;
  std::optional<std::string> target_previous_;
  bool discard_{false};
  bool done_{false};
};

// Decides and performs create / update / no-op / close for one branch.
class BranchSynchronizer {
public:
  explicit BranchSynchronizer(VersionControlClient &vcs) : vcs_(vcs) {}

  // Local branch, then remote tracking branch, then a fetch of the remote
  // branch, then any commit-ish. InvalidBaseReference when all fail.
  BaseRef resolve_base(const std::optional<std::string> &base,
                       const std::string &remote,
                       const CheckoutState &current);

  // Local and remote presence; a remote branch is fetched into
  // refs/remotes/<remote>/<name>.
  BranchRef resolve(const std::string &name, const std::string &remote);

  SyncOutcome synchronize(const SyncRequest &req, const ChangeSet &cs);

private:
  SyncOutcome on_empty(const SyncRequest &req, const BaseRef &base,
                       const BranchRef &branch);
  SyncOutcome create(const SyncRequest &req, const BaseRef &base,
                     const ChangeSet &cs, const CheckoutState &current);
  SyncOutcome update(const SyncRequest &req, const BaseRef &base,
                     const BranchRef &branch, const ChangeSet &cs,
                     const CheckoutState &current);
  bool differs_from_base(const std::string &head, const BaseRef &base);
  std::string ephemeral_name(const std::string &branch,
                             const std::string &head) const;

  VersionControlClient &vcs_;
  std::string step_;
};

} // namespace prsync
