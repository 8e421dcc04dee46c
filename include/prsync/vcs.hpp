#pragma once
#include <prsync/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace prsync {

enum class MergeResult { Success, Conflict };

enum class InProgress { None, Rebase, CherryPick };

enum class ConfigScope { Local, Global };

struct PushRequest {
  std::string remote;
  std::string local_ref;
  std::string remote_ref;
  // --force-with-lease=<remote_ref>:<value>; an empty value requires the
  // remote ref to be absent
  std::optional<std::string> lease;
};

struct PushResult {
  bool accepted = false;
  bool rejected = false; // stale lease or non fast-forward
  std::string output;
};

// Primitive repository operations. Failures of the underlying tool surface as
// VersionControlFailure; conflicts of rebase/cherry-pick are reported through
// MergeResult instead.
class VersionControlClient {
public:
  virtual ~VersionControlClient() = default;

  virtual CheckoutState current_ref() = 0;
  virtual std::optional<std::string> rev_parse(const std::string &rev) = 0;
  virtual std::string short_hash(const std::string &rev) = 0;

  virtual bool branch_exists(const std::string &name) = 0;
  // tip of refs/heads/<name> on the remote, nullopt when absent
  virtual std::optional<std::string> remote_tip(const std::string &remote,
                                                const std::string &name) = 0;
  virtual void fetch(const std::string &remote,
                     const std::vector<std::string> &refspecs) = 0;

  virtual void checkout(const std::string &ref) = 0;
  virtual void checkout_detached(const std::string &commit) = 0;
  virtual void force_checkout(const CheckoutState &state) = 0;
  // checkout -B name from
  virtual void create_branch(const std::string &name,
                             const std::string &from) = 0;
  virtual void delete_branch(const std::string &name) = 0;
  // points refs/heads/<name> at commit (nullopt deletes) without touching
  // the working tree
  virtual void set_branch(const std::string &name,
                          const std::optional<std::string> &commit) = 0;

  virtual bool diff(const std::vector<std::string> &pathspecs) = 0;
  virtual std::vector<std::string>
  changed_paths(const std::vector<std::string> &pathspecs) = 0;
  virtual std::string
  stage_and_commit(const std::vector<std::string> &pathspecs,
                   const std::string &message, const Identity &author,
                   const Identity &committer, bool signoff, bool sign) = 0;
  // applies commit to the working tree and index without committing, then
  // unstages it
  virtual void apply_uncommitted(const std::string &commit) = 0;

  virtual MergeResult rebase(const std::string &onto) = 0;
  virtual void abort_rebase() = 0;
  virtual MergeResult cherry_pick(const std::string &commit) = 0;
  virtual void abort_cherry_pick() = 0;
  virtual InProgress in_progress_operation() = 0;

  virtual std::string tree_hash(const std::string &ref) = 0;
  virtual bool is_ancestor(const std::string &ancestor,
                           const std::string &descendant) = 0;
  virtual int count_commits(const std::string &from, const std::string &to) = 0;

  // true when something was stashed
  virtual bool stash_push(const std::string &message) = 0;
  // restores the stashed index state too when it still applies
  virtual void stash_pop() = 0;

  virtual PushResult push(const PushRequest &req) = 0;
  // push of ":refs/heads/<branch>"; lease as in PushRequest
  virtual PushResult
  delete_remote_branch(const std::string &remote, const std::string &branch,
                       const std::optional<std::string> &lease) = 0;

  virtual std::vector<std::string> config_get_all(const std::string &key,
                                                  ConfigScope scope) = 0;
  virtual void config_set(const std::string &key, const std::string &value,
                          ConfigScope scope) = 0;
  virtual void config_add(const std::string &key, const std::string &value,
                          ConfigScope scope) = 0;
  virtual void config_unset_all(const std::string &key, ConfigScope scope) = 0;

  virtual std::optional<std::string> remote_url(const std::string &remote) = 0;
  virtual void set_remote(const std::string &remote,
                          const std::string &url) = 0;
};

} // namespace prsync
