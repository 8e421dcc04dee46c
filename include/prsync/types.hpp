#pragma once
#include <optional>
#include <string>
#include <vector>

namespace prsync {

struct Identity {
  std::string name;
  std::string email;

  bool complete() const { return !name.empty() && !email.empty(); }
  std::string to_string() const { return name + " <" + email + ">"; }
};

// "Display Name <email@host>"; throws ConfigurationError when the email part
// is missing.
Identity parse_identity(const std::string &value, const std::string &param);

enum class CaptureState { NotComputed, Empty, NonEmpty };

struct ChangeSet {
  std::vector<std::string> include;  // requested pathspecs, empty = all
  std::vector<std::string> matched;  // pathspecs with pending changes
  std::vector<std::string> changed_paths;
  std::string message;
  Identity author;
  Identity committer;
  bool signoff = false;
  bool sign = false;
  CaptureState state = CaptureState::NotComputed;

  bool computed() const { return state != CaptureState::NotComputed; }
  bool empty() const { return state == CaptureState::Empty; }
  bool scoped() const { return !include.empty(); }
};

enum class Presence { Absent, Local, Remote, Both };

struct BranchRef {
  std::string name;
  Presence presence = Presence::Absent;
  std::optional<std::string> local_tip;
  std::optional<std::string> remote_tip;

  bool present() const { return presence != Presence::Absent; }
  // published tip when the remote has the branch, local tip otherwise
  std::optional<std::string> tip() const {
    return remote_tip ? remote_tip : local_tip;
  }
};

struct BaseRef {
  std::optional<std::string> branch; // unset when based on a detached commit
  std::string commit;

  std::string display() const { return branch ? *branch : commit; }
};

// Checked-out state of the working tree: a branch, or a detached commit.
struct CheckoutState {
  std::optional<std::string> branch;
  std::string commit;

  bool detached() const { return !branch.has_value(); }
};

enum class SyncAction { Created, Updated, NotUpdated, Closed };

const char *to_string(SyncAction a);

struct SyncOutcome {
  SyncAction action = SyncAction::NotUpdated;
  std::string head;   // resulting head commit
  std::string branch; // branch name actually used
  bool rewritten = false;
  std::optional<std::string> expected_remote_tip;
  bool has_diff_with_base = false;
};

} // namespace prsync
