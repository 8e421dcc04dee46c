#pragma once
#include <prsync/types.hpp>
#include <prsync/vcs.hpp>

#include <string>
#include <vector>

namespace prsync {

struct CommitFields {
  std::string message;
  Identity author;
  Identity committer;
  bool signoff = false;
  bool sign = false;
};

// Decides whether the working tree (optionally limited to pathspecs) differs
// from HEAD. Nothing is staged here; the synchronizer commits the result.
class ChangeCapture {
public:
  explicit ChangeCapture(VersionControlClient &vcs) : vcs_(vcs) {}

  ChangeSet capture(const std::vector<std::string> &pathspecs,
                    const CommitFields &fields);

private:
  VersionControlClient &vcs_;
};

} // namespace prsync
