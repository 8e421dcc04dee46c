#pragma once
#include <optional>
#include <string>
#include <vector>

namespace prsync {

struct PullRequest {
  int number = 0;
  std::string url;
  std::string head_sha;
  bool draft = false;
};

struct PullRequestSpec {
  std::string head; // "branch", or "owner:branch" for a fork
  std::string base;
  std::string title;
  std::string body;
  bool draft = false;
  bool maintainer_can_modify = true;
};

// Pull request operations of a code-hosting service.
class HostingService {
public:
  virtual ~HostingService() = default;

  virtual std::optional<PullRequest>
  find_open_pull_request(const std::string &head, const std::string &base) = 0;
  virtual PullRequest create_pull_request(const PullRequestSpec &spec) = 0;
  virtual PullRequest update_pull_request(int number, const std::string &title,
                                          const std::string &body) = 0;
  virtual void close_pull_request(int number) = 0;

  virtual void add_labels(int number,
                          const std::vector<std::string> &labels) = 0;
  virtual void add_assignees(int number,
                             const std::vector<std::string> &assignees) = 0;
  virtual void request_reviewers(int number,
                                 const std::vector<std::string> &users,
                                 const std::vector<std::string> &teams) = 0;
  virtual void set_milestone(int number, int milestone) = 0;

  // true when the service reports a verified signature on the commit
  virtual bool commit_verified(const std::string &sha) = 0;
};

} // namespace prsync
