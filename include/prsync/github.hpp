#pragma once
#include <prsync/hosting.hpp>
#include <prsync/http.hpp>

#include <memory>
#include <string>
#include <vector>

namespace Json {
class Value;
}

namespace prsync {

constexpr std::size_t kMaxBodyLength = 65536;

// HostingService over the GitHub REST API.
class GitHubClient : public HostingService {
public:
  GitHubClient(std::string api_url, std::string repository, std::string token,
               std::shared_ptr<HttpClient> http, RetryPolicy retry = {});

  std::optional<PullRequest>
  find_open_pull_request(const std::string &head,
                         const std::string &base) override;
  PullRequest create_pull_request(const PullRequestSpec &spec) override;
  PullRequest update_pull_request(int number, const std::string &title,
                                  const std::string &body) override;
  void close_pull_request(int number) override;

  void add_labels(int number, const std::vector<std::string> &labels) override;
  void add_assignees(int number,
                     const std::vector<std::string> &assignees) override;
  void request_reviewers(int number, const std::vector<std::string> &users,
                         const std::vector<std::string> &teams) override;
  void set_milestone(int number, int milestone) override;

  bool commit_verified(const std::string &sha) override;

  const std::string &repository() const { return repository_; }

private:
  Json::Value call(const std::string &operation, const std::string &method,
                   const std::string &path, const Json::Value *payload);
  Json::Value call_with_retry(const std::string &operation,
                              const std::string &method,
                              const std::string &path,
                              const Json::Value *payload);

  std::string api_url_;
  std::string repository_;
  std::string token_;
  std::shared_ptr<HttpClient> http_;
  RetryPolicy retry_;
};

// "org/team" -> "team"
std::string team_slug(const std::string &team);

std::string url_encode(const std::string &s);

} // namespace prsync
