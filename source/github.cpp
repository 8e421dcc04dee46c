#include <prsync/errors.hpp>
#include <prsync/github.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace prsync {

std::string team_slug(const std::string &team) {
  auto slash = team.rfind('/');
  return slash == std::string::npos ? team : team.substr(slash + 1);
}

std::string url_encode(const std::string &s) {
  if (s.empty())
    return s;
  static CurlHandle curl;
  char *escaped =
      curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
  if (!escaped) {
    spdlog::warn("[github] failed to percent-encode '{}'; using raw value", s);
    return s;
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

static Json::Value parse_json(const std::string &operation,
                              const std::string &text) {
  Json::Value root;
  if (text.empty())
    return root;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs))
    throw HostingServiceError(operation, 0, "malformed JSON response: " + errs);
  return root;
}

static std::string to_json(const Json::Value &v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

static Json::Value string_array(const std::vector<std::string> &items) {
  Json::Value arr(Json::arrayValue);
  for (auto &i : items)
    arr.append(i);
  return arr;
}

static PullRequest to_pull_request(const Json::Value &v) {
  PullRequest pr;
  pr.number = v.get("number", 0).asInt();
  pr.url = v.get("html_url", "").asString();
  pr.head_sha = v["head"].get("sha", "").asString();
  pr.draft = v.get("draft", false).asBool();
  return pr;
}

static void check_body(const std::string &body) {
  if (body.size() > kMaxBodyLength)
    throw ConfigurationError("body", "pull request body is " +
                                         std::to_string(body.size()) +
                                         " characters, the limit is " +
                                         std::to_string(kMaxBodyLength));
}

GitHubClient::GitHubClient(std::string api_url, std::string repository,
                           std::string token, std::shared_ptr<HttpClient> http,
                           RetryPolicy retry)
    : api_url_(std::move(api_url)), repository_(std::move(repository)),
      token_(std::move(token)), http_(std::move(http)),
      retry_(std::move(retry)) {
  while (!api_url_.empty() && api_url_.back() == '/')
    api_url_.pop_back();
}

Json::Value GitHubClient::call(const std::string &operation,
                               const std::string &method,
                               const std::string &path,
                               const Json::Value *payload) {
  std::vector<std::string> headers{"Accept: application/vnd.github+json",
                                   "X-GitHub-Api-Version: 2022-11-28"};
  if (!token_.empty())
    headers.push_back("Authorization: Bearer " + token_);

  auto resp = http_->request(method, api_url_ + path, headers,
                             payload ? to_json(*payload) : std::string());
  if (resp.status == 401)
    throw AuthenticationError("GitHub rejected the token during " + operation);
  if (resp.status < 200 || resp.status >= 300) {
    std::string message;
    try {
      auto err = parse_json(operation, resp.body);
      message = err.get("message", "").asString();
      if (err.isMember("errors") && err["errors"].isArray()) {
        for (auto &e : err["errors"]) {
          auto m = e.get("message", "").asString();
          if (!m.empty())
            message += "; " + m;
        }
      }
    } catch (const HostingServiceError &) {
      message = resp.body;
    }
    throw HostingServiceError(operation, resp.status,
                              message.empty() ? "unexpected status" : message);
  }
  return parse_json(operation, resp.body);
}

Json::Value GitHubClient::call_with_retry(const std::string &operation,
                                          const std::string &method,
                                          const std::string &path,
                                          const Json::Value *payload) {
  return retry_.run(operation,
                    [&] { return call(operation, method, path, payload); });
}

std::optional<PullRequest>
GitHubClient::find_open_pull_request(const std::string &head,
                                     const std::string &base) {
  auto list = call_with_retry(
      "find pull request", "GET",
      "/repos/" + repository_ + "/pulls?state=open&head=" + url_encode(head) +
          "&base=" + url_encode(base),
      nullptr);
  if (!list.isArray() || list.empty())
    return std::nullopt;
  auto pr = to_pull_request(list[0]);
  spdlog::info("[github] found open pull request #{}", pr.number);
  return pr;
}

PullRequest GitHubClient::create_pull_request(const PullRequestSpec &spec) {
  check_body(spec.body);
  Json::Value payload;
  payload["title"] = spec.title;
  payload["head"] = spec.head;
  payload["base"] = spec.base;
  payload["body"] = spec.body;
  payload["draft"] = spec.draft;
  payload["maintainer_can_modify"] = spec.maintainer_can_modify;

  // not retried: a lost response would create a duplicate
  auto pr = to_pull_request(call("create pull request", "POST",
                                 "/repos/" + repository_ + "/pulls", &payload));
  spdlog::info("[github] created pull request #{} {}", pr.number, pr.url);
  return pr;
}

PullRequest GitHubClient::update_pull_request(int number,
                                              const std::string &title,
                                              const std::string &body) {
  check_body(body);
  Json::Value payload;
  payload["title"] = title;
  payload["body"] = body;
  auto pr = to_pull_request(call_with_retry(
      "update pull request", "PATCH",
      "/repos/" + repository_ + "/pulls/" + std::to_string(number), &payload));
  spdlog::info("[github] updated pull request #{}", pr.number);
  return pr;
}

void GitHubClient::close_pull_request(int number) {
  Json::Value payload;
  payload["state"] = "closed";
  call_with_retry("close pull request", "PATCH",
                  "/repos/" + repository_ + "/pulls/" + std::to_string(number),
                  &payload);
  spdlog::info("[github] closed pull request #{}", number);
}

void GitHubClient::add_labels(int number,
                              const std::vector<std::string> &labels) {
  if (labels.empty())
    return;
  Json::Value payload;
  payload["labels"] = string_array(labels);
  call_with_retry("add labels", "POST",
                  "/repos/" + repository_ + "/issues/" +
                      std::to_string(number) + "/labels",
                  &payload);
}

void GitHubClient::add_assignees(int number,
                                 const std::vector<std::string> &assignees) {
  if (assignees.empty())
    return;
  Json::Value payload;
  payload["assignees"] = string_array(assignees);
  call_with_retry("add assignees", "POST",
                  "/repos/" + repository_ + "/issues/" +
                      std::to_string(number) + "/assignees",
                  &payload);
}

void GitHubClient::request_reviewers(int number,
                                     const std::vector<std::string> &users,
                                     const std::vector<std::string> &teams) {
  if (users.empty() && teams.empty())
    return;
  std::vector<std::string> slugs;
  for (auto &t : teams)
    slugs.push_back(team_slug(t));
  Json::Value payload;
  payload["reviewers"] = string_array(users);
  payload["team_reviewers"] = string_array(slugs);
  call_with_retry("request reviewers", "POST",
                  "/repos/" + repository_ + "/pulls/" +
                      std::to_string(number) + "/requested_reviewers",
                  &payload);
}

void GitHubClient::set_milestone(int number, int milestone) {
  if (milestone <= 0)
    return;
  Json::Value payload;
  payload["milestone"] = milestone;
  call_with_retry("set milestone", "PATCH",
                  "/repos/" + repository_ + "/issues/" + std::to_string(number),
                  &payload);
}

bool GitHubClient::commit_verified(const std::string &sha) {
  auto commit = call_with_retry(
      "read commit", "GET", "/repos/" + repository_ + "/commits/" + sha,
      nullptr);
  return commit["commit"]["verification"].get("verified", false).asBool();
}

} // namespace prsync
