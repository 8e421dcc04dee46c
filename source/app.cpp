#include <prsync/app.hpp>
#include <prsync/change_capture.hpp>
#include <prsync/config_guard.hpp>
#include <prsync/errors.hpp>
#include <prsync/git.hpp>
#include <prsync/github.hpp>
#include <prsync/http.hpp>
#include <prsync/remote.hpp>
#include <prsync/suffix.hpp>
#include <prsync/sync.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <random>

#ifndef PRSYNC_COMMIT
#define PRSYNC_COMMIT "unknown"
#endif
#ifndef PRSYNC_BRANCH
#define PRSYNC_BRANCH "unknown"
#endif
#ifndef PRSYNC_BUILD_TIME
#define PRSYNC_BUILD_TIME "unknown"
#endif

namespace prsync {

static void print_help() {
  std::cout <<
      R"(prsync - keep a pull request branch in sync with local changes

Usage:
  prsync sync [--path DIR] [--add-paths a,b] [--commit-message MSG]
              [--committer "Name <email>"] [--author "Name <email>"]
              [--signoff] [--sign-commits]
              [--branch NAME] [--branch-suffix none|random|timestamp|short-commit-hash]
              [--base BRANCH] [--delete-branch] [--push-to-fork OWNER/REPO]
              [--remote NAME]
              [--title T] [--body B | --body-path FILE]
              [--labels a,b] [--assignees a,b] [--reviewers a,b]
              [--team-reviewers a,b] [--milestone N] [--draft]
              [--maintainer-can-modify=false]
              [--token T] [--repository OWNER/REPO] [--api-url URL]
              [--http-retries N] [--http-backoff-ms N]
              [--verbose] [--log-file PATH] [--log-rotate-max BYTES]
              [--log-rotate-files N]
  prsync help
  prsync version

Every flag can also be given as INPUT_<FLAG> in the environment.
Exit status: 0 ok, 1 failure, 2 bad input, 3 concurrent update (retry).
)";
}

void setup_logging(const RunConfig &cfg) {
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      auto logger = std::make_shared<spdlog::logger>("prsync", sink);
      spdlog::set_default_logger(logger);
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {} ({}), logging to stderr",
                   cfg.log_file->string(), e.what());
    }
  }
  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);
}

// git's own identity for the author when none was given
static Identity configured_identity(VersionControlClient &git,
                                    const Identity &fallback) {
  for (auto scope : {ConfigScope::Local, ConfigScope::Global}) {
    auto names = git.config_get_all("user.name", scope);
    auto emails = git.config_get_all("user.email", scope);
    if (!names.empty() && !emails.empty() && !names.back().empty() &&
        !emails.back().empty())
      return Identity{names.back(), emails.back()};
  }
  return fallback;
}

static std::string owner_of(const std::string &repository) {
  return repository.substr(0, repository.find('/'));
}

Orchestrator::Orchestrator(RunConfig cfg, HostingFactory hosting)
    : cfg_(std::move(cfg)), hosting_(std::move(hosting)) {
  std::random_device rd;
  seed_ = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

RunOutputs Orchestrator::run() {
  std::string step = "open";
  try {
    auto git = GitClient::open(cfg_.path);
    spdlog::info("[prsync] {} in {}", git.version(), git.root().string());

    auto origin_url = git.remote_url(cfg_.remote);
    if (!origin_url)
      throw ConfigurationError("remote", "remote '" + cfg_.remote +
                                             "' is not configured");

    std::string repository = cfg_.repository;
    if (repository.empty()) {
      if (auto d = parse_remote_url(*origin_url))
        repository = d->repository;
    }

    ScopedConfigGuard config(
        git, mutable_config_keys(*origin_url, cfg_.push_to_fork ? "fork" : ""));

    step = "configure";
    Identity author =
        cfg_.author ? *cfg_.author : configured_identity(git, cfg_.committer);
    spdlog::info("[prsync] author {}, committer {}", author.to_string(),
                 cfg_.committer.to_string());
    git.config_set("user.name", cfg_.committer.name, ConfigScope::Local);
    git.config_set("user.email", cfg_.committer.email, ConfigScope::Local);
    if (!cfg_.token.empty()) {
      auto d = parse_remote_url(*origin_url);
      if (d && d->protocol == "https")
        git.config_set(extraheader_key(*origin_url),
                       basic_auth_header(cfg_.token), ConfigScope::Local);
    }
    if (cfg_.sign_commits)
      git.config_set("commit.gpgsign", "true", ConfigScope::Local);

    RemoteSubmitter submitter(git);
    std::string push_remote = cfg_.remote;
    if (cfg_.push_to_fork)
      push_remote = submitter.configure_fork(cfg_.remote, *cfg_.push_to_fork);

    std::shared_ptr<HostingService> hosting;
    if (hosting_) {
      if (repository.empty())
        throw ConfigurationError("repository",
                                 "cannot derive owner/repo from '" +
                                     *origin_url + "'");
      hosting = hosting_(repository);
    }

    auto start = git.current_ref();
    std::string base_name = cfg_.base ? *cfg_.base : start.branch.value_or("");
    if (hosting && base_name.empty())
      throw ConfigurationError("base", "HEAD is detached; a pull request "
                                       "needs a base branch");

    step = "resolve";
    SuffixInputs suffix{seed_, std::chrono::system_clock::now(), ""};
    if (cfg_.branch_suffix == SuffixStrategy::ShortCommitHash)
      suffix.short_hash = git.short_hash("HEAD");
    const std::string branch =
        suffixed_branch(cfg_.branch, cfg_.branch_suffix, suffix);

    step = "capture";
    ChangeSet cs = ChangeCapture(git).capture(
        cfg_.add_paths, CommitFields{cfg_.commit_message, author,
                                     cfg_.committer, cfg_.signoff,
                                     cfg_.sign_commits});

    step = "sync";
    SyncOutcome outcome = BranchSynchronizer(git).synchronize(
        SyncRequest{branch, cfg_.base, push_remote, cfg_.remote,
                    cfg_.delete_branch},
        cs);
    spdlog::info("[prsync] {} {} at {}", to_string(outcome.action),
                 outcome.branch, outcome.head);

    RunOutputs out;
    out.branch = outcome.branch;
    out.head_sha = outcome.head;

    std::string verified_head = outcome.head;
    if (outcome.action == SyncAction::Created ||
        outcome.action == SyncAction::Updated) {
      step = "push";
      auto receipt = submitter.push(outcome, push_remote);
      if (receipt.remote_tip)
        verified_head = *receipt.remote_tip;
    } else if (outcome.action == SyncAction::Closed) {
      step = "close";
      submitter.remove_branch(push_remote, outcome.branch,
                              outcome.expected_remote_tip);
    }

    step = "pull-request";
    if (hosting)
      publish(*hosting, outcome, repository, base_name, verified_head, out);
    else
      out.operation = pull_request_operation(outcome.action, false, false);

    config.restore_now();
    return out;
  } catch (Error &e) {
    e.set_step(step);
    throw;
  }
}

void Orchestrator::publish(HostingService &hosting, const SyncOutcome &outcome,
                           const std::string &repository,
                           const std::string &base,
                           const std::string &verified_head, RunOutputs &out) {
  const std::string head_owner =
      cfg_.push_to_fork ? owner_of(*cfg_.push_to_fork) : owner_of(repository);
  const std::string query_head = head_owner + ":" + outcome.branch;

  auto existing = hosting.find_open_pull_request(query_head, base);

  if (outcome.action == SyncAction::Closed) {
    if (existing) {
      hosting.close_pull_request(existing->number);
      out.number = existing->number;
      out.url = existing->url;
    }
    out.operation = pull_request_operation(outcome.action, false, false);
    return;
  }

  if (!outcome.has_diff_with_base) {
    spdlog::info("[prsync] {} has no difference with {}; no pull request",
                 outcome.branch, base);
    if (existing) {
      out.number = existing->number;
      out.url = existing->url;
    }
    out.operation = "none";
    return;
  }

  PullRequest pr;
  bool created = false;
  if (existing) {
    pr = hosting.update_pull_request(existing->number, cfg_.title, cfg_.body);
  } else {
    PullRequestSpec spec;
    spec.head = cfg_.push_to_fork ? query_head : outcome.branch;
    spec.base = base;
    spec.title = cfg_.title;
    spec.body = cfg_.body;
    spec.draft = cfg_.draft;
    spec.maintainer_can_modify = cfg_.maintainer_can_modify;
    pr = hosting.create_pull_request(spec);
    created = true;
  }

  hosting.add_labels(pr.number, cfg_.labels);
  hosting.add_assignees(pr.number, cfg_.assignees);
  hosting.request_reviewers(pr.number, cfg_.reviewers, cfg_.team_reviewers);
  hosting.set_milestone(pr.number, cfg_.milestone);

  out.number = pr.number;
  out.url = pr.url;
  out.commits_verified = hosting.commit_verified(verified_head);
  out.operation =
      pull_request_operation(outcome.action, created, existing.has_value());
}

static std::shared_ptr<HostingService> make_github(const RunConfig &cfg,
                                                   const std::string &repo) {
  if (cfg.token.empty()) {
    spdlog::warn("[prsync] no token given; skipping the pull request step");
    return nullptr;
  }
  RetryPolicy retry;
  retry.attempts = cfg.http_retries;
  retry.delay = std::chrono::milliseconds(cfg.http_backoff_ms);
  return std::make_shared<GitHubClient>(cfg.api_url, repo, cfg.token,
                                        std::make_shared<CurlHttpClient>(),
                                        retry);
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("prsync {} ({}, built {})\n", PRSYNC_COMMIT,
                                   PRSYNC_BRANCH, PRSYNC_BUILD_TIME);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdSync>) {
          setup_logging(c.cfg);
          const RunConfig &cfg = c.cfg;
          Orchestrator orch(cfg, [&cfg](const std::string &repo) {
            return make_github(cfg, repo);
          });
          try {
            auto out = orch.run();
            std::optional<std::filesystem::path> file;
            if (auto v = getenv_lookup("GITHUB_OUTPUT"); v && !v->empty())
              file = std::filesystem::path(*v);
            write_outputs(out, file, std::cout);
            return 0;
          } catch (const ConfigurationError &e) {
            spdlog::error("[prsync] {}: {}",
                          e.step().empty() ? "input" : e.step(), e.what());
            return 2;
          } catch (const Error &e) {
            spdlog::error("[prsync] step '{}' failed: {}",
                          e.step().empty() ? "run" : e.step(), e.what());
            return e.retryable() ? 3 : 1;
          } catch (const std::exception &e) {
            spdlog::error("[prsync] {}", e.what());
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace prsync
