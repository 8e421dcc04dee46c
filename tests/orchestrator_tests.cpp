#include "support.hpp"

#include <prsync/app.hpp>
#include <prsync/errors.hpp>
#include <prsync/hosting.hpp>
#include <prsync/suffix.hpp>

#include <map>
#include <memory>
#include <vector>

using namespace prsync;

namespace {

// In-memory pull requests keyed by "owner:branch".
class FakeHosting : public HostingService {
public:
  std::map<std::string, PullRequest> open;
  std::vector<std::string> log;
  std::vector<std::string> labels;
  std::vector<std::string> teams;
  std::string verified_sha;
  PullRequestSpec last_spec;
  int next = 1;

  std::optional<PullRequest> find_open_pull_request(const std::string &head,
                                                    const std::string &base) override {
    log.push_back("find " + head + " " + base);
    auto it = open.find(head);
    if (it == open.end())
      return std::nullopt;
    return it->second;
  }

  PullRequest create_pull_request(const PullRequestSpec &spec) override {
    log.push_back("create " + spec.head);
    last_spec = spec;
    PullRequest pr{next++, "https://example.com/pr/" + std::to_string(next - 1),
                   "", spec.draft};
    auto key = spec.head.find(':') == std::string::npos
                   ? "acme:" + spec.head
                   : spec.head;
    open[key] = pr;
    return pr;
  }

  PullRequest update_pull_request(int number, const std::string &title,
                                  const std::string &) override {
    log.push_back("update " + std::to_string(number) + " " + title);
    for (auto &kv : open)
      if (kv.second.number == number)
        return kv.second;
    FAIL("update of unknown pull request");
    return {};
  }

  void close_pull_request(int number) override {
    log.push_back("close " + std::to_string(number));
    for (auto it = open.begin(); it != open.end(); ++it) {
      if (it->second.number == number) {
        open.erase(it);
        return;
      }
    }
  }

  void add_labels(int, const std::vector<std::string> &l) override {
    labels = l;
  }
  void add_assignees(int, const std::vector<std::string> &) override {}
  void request_reviewers(int, const std::vector<std::string> &,
                         const std::vector<std::string> &t) override {
    teams = t;
  }
  void set_milestone(int, int) override {}

  bool commit_verified(const std::string &sha) override {
    verified_sha = sha;
    return false;
  }
};

struct Setup {
  GitFixture fx;
  std::shared_ptr<FakeHosting> hosting = std::make_shared<FakeHosting>();
  RunConfig cfg;

  explicit Setup(const std::string &name) : fx(name) {
    cfg.path = fx.work;
    cfg.repository = "acme/widgets";
    cfg.base = "main";
    cfg.committer = Identity{"prsync bot", "bot@example.com"};
    cfg.labels = {"automated"};
    cfg.team_reviewers = {"acme/platform"};
    cfg.title = "Automated update";
  }

  RunOutputs run() {
    auto h = hosting;
    Orchestrator orch(cfg, [h](const std::string &repo) {
      REQUIRE(repo == "acme/widgets");
      return std::static_pointer_cast<HostingService>(h);
    });
    return orch.run();
  }

  std::string remote_branch() const {
    return sh_out("git for-each-ref --format='%(objectname)' "
                  "refs/heads/prsync/patch",
                  fx.origin);
  }
};

} // namespace

TEST_CASE("first run opens a pull request and later runs keep it current") {
  Setup s("orch_lifecycle");
  put(s.fx.work / "a.txt", "changed\n");

  auto first = s.run();
  REQUIRE(first.operation == "created");
  REQUIRE(first.number == std::optional<int>(1));
  REQUIRE(first.branch == "prsync/patch");
  REQUIRE(first.head_sha == s.remote_branch());
  REQUIRE(s.hosting->verified_sha == first.head_sha);
  REQUIRE(s.hosting->last_spec.head == "prsync/patch");
  REQUIRE(s.hosting->last_spec.base == "main");
  REQUIRE(s.hosting->labels == std::vector<std::string>{"automated"});
  REQUIRE(s.hosting->teams == std::vector<std::string>{"acme/platform"});

  // edits stay in the working tree, the checkout stays on main
  REQUIRE(s.fx.status() == " M a.txt");
  REQUIRE(sh_out("git symbolic-ref --short HEAD", s.fx.work) == "main");

  // the author comes from the repository identity, committer from the config
  auto who = sh_out("git log -1 --format=%an/%cn prsync/patch", s.fx.origin);
  REQUIRE(who == "tester/prsync bot");
  REQUIRE(sh_out("git config user.name", s.fx.work) == "tester");

  auto second = s.run();
  REQUIRE(second.operation == "none");
  REQUIRE(second.number == std::optional<int>(1));
  REQUIRE(second.head_sha == first.head_sha);

  put(s.fx.work / "b.txt", "also changed\n");
  auto third = s.run();
  REQUIRE(third.operation == "updated");
  REQUIRE(third.number == std::optional<int>(1));
  REQUIRE(third.head_sha != first.head_sha);
  REQUIRE(third.head_sha == s.remote_branch());

  int creates = 0;
  for (auto &l : s.hosting->log)
    creates += l.rfind("create", 0) == 0;
  REQUIRE(creates == 1);
  REQUIRE(s.hosting->log.front() == "find acme:prsync/patch main");
}

TEST_CASE("reverted changes close the pull request when deletion is enabled") {
  Setup s("orch_close");
  put(s.fx.work / "a.txt", "changed\n");
  REQUIRE(s.run().operation == "created");
  REQUIRE_FALSE(s.remote_branch().empty());

  sh("git checkout -q -- .", s.fx.work);
  s.cfg.delete_branch = true;
  auto out = s.run();
  REQUIRE(out.operation == "closed");
  REQUIRE(out.number == std::optional<int>(1));
  REQUIRE(s.hosting->open.empty());
  REQUIRE(s.remote_branch().empty());
  REQUIRE(s.fx.branches() == "main");
}

TEST_CASE("reverted changes leave the branch when deletion is disabled") {
  Setup s("orch_keep");
  put(s.fx.work / "a.txt", "changed\n");
  auto created = s.run();

  sh("git checkout -q -- .", s.fx.work);
  auto out = s.run();
  REQUIRE(out.operation == "none");
  REQUIRE(out.head_sha == created.head_sha);
  REQUIRE(s.remote_branch() == created.head_sha);
  REQUIRE(s.hosting->open.size() == 1);
}

TEST_CASE("nothing to do without changes or a branch") {
  Setup s("orch_noop");
  auto out = s.run();
  REQUIRE(out.operation == "none");
  REQUIRE_FALSE(out.number);
  REQUIRE(s.remote_branch().empty());
  REQUIRE(s.hosting->log == std::vector<std::string>{
                                "find acme:prsync/patch main"});
}

TEST_CASE("runs without a hosting service still push the branch") {
  Setup s("orch_nohost");
  put(s.fx.work / "x.txt", "changed\n");
  Orchestrator orch(s.cfg, HostingFactory{});
  auto out = orch.run();
  REQUIRE(out.operation == "none");
  REQUIRE_FALSE(out.number);
  REQUIRE(out.head_sha == s.remote_branch());
}

TEST_CASE("branch suffix is applied before synchronizing") {
  Setup s("orch_suffix");
  s.cfg.branch_suffix = SuffixStrategy::ShortCommitHash;
  put(s.fx.work / "y.txt", "changed\n");
  auto out = s.run();
  auto expected = "prsync/patch-" +
                  sh_out("git rev-parse --short HEAD", s.fx.work);
  REQUIRE(out.branch == expected);
  REQUIRE(s.hosting->last_spec.head == expected);
}

TEST_CASE("random branch suffix comes from the run seed") {
  Setup s("orch_seed");
  s.cfg.branch_suffix = SuffixStrategy::Random;
  put(s.fx.work / "y.txt", "changed\n");

  auto h = s.hosting;
  Orchestrator orch(s.cfg, [h](const std::string &) {
    return std::static_pointer_cast<HostingService>(h);
  });
  orch.set_seed(42);
  auto out = orch.run();
  REQUIRE(out.branch == "prsync/patch-" + random_suffix("prsync/patch", 42));
  REQUIRE(out.operation == "created");
}

TEST_CASE("failures carry the step they surfaced in and restore config") {
  Setup s("orch_errors");
  put(s.fx.work / "a.txt", "changed\n");

  SECTION("missing remote") {
    s.cfg.remote = "upstream";
    try {
      s.run();
      FAIL("expected ConfigurationError");
    } catch (const ConfigurationError &e) {
      REQUIRE(e.step() == "open");
      REQUIRE(e.parameter() == "remote");
    }
  }

  SECTION("unknown base") {
    s.cfg.base = "does-not-exist";
    try {
      s.run();
      FAIL("expected InvalidBaseReference");
    } catch (const InvalidBaseReference &e) {
      REQUIRE(e.step() == "resolve");
    }
  }

  SECTION("branch equal to base") {
    s.cfg.branch = "main";
    try {
      s.run();
      FAIL("expected ConfigurationError");
    } catch (const ConfigurationError &e) {
      REQUIRE(e.parameter() == "branch");
      REQUIRE(e.step() == "resolve");
    }
  }

  REQUIRE(sh_out("git config user.name", s.fx.work) == "tester");
  REQUIRE(sh_out("git config user.email", s.fx.work) == "tester@example.com");
  REQUIRE(s.fx.status() == " M a.txt");
}
