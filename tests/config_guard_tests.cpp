#include "support.hpp"

#include <prsync/config_guard.hpp>
#include <prsync/errors.hpp>
#include <prsync/git.hpp>

#include <algorithm>
#include <stdexcept>

using namespace prsync;

TEST_CASE("snapshot and restore bring back set, multi-valued and absent keys") {
  GitFixture fx("cfg_restore");
  sh("git config prsync.multi one && git config --add prsync.multi two",
     fx.work);

  auto git = GitClient::open(fx.work);
  ConfigStateGuard guard(git);
  auto snap = guard.snapshot({"user.name", "prsync.multi", "prsync.absent"});
  REQUIRE(snap.entries.size() == 3);
  REQUIRE(snap.entries[2].values == std::nullopt);

  git.config_set("user.name", "bot", ConfigScope::Local);
  git.config_unset_all("prsync.multi", ConfigScope::Local);
  git.config_set("prsync.multi", "replaced", ConfigScope::Local);
  git.config_set("prsync.absent", "now-set", ConfigScope::Local);

  guard.restore(snap);
  REQUIRE(sh_out("git config user.name", fx.work) == "tester");
  REQUIRE(sh_out("git config --get-all prsync.multi", fx.work) == "one\ntwo");
  REQUIRE(sh_out("git config --get prsync.absent || echo missing", fx.work) ==
          "missing");
}

TEST_CASE("scoped guard restores when the run throws") {
  GitFixture fx("cfg_scoped");
  auto git = GitClient::open(fx.work);

  try {
    ScopedConfigGuard guard(git, {"user.email", "credential.helper"});
    git.config_set("user.email", "bot@example.com", ConfigScope::Local);
    git.config_set("credential.helper", "store", ConfigScope::Local);
    throw std::runtime_error("failure mid-run");
  } catch (const std::runtime_error &) {
  }

  REQUIRE(sh_out("git config user.email", fx.work) == "tester@example.com");
  REQUIRE(sh_out("git config --local --get credential.helper || echo missing",
                 fx.work) == "missing");
}

TEST_CASE("restore failures are reported without stopping other keys") {
  GitFixture fx("cfg_failure");
  auto git = GitClient::open(fx.work);

  ConfigStateGuard guard(git);
  auto snap = guard.snapshot({"nosection", "user.name"});
  git.config_set("user.name", "bot", ConfigScope::Local);
  REQUIRE_THROWS_AS(guard.restore(snap), ConfigRestoreFailure);
  REQUIRE(sh_out("git config user.name", fx.work) == "tester");

  git.config_set("user.name", "bot", ConfigScope::Local);
  {
    ScopedConfigGuard scoped(git, {"nosection", "user.name"});
    git.config_set("user.name", "bot2", ConfigScope::Local);
    REQUIRE_FALSE(scoped.restore_now());
    REQUIRE(scoped.restore_now());
  }
  REQUIRE(sh_out("git config user.name", fx.work) == "bot");
}

TEST_CASE("keys a run may touch") {
  auto keys = mutable_config_keys("https://github.com/acme/widgets", "fork");
  auto has = [&](const std::string &k) {
    return std::find(keys.begin(), keys.end(), k) != keys.end();
  };
  REQUIRE(has("user.name"));
  REQUIRE(has("user.email"));
  REQUIRE(has("credential.helper"));
  REQUIRE(has("commit.gpgsign"));
  REQUIRE(has("http.https://github.com/.extraheader"));
  REQUIRE(has("remote.fork.url"));
  REQUIRE(has("remote.fork.fetch"));

  auto plain = mutable_config_keys("", "");
  REQUIRE(plain.size() == 4);
}
