#include <catch2/catch_all.hpp>
#include <prsync/process.hpp>

#include <filesystem>

using namespace prsync;
namespace fs = std::filesystem;

TEST_CASE("run_command captures stdout, stderr and the exit code") {
  auto r = run_command({"/bin/sh", "-c", "echo out; echo err >&2; exit 7"},
                       fs::temp_directory_path());
  REQUIRE(r.exit_code == 7);
  REQUIRE(trim(r.out) == "out");
  REQUIRE(trim(r.err) == "err");
}

TEST_CASE("run_command runs in the given directory") {
  auto dir = fs::temp_directory_path() / "prsync_process_cwd";
  fs::remove_all(dir);
  fs::create_directories(dir);
  auto r = run_command({"pwd"}, dir);
  REQUIRE(r.exit_code == 0);
  REQUIRE(fs::equivalent(fs::path(trim(r.out)), dir));
}

TEST_CASE("run_command overrides and unsets environment variables") {
  ::setenv("PRSYNC_TEST_DROP", "present", 1);
  auto r = run_command(
      {"/bin/sh", "-c", "echo \"$PRSYNC_TEST_SET:${PRSYNC_TEST_DROP-unset}\""},
      fs::temp_directory_path(),
      {{"PRSYNC_TEST_SET", "value"}, {"PRSYNC_TEST_DROP", ""}});
  ::unsetenv("PRSYNC_TEST_DROP");
  REQUIRE(trim(r.out) == "value:unset");
}

TEST_CASE("run_command drains large output on both pipes") {
  auto r = run_command({"/bin/sh", "-c",
                        "i=0; while [ $i -lt 20000 ]; do echo "
                        "line-$i; echo err-$i >&2; i=$((i+1)); done"},
                       fs::temp_directory_path());
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.out.find("line-19999") != std::string::npos);
  REQUIRE(r.err.find("err-19999") != std::string::npos);
}

TEST_CASE("signalled children report 128 + signal") {
  auto r = run_command({"/bin/sh", "-c", "kill -TERM $$"},
                       fs::temp_directory_path());
  REQUIRE(r.exit_code == 128 + 15);
}

TEST_CASE("missing executables fail with 127") {
  auto r = run_command({"prsync-no-such-binary"}, fs::temp_directory_path());
  REQUIRE(r.exit_code == 127);
}

TEST_CASE("join_args quotes arguments with spaces") {
  REQUIRE(join_args({"commit", "-m", "two words"}) ==
          "commit -m 'two words'");
  REQUIRE(trim("  x \n") == "x");
}
