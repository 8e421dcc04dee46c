#pragma once
#include <catch2/catch_all.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

inline fs::path mkd(const std::string &name) {
  auto d = fs::temp_directory_path() / ("prsync_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

inline void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

inline std::string sh_out(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " 2>/dev/null";
  FILE *p = popen(full.c_str(), "r");
  REQUIRE(p);
  std::string s;
  char buf[256];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), p)) > 0)
    s.append(buf, n);
  pclose(p);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

inline void put(const fs::path &p, const std::string &content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << content;
}

inline std::string slurp(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), {});
}

// bare origin with main = {a,b,x,y}.txt, plus a configured clone in `work`
struct GitFixture {
  fs::path root, origin, work;

  explicit GitFixture(const std::string &name) {
    root = mkd(name);
    auto seed = root / "seed";
    fs::create_directories(seed);
    sh("git init -q && git symbolic-ref HEAD refs/heads/main", seed);
    configure(seed);
    for (auto f : {"a", "b", "x", "y"})
      put(seed / (std::string(f) + ".txt"), std::string(f) + "\n");
    sh("git add -A && git commit -q -m init", seed);

    origin = root / "origin.git";
    work = root / "work";
    sh("git clone -q --bare seed origin.git", root);
    sh("git clone -q origin.git work", root);
    configure(work);
  }

  static void configure(const fs::path &repo) {
    sh("git config user.email tester@example.com", repo);
    sh("git config user.name tester", repo);
    sh("git config commit.gpgsign false", repo);
  }

  // second clone used to move main or the branch behind work's back
  fs::path other(const std::string &name = "other") {
    auto dir = root / name;
    if (!fs::exists(dir)) {
      sh("git clone -q origin.git " + name, root);
      configure(dir);
    }
    return dir;
  }

  std::string rev(const std::string &r, const fs::path &repo) const {
    return sh_out("git rev-parse " + r, repo);
  }
  std::string rev(const std::string &r) const { return rev(r, work); }
  std::string origin_rev(const std::string &r) const {
    return sh_out("git rev-parse " + r, origin);
  }
  std::string status() const {
    return sh_out("git status --porcelain --untracked-files=all", work);
  }
  std::string branches() const {
    return sh_out("git for-each-ref --format='%(refname:short)' refs/heads",
                  work);
  }
};
