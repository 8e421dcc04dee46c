#include <prsync/config_guard.hpp>
#include <prsync/errors.hpp>
#include <prsync/remote.hpp>

#include <spdlog/spdlog.h>

namespace prsync {

ConfigSnapshot ConfigStateGuard::snapshot(const std::vector<std::string> &keys,
                                          ConfigScope scope) {
  ConfigSnapshot snap;
  snap.scope = scope;
  for (auto &key : keys) {
    auto values = vcs_.config_get_all(key, scope);
    if (values.empty())
      snap.entries.push_back({key, std::nullopt});
    else
      snap.entries.push_back({key, std::move(values)});
    spdlog::debug("[config] saved {} ({})", key,
                  snap.entries.back().values ? "set" : "absent");
  }
  return snap;
}

void ConfigStateGuard::restore(const ConfigSnapshot &snap) {
  std::string failed;
  for (auto &e : snap.entries) {
    try {
      vcs_.config_unset_all(e.key, snap.scope);
      if (e.values) {
        for (auto &v : *e.values)
          vcs_.config_add(e.key, v, snap.scope);
      }
    } catch (const Error &ex) {
      spdlog::debug("[config] restore of {} failed: {}", e.key, ex.what());
      if (!failed.empty())
        failed += ", ";
      failed += e.key;
    }
  }
  if (!failed.empty())
    throw ConfigRestoreFailure(failed);
}

ScopedConfigGuard::ScopedConfigGuard(VersionControlClient &vcs,
                                     const std::vector<std::string> &keys,
                                     ConfigScope scope)
    : guard_(vcs), snap_(guard_.snapshot(keys, scope)) {}

ScopedConfigGuard::~ScopedConfigGuard() { restore_now(); }

bool ScopedConfigGuard::restore_now() {
  if (restored_)
    return true;
  restored_ = true;
  try {
    guard_.restore(snap_);
    spdlog::debug("[config] restored {} key(s)", snap_.entries.size());
    return true;
  } catch (const ConfigRestoreFailure &ex) {
    spdlog::error("[config] {}", ex.what());
    return false;
  }
}

std::vector<std::string> mutable_config_keys(const std::string &origin_url,
                                             const std::string &fork_remote) {
  std::vector<std::string> keys{"user.name", "user.email", "credential.helper",
                                "commit.gpgsign"};
  if (!origin_url.empty())
    keys.push_back(extraheader_key(origin_url));
  if (!fork_remote.empty()) {
    keys.push_back("remote." + fork_remote + ".url");
    keys.push_back("remote." + fork_remote + ".fetch");
  }
  return keys;
}

} // namespace prsync
