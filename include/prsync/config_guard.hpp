#pragma once
#include <prsync/vcs.hpp>

#include <optional>
#include <string>
#include <vector>

namespace prsync {

struct ConfigEntry {
  std::string key;
  std::optional<std::vector<std::string>> values; // nullopt: key was absent
};

struct ConfigSnapshot {
  ConfigScope scope = ConfigScope::Local;
  std::vector<ConfigEntry> entries;
};

class ConfigStateGuard {
public:
  explicit ConfigStateGuard(VersionControlClient &vcs) : vcs_(vcs) {}

  ConfigSnapshot snapshot(const std::vector<std::string> &keys,
                          ConfigScope scope = ConfigScope::Local);
  // Puts every key back. Tries all keys before throwing ConfigRestoreFailure
  // naming the ones that could not be restored.
  void restore(const ConfigSnapshot &snap);

private:
  VersionControlClient &vcs_;
};

// Snapshot on construction, restore on destruction. Restore failures are
// logged and never propagate.
class ScopedConfigGuard {
public:
  ScopedConfigGuard(VersionControlClient &vcs,
                    const std::vector<std::string> &keys,
                    ConfigScope scope = ConfigScope::Local);
  ~ScopedConfigGuard();

  ScopedConfigGuard(const ScopedConfigGuard &) = delete;
  ScopedConfigGuard &operator=(const ScopedConfigGuard &) = delete;

  // restore now; later calls and the destructor do nothing
  bool restore_now();

private:
  ConfigStateGuard guard_;
  ConfigSnapshot snap_;
  bool restored_{false};
};

// Keys a run may mutate: identity, credentials, signing and the fork remote.
std::vector<std::string> mutable_config_keys(const std::string &origin_url,
                                             const std::string &fork_remote);

} // namespace prsync
