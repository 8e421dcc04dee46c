#pragma once
#include <prsync/process.hpp>
#include <prsync/vcs.hpp>

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace prsync {

// VersionControlClient backed by the git command line.
class GitClient : public VersionControlClient {
public:
  static GitClient open(const std::filesystem::path &path);

  const std::filesystem::path &root() const { return root_; }
  std::string version();

  CheckoutState current_ref() override;
  std::optional<std::string> rev_parse(const std::string &rev) override;
  std::string short_hash(const std::string &rev) override;

  bool branch_exists(const std::string &name) override;
  std::optional<std::string> remote_tip(const std::string &remote,
                                        const std::string &name) override;
  void fetch(const std::string &remote,
             const std::vector<std::string> &refspecs) override;

  void checkout(const std::string &ref) override;
  void checkout_detached(const std::string &commit) override;
  void force_checkout(const CheckoutState &state) override;
  void create_branch(const std::string &name, const std::string &from) override;
  void delete_branch(const std::string &name) override;
  void set_branch(const std::string &name,
                  const std::optional<std::string> &commit) override;

  bool diff(const std::vector<std::string> &pathspecs) override;
  std::vector<std::string>
  changed_paths(const std::vector<std::string> &pathspecs) override;
  std::string stage_and_commit(const std::vector<std::string> &pathspecs,
                               const std::string &message,
                               const Identity &author,
                               const Identity &committer, bool signoff,
                               bool sign) override;
  void apply_uncommitted(const std::string &commit) override;

  MergeResult rebase(const std::string &onto) override;
  void abort_rebase() override;
  MergeResult cherry_pick(const std::string &commit) override;
  void abort_cherry_pick() override;
  InProgress in_progress_operation() override;

  std::string tree_hash(const std::string &ref) override;
  bool is_ancestor(const std::string &ancestor,
                   const std::string &descendant) override;
  int count_commits(const std::string &from, const std::string &to) override;

  bool stash_push(const std::string &message) override;
  void stash_pop() override;

  PushResult push(const PushRequest &req) override;
  PushResult
  delete_remote_branch(const std::string &remote, const std::string &branch,
                       const std::optional<std::string> &lease) override;

  std::vector<std::string> config_get_all(const std::string &key,
                                          ConfigScope scope) override;
  void config_set(const std::string &key, const std::string &value,
                  ConfigScope scope) override;
  void config_add(const std::string &key, const std::string &value,
                  ConfigScope scope) override;
  void config_unset_all(const std::string &key, ConfigScope scope) override;

  std::optional<std::string> remote_url(const std::string &remote) override;
  void set_remote(const std::string &remote, const std::string &url) override;

private:
  explicit GitClient(std::filesystem::path root);

  using Env = std::unordered_map<std::string, std::string>;

  CmdResult exec(const std::vector<std::string> &args,
                 const Env &env = {}) const;
  // exec + VersionControlFailure on non-zero exit; returns stdout
  std::string run(const std::vector<std::string> &args,
                  const Env &env = {}) const;
  bool path_exists(const std::string &git_path) const;
  std::vector<std::string> unmerged_paths() const;

  std::filesystem::path root_;
  bool show_output_{false};
};

} // namespace prsync
