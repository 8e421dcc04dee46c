#include <prsync/errors.hpp>
#include <prsync/sync.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <chrono>

#include <unistd.h>

namespace prsync {

static std::string commit_of(VersionControlClient &vcs,
                             const std::string &rev) {
  auto c = vcs.rev_parse(rev);
  if (!c)
    throw VersionControlFailure("git rev-parse " + rev, 128,
                                "unknown revision");
  return *c;
}

// ---------------------------------------------------------------- lease

WorkspaceLease::WorkspaceLease(VersionControlClient &vcs, CheckoutState origin)
    : vcs_(vcs), origin_(std::move(origin)) {}

WorkspaceLease::~WorkspaceLease() {
  if (!done_)
    rollback();
}

const std::string &WorkspaceLease::park(const ChangeSet &cs,
                                        const std::string &ephemeral) {
  vcs_.create_branch(ephemeral, origin_.commit);
  ephemeral_ = ephemeral;
  change_commit_ = vcs_.stage_and_commit(
      cs.scoped() ? cs.matched : std::vector<std::string>{}, cs.message,
      cs.author, cs.committer, cs.signoff, cs.sign);
  spdlog::debug("[sync] change committed as {} on {}", change_commit_,
                ephemeral_);
  stashed_ = vcs_.stash_push("prsync: edits outside the change set");
  secured_ = true;
  return change_commit_;
}

void WorkspaceLease::track_target(const std::string &name,
                                  std::optional<std::string> previous) {
  target_ = name;
  target_previous_ = std::move(previous);
}

void WorkspaceLease::discard_target() { discard_ = true; }

void WorkspaceLease::release() {
  done_ = true;
  std::exception_ptr first;
  restore(!discard_, first);
  if (first)
    std::rethrow_exception(first);
}

void WorkspaceLease::rollback() {
  if (done_)
    return;
  done_ = true;
  std::exception_ptr first;
  restore(false, first);
  if (first)
    spdlog::error("[sync] workspace only partially restored; pending edits "
                  "may be on branch {} or in the stash",
                  ephemeral_);
  else
    spdlog::warn("[sync] workspace restored after failure");
}

void WorkspaceLease::restore(bool keep_target, std::exception_ptr &first) {
  auto attempt = [&](const char *what, auto &&fn) -> bool {
    try {
      fn();
      return true;
    } catch (const Error &e) {
      spdlog::error("[sync] restore: {} failed: {}", what, e.what());
      if (!first)
        first = std::current_exception();
      return false;
    }
  };

  attempt("abort", [&] {
    switch (vcs_.in_progress_operation()) {
    case InProgress::Rebase:
      vcs_.abort_rebase();
      break;
    case InProgress::CherryPick:
      vcs_.abort_cherry_pick();
      break;
    default:
      break;
    }
  });

  if (!ephemeral_.empty()) {
    bool back = attempt("checkout", [&] {
      if (secured_)
        vcs_.force_checkout(origin_);
      else if (origin_.branch)
        vcs_.checkout(*origin_.branch);
      else
        vcs_.checkout_detached(origin_.commit);
    });
    // edits stay parked rather than land on the wrong checkout
    if (!back)
      return;
  }

  if (target_ && !keep_target)
    attempt("target ref", [&] { vcs_.set_branch(*target_, target_previous_); });
  // the change goes back unstaged first; the stash then restores the index
  // state of everything outside it
  if (!change_commit_.empty())
    attempt("re-apply", [&] { vcs_.apply_uncommitted(change_commit_); });
  if (stashed_)
    attempt("stash pop", [&] { vcs_.stash_pop(); });
  if (!ephemeral_.empty())
    attempt("ephemeral branch", [&] { vcs_.delete_branch(ephemeral_); });
}

// --------------------------------------------------------- synchronizer

BaseRef BranchSynchronizer::resolve_base(const std::optional<std::string> &base,
                                         const std::string &remote,
                                         const CheckoutState &current) {
  if (!base || base->empty())
    return BaseRef{current.branch, current.commit};

  if (auto c = vcs_.rev_parse("refs/heads/" + *base))
    return BaseRef{*base, *c};
  const std::string tracking = "refs/remotes/" + remote + "/" + *base;
  if (auto c = vcs_.rev_parse(tracking))
    return BaseRef{*base, *c};

  try {
    vcs_.fetch(remote, {"+refs/heads/" + *base + ":" + tracking});
    if (auto c = vcs_.rev_parse(tracking))
      return BaseRef{*base, *c};
  } catch (const VersionControlFailure &e) {
    spdlog::debug("[sync] fetch of base {} failed: {}", *base, e.what());
  }

  if (auto c = vcs_.rev_parse(*base))
    return BaseRef{std::nullopt, *c};
  throw InvalidBaseReference(*base);
}

BranchRef BranchSynchronizer::resolve(const std::string &name,
                                      const std::string &remote) {
  BranchRef ref;
  ref.name = name;
  if (vcs_.branch_exists(name))
    ref.local_tip = vcs_.rev_parse("refs/heads/" + name);
  ref.remote_tip = vcs_.remote_tip(remote, name);
  if (ref.remote_tip)
    vcs_.fetch(remote, {"+refs/heads/" + name + ":refs/remotes/" + remote +
                        "/" + name});

  if (ref.local_tip && ref.remote_tip)
    ref.presence = Presence::Both;
  else if (ref.remote_tip)
    ref.presence = Presence::Remote;
  else if (ref.local_tip)
    ref.presence = Presence::Local;
  return ref;
}

SyncOutcome BranchSynchronizer::synchronize(const SyncRequest &req,
                                            const ChangeSet &cs) {
  CheckoutState current;
  BaseRef base;
  BranchRef branch;
  step_ = "resolve";
  try {
    if (!cs.computed())
      throw ConfigurationError("add-paths", "change set was not captured");
    current = vcs_.current_ref();
    base = resolve_base(req.base, req.base_remote, current);
    if (base.branch && *base.branch == req.branch)
      throw ConfigurationError("branch", "'" + req.branch +
                                             "' is also the base branch");
    if (current.branch && *current.branch == req.branch)
      throw ConfigurationError("branch", "'" + req.branch +
                                             "' is the checked-out branch");
    branch = resolve(req.branch, req.remote);
  } catch (Error &e) {
    e.set_step(step_);
    throw;
  }

  spdlog::info("[sync] branch {} ({}), base {} at {}", branch.name,
               branch.present() ? "present" : "absent", base.display(),
               base.commit);

  if (cs.empty())
    return on_empty(req, base, branch);
  if (!branch.present())
    return create(req, base, cs, current);
  return update(req, base, branch, cs, current);
}

SyncOutcome BranchSynchronizer::on_empty(const SyncRequest &req,
                                         const BaseRef &base,
                                         const BranchRef &branch) {
  SyncOutcome out;
  out.branch = branch.name;
  out.expected_remote_tip = branch.remote_tip;
  if (!branch.present()) {
    spdlog::info("[sync] nothing to commit and no branch {}", branch.name);
    out.head = base.commit;
    return out;
  }

  out.head = *branch.tip();
  if (!req.delete_on_empty) {
    spdlog::info("[sync] nothing to commit; leaving {} at {}", branch.name,
                 out.head);
    step_ = "resolve";
    try {
      out.has_diff_with_base = differs_from_base(out.head, base);
    } catch (Error &e) {
      e.set_step(step_);
      throw;
    }
    return out;
  }

  step_ = "close";
  try {
    if (branch.local_tip)
      vcs_.delete_branch(branch.name);
  } catch (Error &e) {
    e.set_step(step_);
    throw;
  }
  spdlog::info("[sync] nothing to commit; closing {}", branch.name);
  out.action = SyncAction::Closed;
  return out;
}

SyncOutcome BranchSynchronizer::create(const SyncRequest &req,
                                       const BaseRef &base, const ChangeSet &cs,
                                       const CheckoutState &current) {
  SyncOutcome out;
  out.branch = req.branch;
  WorkspaceLease lease(vcs_, current);
  try {
    step_ = "create";
    const std::string change =
        lease.park(cs, ephemeral_name(req.branch, current.commit));

    if (current.commit == base.commit) {
      vcs_.create_branch(req.branch, change);
      lease.track_target(req.branch, std::nullopt);
    } else {
      vcs_.create_branch(req.branch, base.commit);
      lease.track_target(req.branch, std::nullopt);
      step_ = "create/cherry-pick";
      if (vcs_.cherry_pick(change) == MergeResult::Conflict) {
        vcs_.abort_cherry_pick();
        throw ConflictUnresolved("change does not apply on base " +
                                 base.display());
      }
    }

    out.head = commit_of(vcs_, "HEAD");
    step_ = "create";
    if (!differs_from_base(out.head, base)) {
      spdlog::info("[sync] base {} already contains the change; {} not "
                   "created",
                   base.display(), req.branch);
      lease.discard_target();
      out.head = base.commit;
    } else {
      out.action = SyncAction::Created;
      out.has_diff_with_base = true;
      spdlog::info("[sync] created {} at {}", req.branch, out.head);
    }

    step_ = "restore";
    lease.release();
  } catch (Error &e) {
    e.set_step(step_);
    lease.rollback();
    throw;
  }
  return out;
}

SyncOutcome BranchSynchronizer::update(const SyncRequest &req,
                                       const BaseRef &base,
                                       const BranchRef &branch,
                                       const ChangeSet &cs,
                                       const CheckoutState &current) {
  SyncOutcome out;
  out.branch = branch.name;
  out.expected_remote_tip = branch.remote_tip;
  const std::string tip = *branch.tip();

  WorkspaceLease lease(vcs_, current);
  try {
    step_ = "update";
    const std::string change =
        lease.park(cs, ephemeral_name(branch.name, current.commit));
    vcs_.create_branch(branch.name, tip);
    lease.track_target(branch.name, branch.local_tip);

    step_ = "update/cherry-pick";
    bool picked = vcs_.cherry_pick(change) == MergeResult::Success;
    if (!picked) {
      spdlog::warn("[sync] change conflicts with {} at {}", branch.name, tip);
      vcs_.abort_cherry_pick();
    }
    step_ = "update/compare";
    if (picked && vcs_.tree_hash("HEAD") == vcs_.tree_hash(tip)) {
      spdlog::info("[sync] {} already carries the change at {}", branch.name,
                   tip);
      out.head = tip;
      out.has_diff_with_base = differs_from_base(tip, base);
      lease.discard_target();
      step_ = "restore";
      lease.release();
      return out;
    }

    if (!vcs_.is_ancestor(base.commit, tip)) {
      step_ = "update/rebase";
      if (vcs_.rebase(base.commit) == MergeResult::Success) {
        out.rewritten = true;
        if (!picked) {
          step_ = "update/cherry-pick";
          if (vcs_.cherry_pick(change) == MergeResult::Conflict) {
            vcs_.abort_cherry_pick();
            throw ConflictUnresolved("change conflicts with " + branch.name +
                                     " both before and after rebase onto " +
                                     base.display());
          }
        }
      } else {
        vcs_.abort_rebase();
        if (!picked)
          throw ConflictUnresolved(branch.name + " neither rebases onto " +
                                   base.display() +
                                   " nor takes the change at " + tip);
        spdlog::warn("[sync] rebase of {} onto {} conflicts; keeping the "
                     "change on the existing tip",
                     branch.name, base.display());
      }
    } else if (!picked) {
      step_ = "update/cherry-pick";
      throw ConflictUnresolved("change conflicts with " + branch.name +
                               " which already contains base " +
                               base.display());
    }

    step_ = "update";
    out.head = commit_of(vcs_, "HEAD");
    out.action = SyncAction::Updated;
    out.has_diff_with_base = differs_from_base(out.head, base);
    spdlog::info("[sync] updated {} to {} ({} commit(s) ahead of {}{})",
                 branch.name, out.head, vcs_.count_commits(base.commit, out.head),
                 base.display(), out.rewritten ? ", rebased" : "");

    step_ = "restore";
    lease.release();
  } catch (Error &e) {
    e.set_step(step_);
    lease.rollback();
    throw;
  }
  return out;
}

bool BranchSynchronizer::differs_from_base(const std::string &head,
                                           const BaseRef &base) {
  return vcs_.tree_hash(head) != vcs_.tree_hash(base.commit);
}

std::string BranchSynchronizer::ephemeral_name(const std::string &branch,
                                               const std::string &head) const {
  const std::string key = branch + "\n" + head;
  auto seed = static_cast<XXH64_hash_t>(
      std::chrono::steady_clock::now().time_since_epoch().count() ^ ::getpid());
  auto h = XXH3_64bits_withSeed(key.data(), key.size(), seed);
  return fmt::format("prsync-work-{:016x}", h).substr(0, 22);
}

} // namespace prsync
