#include <prsync/change_capture.hpp>
#include <prsync/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace prsync {

ChangeSet ChangeCapture::capture(const std::vector<std::string> &pathspecs,
                                 const CommitFields &fields) {
  if (!fields.author.complete())
    throw ConfigurationError("author", "identity is not resolved");
  if (!fields.committer.complete())
    throw ConfigurationError("committer", "identity is not resolved");

  ChangeSet cs;
  cs.include = pathspecs;
  cs.message = fields.message;
  cs.author = fields.author;
  cs.committer = fields.committer;
  cs.signoff = fields.signoff;
  cs.sign = fields.sign;

  if (pathspecs.empty()) {
    cs.changed_paths = vcs_.changed_paths({});
  } else {
    for (auto &spec : pathspecs) {
      auto paths = vcs_.changed_paths({spec});
      if (paths.empty()) {
        spdlog::debug("[capture] pathspec '{}' matches no pending change", spec);
        continue;
      }
      cs.matched.push_back(spec);
      for (auto &p : paths) {
        if (std::find(cs.changed_paths.begin(), cs.changed_paths.end(), p) ==
            cs.changed_paths.end())
          cs.changed_paths.push_back(p);
      }
    }
  }

  cs.state = cs.changed_paths.empty() ? CaptureState::Empty
                                      : CaptureState::NonEmpty;
  spdlog::info("[capture] {} changed path(s){}", cs.changed_paths.size(),
               cs.scoped() ? " in scope" : "");
  return cs;
}

} // namespace prsync
