#include <prsync/errors.hpp>
#include <prsync/outputs.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <chrono>
#include <fstream>

namespace prsync {

std::string pull_request_operation(SyncAction action, bool created_pr,
                                   bool existing_pr) {
  if (action == SyncAction::Closed)
    return "closed";
  if (created_pr)
    return "created";
  if (existing_pr &&
      (action == SyncAction::Created || action == SyncAction::Updated))
    return "updated";
  return "none";
}

std::vector<std::pair<std::string, std::string>>
output_fields(const RunOutputs &o) {
  return {
      {"pull-request-number", o.number ? std::to_string(*o.number) : ""},
      {"pull-request-url", o.url},
      {"pull-request-operation", o.operation},
      {"pull-request-head-sha", o.head_sha},
      {"pull-request-branch", o.branch},
      {"pull-request-commits-verified", o.commits_verified ? "true" : "false"},
  };
}

static std::string make_delimiter(const std::string &content) {
  auto seed = static_cast<XXH64_hash_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
  for (;;) {
    auto d = fmt::format("ghadelimiter_{:016x}",
                         XXH3_64bits_withSeed(content.data(), content.size(),
                                              seed++));
    if (content.find(d) == std::string::npos)
      return d;
  }
}

void write_outputs(const RunOutputs &o,
                   const std::optional<std::filesystem::path> &file,
                   std::ostream &fallback) {
  auto fields = output_fields(o);
  if (!file) {
    for (auto &[k, v] : fields)
      fallback << k << "=" << v << "\n";
    return;
  }

  std::ofstream out(*file, std::ios::app);
  if (!out)
    throw ConfigurationError("GITHUB_OUTPUT", "cannot open " + file->string());
  for (auto &[k, v] : fields) {
    auto delim = make_delimiter(v);
    out << k << "<<" << delim << "\n" << v << "\n" << delim << "\n";
  }
  spdlog::debug("[prsync] outputs written to {}", file->string());
}

} // namespace prsync
