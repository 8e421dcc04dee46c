#pragma once
#include <prsync/types.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace prsync {

struct RunOutputs {
  std::optional<int> number;
  std::string url;
  std::string operation = "none"; // created | updated | closed | none
  std::string head_sha;
  std::string branch;
  bool commits_verified = false;
};

// created: pull request opened by this run; updated: an existing one whose
// branch was created or updated; closed: branch closed
std::string pull_request_operation(SyncAction action, bool created_pr,
                                   bool existing_pr);

std::vector<std::pair<std::string, std::string>>
output_fields(const RunOutputs &o);

// Appends name<<delimiter blocks to `file`, or prints name=value lines to
// `fallback` when no file is given.
void write_outputs(const RunOutputs &o,
                   const std::optional<std::filesystem::path> &file,
                   std::ostream &fallback);

} // namespace prsync
