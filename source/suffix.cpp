#include <prsync/errors.hpp>
#include <prsync/suffix.hpp>

#include <fmt/format.h>
#include <xxhash.h>

namespace prsync {

SuffixStrategy parse_suffix_strategy(const std::string &value) {
  if (value.empty() || value == "none")
    return SuffixStrategy::None;
  if (value == "random")
    return SuffixStrategy::Random;
  if (value == "timestamp")
    return SuffixStrategy::Timestamp;
  if (value == "short-commit-hash")
    return SuffixStrategy::ShortCommitHash;
  throw ConfigurationError("branch-suffix",
                           "expected none|random|timestamp|short-commit-hash, "
                           "got '" + value + "'");
}

const char *to_string(SuffixStrategy s) {
  switch (s) {
  case SuffixStrategy::None:
    return "none";
  case SuffixStrategy::Random:
    return "random";
  case SuffixStrategy::Timestamp:
    return "timestamp";
  case SuffixStrategy::ShortCommitHash:
    return "short-commit-hash";
  }
  return "none";
}

std::string random_suffix(const std::string &branch, std::uint64_t seed) {
  auto h = XXH3_64bits_withSeed(branch.data(), branch.size(), seed);
  return fmt::format("{:016x}", h).substr(0, 7);
}

std::string timestamp_suffix(std::chrono::system_clock::time_point now) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                  now.time_since_epoch())
                  .count();
  return std::to_string(secs);
}

std::string suffixed_branch(const std::string &branch, SuffixStrategy strategy,
                            const SuffixInputs &in) {
  switch (strategy) {
  case SuffixStrategy::None:
    return branch;
  case SuffixStrategy::Random:
    return branch + "-" + random_suffix(branch, in.seed);
  case SuffixStrategy::Timestamp:
    return branch + "-" + timestamp_suffix(in.now);
  case SuffixStrategy::ShortCommitHash:
    if (in.short_hash.empty())
      throw ConfigurationError("branch-suffix", "no commit hash available");
    return branch + "-" + in.short_hash;
  }
  return branch;
}

} // namespace prsync
