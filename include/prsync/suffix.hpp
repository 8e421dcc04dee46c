#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace prsync {

enum class SuffixStrategy { None, Random, Timestamp, ShortCommitHash };

// "none", "random", "timestamp", "short-commit-hash"
SuffixStrategy parse_suffix_strategy(const std::string &value);
const char *to_string(SuffixStrategy s);

struct SuffixInputs {
  std::uint64_t seed = 0;
  std::chrono::system_clock::time_point now{};
  std::string short_hash; // abbreviated HEAD
};

std::string random_suffix(const std::string &branch, std::uint64_t seed);
std::string timestamp_suffix(std::chrono::system_clock::time_point now);

// branch, or branch + "-" + suffix
std::string suffixed_branch(const std::string &branch, SuffixStrategy strategy,
                            const SuffixInputs &in);

} // namespace prsync
