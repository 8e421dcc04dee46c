#pragma once
#include <prsync/cli.hpp>
#include <prsync/hosting.hpp>
#include <prsync/outputs.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace prsync {

// Builds the hosting service for "owner/repo"; may return nullptr to skip
// the pull request step.
using HostingFactory =
    std::function<std::shared_ptr<HostingService>(const std::string &)>;

// One run: config snapshot, capture, synchronize, push, pull request.
class Orchestrator {
public:
  Orchestrator(RunConfig cfg, HostingFactory hosting);

  void set_seed(std::uint64_t seed) { seed_ = seed; }

  RunOutputs run();

private:
  void publish(HostingService &hosting, const SyncOutcome &outcome,
               const std::string &repository, const std::string &base,
               const std::string &verified_head, RunOutputs &out);

  RunConfig cfg_;
  HostingFactory hosting_;
  std::uint64_t seed_;
};

void setup_logging(const RunConfig &cfg);

class App {
public:
  int run(int argc, char **argv);
};

} // namespace prsync
