#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/broker/broker.hpp"
#include "internal/process/process_supervisor.hpp"

namespace auklet::runtime {

enum class Phase {
  kInit,
  kDigestCheck,
  kPipelineUp,
  kSupervising,
  kDraining,
  kShutdown,
};

const char* ToString(Phase phase);

/*
  WrapperDependencies

  Outside-world seams of a run. Left empty, Wrapper connects the gRPC broker,
  asks the configured release authority and writes child logs to stdout.
*/
struct WrapperDependencies {
  std::function<std::unique_ptr<broker::Broker>(const auklet::runtime::config::BrokerConfig&)> connect_broker;
  std::function<bool(const std::string& digest)>                                              check_release;
  std::ostream*                                                                               log_sink = nullptr;
};

/*
  Wrapper

  Composition root and lifecycle of one supervised run:

    INIT -> DIGEST_CHECK -> PIPELINE_UP -> SUPERVISING -> DRAINING -> SHUTDOWN

  Anything thrown before DRAINING is fatal and propagates out of Run(), with
  the components already started torn down by their destructors. Errors
  reported while draining are logged and never escalate.

  The relayed signals must be blocked before any thread exists, see
  ProcessSupervisor::BlockSignals.
*/
class Wrapper {
 public:
  Wrapper(auklet::runtime::config::RuntimeConfig config, std::vector<std::string> command, WrapperDependencies deps = {});

  process::ChildExit Run();

  Phase phase() const { return phase_; }

 private:
  void Enter(Phase phase);

  auklet::runtime::config::RuntimeConfig config_;
  std::vector<std::string>               command_;
  WrapperDependencies                    deps_;
  Phase                                  phase_ = Phase::kInit;
};

} // namespace auklet::runtime
