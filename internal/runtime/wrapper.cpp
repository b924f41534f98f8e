#include "wrapper.hpp"

#include <unistd.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "internal/broker/grpc_broker.hpp"
#include "internal/integrity/integrity_gate.hpp"
#include "internal/ipc/data_channel_listener.hpp"
#include "internal/ipc/log_channel_listener.hpp"
#include "internal/ipc/socket_paths.hpp"
#include "internal/metrics/metrics_sampler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/object_channel.hpp"
#include "internal/process/executable.hpp"
#include "internal/relay/outbound_relay.hpp"
#include "internal/relay/relay_context.hpp"
#include "internal/util/errors.hpp"

namespace auklet::runtime {

using observability::IntField;
using observability::StringField;

namespace {

template <typename Component>
void CloseAndLog(const char* name, Component& component) {
  try {
    component.Close();
  } catch (const std::exception& e) {
    AUKLET_LOG_ERROR("component closed with error", {StringField("component", name), StringField("error", e.what())});
  }
}

} // namespace

const char* ToString(Phase phase) {
  switch (phase) {
  case Phase::kInit:
    return "INIT";
  case Phase::kDigestCheck:
    return "DIGEST_CHECK";
  case Phase::kPipelineUp:
    return "PIPELINE_UP";
  case Phase::kSupervising:
    return "SUPERVISING";
  case Phase::kDraining:
    return "DRAINING";
  case Phase::kShutdown:
    return "SHUTDOWN";
  }
  return "UNKNOWN";
}

Wrapper::Wrapper(auklet::runtime::config::RuntimeConfig config, std::vector<std::string> command, WrapperDependencies deps)
    : config_(std::move(config)), command_(std::move(command)), deps_(std::move(deps)) {
  if (!deps_.connect_broker) {
    deps_.connect_broker = [](const auklet::runtime::config::BrokerConfig& broker) -> std::unique_ptr<broker::Broker> {
      return broker::GrpcBroker::Connect(broker);
    };
  }
  if (!deps_.check_release) {
    const auto& integrity = config_.integrity();
    auto gate = std::make_shared<integrity::IntegrityGate>(integrity.base_url(), std::chrono::milliseconds(integrity.timeout_ms()));
    deps_.check_release = [gate](const std::string& digest) { return gate->IsRecognized(digest); };
  }
  if (deps_.log_sink == nullptr) {
    deps_.log_sink = &std::cout;
  }
}

void Wrapper::Enter(Phase phase) {
  phase_ = phase;
  AUKLET_LOG_DEBUG("lifecycle", {StringField("phase", ToString(phase))});
}

process::ChildExit Wrapper::Run() {
  if (phase_ != Phase::kInit) {
    throw util::InvalidState("wrapper already ran");
  }
  if (command_.empty()) {
    throw util::SupervisorError("no command to run");
  }

  // ------------------------------------------------------------
  // Executable digest
  // ------------------------------------------------------------
  Enter(Phase::kDigestCheck);
  const std::string executable = process::ResolveExecutable(command_.front());

  auto context      = std::make_shared<relay::RelayContext>();
  context->checksum = integrity::ComputeDigest(executable);
  context->topics   = model::Topics{.event = config_.topics().event(), .profile = config_.topics().profile()};

  if (deps_.check_release(context->checksum)) {
    AUKLET_LOG_INFO("executable recognized", {StringField("executable", executable), StringField("digest", context->checksum)});
  } else {
    AUKLET_LOG_WARN("executable not recognized by release authority",
                    {StringField("executable", executable), StringField("digest", context->checksum)});
  }

  // ------------------------------------------------------------
  // Pipeline: relay, then data and log channels
  // ------------------------------------------------------------
  Enter(Phase::kPipelineUp);
  auto channel = std::make_shared<pipeline::ObjectChannel>(config_.relay().queue_capacity());

  relay::OutboundRelay relay(std::shared_ptr<const relay::RelayContext>(std::move(context)), channel,
                             deps_.connect_broker(config_.broker()));
  relay.Start();

  const auto paths = ipc::ResolveSocketPaths(config_.ipc().socket_dir(), ::getpid());

  ipc::DataChannelListener data(paths.data, channel, config_.ipc().max_record_bytes());
  data.Start();

  ipc::LogChannelListener log(paths.log, *deps_.log_sink);
  log.Start();

  // ------------------------------------------------------------
  // Child
  // ------------------------------------------------------------
  Enter(Phase::kSupervising);
  auto sampler = std::make_shared<metrics::MetricsSampler>();
  process::ProcessSupervisor supervisor(channel, sampler);
  supervisor.OnChildExit([&data] {
    if (!data.WaitIfConnected()) {
      AUKLET_LOG_DEBUG("child exited without opening the data channel");
    }
  });

  const process::ChildExit exit = supervisor.Supervise(executable, command_,
                                                       {
                                                           {"AUKLET_DATA_SOCKET", paths.data},
                                                           {"AUKLET_LOG_SOCKET", paths.log},
                                                           {"AUKLET_SUPERVISOR_PID", std::to_string(::getpid())},
                                                       });

  // ------------------------------------------------------------
  // Drain, then close in reverse start order
  // ------------------------------------------------------------
  Enter(Phase::kDraining);
  channel->Close();

  Enter(Phase::kShutdown);
  CloseAndLog("log channel", log);
  CloseAndLog("data channel", data);
  CloseAndLog("outbound relay", relay);

  AUKLET_LOG_INFO("shutdown complete", {IntField("profiles", static_cast<std::int64_t>(data.records())),
                                        IntField("delivered", static_cast<std::int64_t>(relay.delivered()))});
  return exit;
}

} // namespace auklet::runtime
