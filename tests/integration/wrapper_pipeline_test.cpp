#include "internal/runtime/wrapper.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/integrity/integrity_gate.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/recording_broker.hpp"
#include "tests/support/unix_client.hpp"

#ifndef AUKLET_TEST_CHILD
#error "AUKLET_TEST_CHILD must name the instrumented_child executable"
#endif

namespace {

using auklet::process::ChildExit;
using auklet::runtime::Phase;
using auklet::runtime::Wrapper;
using auklet::runtime::WrapperDependencies;
using auklet::testing::BrokerLog;
using auklet::testing::RecordingBroker;

struct Harness {
  std::shared_ptr<BrokerLog>             log = std::make_shared<BrokerLog>();
  std::ostringstream                     child_log;
  std::shared_ptr<std::atomic<int>>      connects = std::make_shared<std::atomic<int>>(0);
  std::filesystem::path                  socket_dir;
  auklet::runtime::config::RuntimeConfig config;

  explicit Harness(const std::string& name) : socket_dir(auklet::testing::MakeSocketDir(name)) {
    config.mutable_topics()->set_event("events");
    config.mutable_topics()->set_profile("profiles");
    config.mutable_ipc()->set_socket_dir(socket_dir.string());
    config.mutable_ipc()->set_max_record_bytes(1024 * 1024);
  }

  WrapperDependencies Dependencies(bool recognized = true) {
    WrapperDependencies deps;
    auto                broker_log = log;
    auto                counter    = connects;
    deps.connect_broker = [broker_log, counter](const auklet::runtime::config::BrokerConfig&) -> std::unique_ptr<auklet::broker::Broker> {
      ++*counter;
      return std::make_unique<RecordingBroker>(broker_log);
    };
    deps.check_release = [recognized](const std::string&) { return recognized; };
    deps.log_sink      = &child_log;
    return deps;
  }
};

google::protobuf::Struct Parse(const std::string& json) {
  google::protobuf::Struct out;
  assert(google::protobuf::util::JsonStringToMessage(json, &out).ok());
  return out;
}

void TestProfilesThenEventAreRelayed() {
  Harness harness("pipeline-ok");
  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "0", R"({"a":1})", R"({"b":2})"}, harness.Dependencies());

  const auto exit = wrapper.Run();
  assert(exit.exit_status == 0);
  assert(exit.signal.empty());
  assert(wrapper.phase() == Phase::kShutdown);

  const auto records = harness.log->Snapshot();
  assert(records.size() == 3);
  assert(records[0].topic == "profiles");
  assert(records[1].topic == "profiles");
  assert(records[2].topic == "events");

  const auto a     = Parse(records[0].value);
  const auto b     = Parse(records[1].value);
  const auto event = Parse(records[2].value);
  assert(a.fields().at("profile").struct_value().fields().at("a").number_value() == 1);
  assert(b.fields().at("profile").struct_value().fields().at("b").number_value() == 2);
  assert(event.fields().at("exit_status").number_value() == 0);
  assert(event.fields().count("signal") == 0);

  const auto digest = auklet::integrity::ComputeDigest(AUKLET_TEST_CHILD);
  std::set<std::string> ids;
  for (const auto* record : {&a, &b, &event}) {
    assert(record->fields().at("checksum").string_value() == digest);
    ids.insert(record->fields().at("uuid").string_value());
  }
  assert(ids.size() == 3);

  assert(harness.child_log.str() == "instrumented child started\n");
  assert(harness.log->closed);
  assert(std::filesystem::is_empty(harness.socket_dir) && "socket files are removed");
}

void TestMalformedDataIsLoggedAndEventStillSent() {
  Harness harness("pipeline-malformed");
  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "5", R"({"a":1})", "not json", R"({"c":3})"},
                  harness.Dependencies());

  const auto exit = wrapper.Run();
  assert(exit.exit_status == 5);

  const auto records = harness.log->Snapshot();
  assert(records.size() == 2);
  assert(records[0].topic == "profiles");
  assert(records[1].topic == "events");
  assert(Parse(records[1].value).fields().at("exit_status").number_value() == 5);
}

void TestChildWithoutDataChannelStillGetsEvent() {
  Harness harness("pipeline-silent");
  Wrapper wrapper(harness.config, {"true"}, harness.Dependencies());

  ChildExit   exit{};
  std::thread runner([&] { exit = wrapper.Run(); });

  // the Event goes out while both listeners still wait for a client
  assert(auklet::testing::WaitFor([&] { return harness.log->Snapshot().size() == 1; }));
  const auto records = harness.log->Snapshot();
  assert(records[0].topic == "events");
  assert(Parse(records[0].value).fields().at("exit_status").number_value() == 0);

  // shutdown waits for each channel's client, so act as the late one
  const auto pid = std::to_string(::getpid());
  for (const auto& [name, type] : {std::pair{"data-", SOCK_STREAM}, std::pair{"log-", SOCK_SEQPACKET}}) {
    const int fd = auklet::testing::ConnectUnix((harness.socket_dir / (name + pid)).string(), type);
    assert(fd >= 0);
    ::close(fd);
  }
  runner.join();

  assert(exit.exit_status == 0);
  assert(harness.log->Snapshot().size() == 1);
  assert(harness.child_log.str().empty());
}

void TestChildWithEmptyDataChannelGetsEvent() {
  Harness harness("pipeline-empty");
  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "7"}, harness.Dependencies());

  const auto exit = wrapper.Run();
  assert(exit.exit_status == 7);

  const auto records = harness.log->Snapshot();
  assert(records.size() == 1);
  assert(records[0].topic == "events");
  assert(Parse(records[0].value).fields().at("exit_status").number_value() == 7);
}

void TestLargeLogPacketIsCopiedWhole() {
  Harness harness("pipeline-biglog");
  ::setenv("INSTRUMENTED_CHILD_LOG_PACKET", "100000", 1);
  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "0"}, harness.Dependencies());
  const auto exit = wrapper.Run();
  ::unsetenv("INSTRUMENTED_CHILD_LOG_PACKET");

  assert(exit.exit_status == 0);
  assert(harness.child_log.str() == "instrumented child started\n" + std::string(100000, 'x'));
}

void TestUnrecognizedExecutableIsAdvisory() {
  Harness harness("pipeline-unrecognized");
  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "0"}, harness.Dependencies(false));

  const auto exit = wrapper.Run();
  assert(exit.exit_status == 0);
  assert(harness.log->Snapshot().size() == 1);
}

void TestReleaseCheckFailureAbortsBeforePipeline() {
  Harness harness("pipeline-integrity");
  auto    deps = harness.Dependencies();
  deps.check_release = [](const std::string&) -> bool { throw auklet::util::IntegrityError("authority answered 503"); };

  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "0"}, deps);
  bool    threw = false;
  try {
    (void)wrapper.Run();
  } catch (const auklet::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(wrapper.phase() == Phase::kDigestCheck);
  assert(harness.connects->load() == 0);
}

void TestBrokerFailureAbortsBeforeChildStarts() {
  Harness harness("pipeline-broker");
  auto    deps = harness.Dependencies();
  deps.connect_broker = [](const auklet::runtime::config::BrokerConfig&) -> std::unique_ptr<auklet::broker::Broker> {
    throw auklet::util::BrokerError("no broker endpoint reachable");
  };

  Wrapper wrapper(harness.config, {AUKLET_TEST_CHILD, "0"}, deps);
  bool    threw = false;
  try {
    (void)wrapper.Run();
  } catch (const auklet::util::BrokerError&) {
    threw = true;
  }
  assert(threw);
  assert(wrapper.phase() == Phase::kPipelineUp);
  assert(harness.child_log.str().empty());
  assert(std::filesystem::is_empty(harness.socket_dir));
}

void TestUnknownCommandIsFatal() {
  Harness harness("pipeline-nocommand");
  Wrapper wrapper(harness.config, {"auklet-no-such-command"}, harness.Dependencies());

  bool threw = false;
  try {
    (void)wrapper.Run();
  } catch (const auklet::util::SupervisorError&) {
    threw = true;
  }
  assert(threw);
  assert(harness.connects->load() == 0);
}

void TestPhaseNames() {
  assert(std::string(auklet::runtime::ToString(Phase::kInit)) == "INIT");
  assert(std::string(auklet::runtime::ToString(Phase::kDigestCheck)) == "DIGEST_CHECK");
  assert(std::string(auklet::runtime::ToString(Phase::kShutdown)) == "SHUTDOWN");
}

} // namespace

int main() {
  auklet::process::ProcessSupervisor::BlockSignals({SIGINT});

  TestProfilesThenEventAreRelayed();
  TestMalformedDataIsLoggedAndEventStillSent();
  TestChildWithoutDataChannelStillGetsEvent();
  TestChildWithEmptyDataChannelGetsEvent();
  TestLargeLogPacketIsCopiedWhole();
  TestUnrecognizedExecutableIsAdvisory();
  TestReleaseCheckFailureAbortsBeforePipeline();
  TestBrokerFailureAbortsBeforeChildStarts();
  TestUnknownCommandIsFatal();
  TestPhaseNames();

  std::cout << "auklet_integration_wrapper_pipeline: pass\n";
  return 0;
}
