#pragma once

#include <sys/types.h>

#include <csignal>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/metrics/metrics_sampler.hpp"
#include "internal/pipeline/object_channel.hpp"

namespace auklet::process {

struct ChildExit {
  int         exit_status = 0; // -1 when terminated by a signal
  std::string signal;          // empty on a normal exit
};

/*
  ProcessSupervisor

  Runs one child to completion. While it runs, every relayed signal the
  supervisor receives is passed on to the child and the wait continues.
  When the child terminates an Event describing the outcome, with a system
  metrics snapshot, is pushed onto the object channel.

  The relayed signals must already be blocked in every thread (BlockSignals
  before any thread is created) so they are only ever delivered through the
  supervisor's signalfd.
*/
class ProcessSupervisor {
 public:
  using Environment = std::vector<std::pair<std::string, std::string>>;

  ProcessSupervisor(std::shared_ptr<pipeline::ObjectChannel> channel, std::shared_ptr<metrics::MetricsSampler> sampler,
                    std::vector<int> relayed_signals = {SIGINT});

  // Blocks the signals for the calling thread and every thread it creates
  // afterwards. Throws SupervisorError.
  static void BlockSignals(const std::vector<int>& signals);

  // argv[0] is passed to the child unchanged; executable is the resolved
  // path. extra_env is added to (or replaces entries of) the inherited
  // environment. Throws SupervisorError if the child cannot be started.
  ChildExit Supervise(const std::string& executable, const std::vector<std::string>& argv, const Environment& extra_env = {});

  // Runs after the child is reaped and before its Event is queued, so that
  // records the child sent before exiting are queued ahead of the Event.
  void OnChildExit(std::function<void()> hook) { on_child_exit_ = std::move(hook); }

  pid_t child_pid() const { return child_pid_; }

 private:
  ChildExit Wait(pid_t pid, int signal_fd);
  void      Forward(pid_t pid, int signal_fd);

  std::shared_ptr<pipeline::ObjectChannel> channel_;
  std::shared_ptr<metrics::MetricsSampler> sampler_;
  std::vector<int>                         relayed_signals_;
  std::function<void()>                    on_child_exit_;
  pid_t                                    child_pid_ = -1;
};

} // namespace auklet::process
