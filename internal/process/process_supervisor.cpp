#include "process_supervisor.hpp"

#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/signalfd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <set>

#include "internal/model/event.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/executable.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

extern char** environ;

namespace auklet::process {

using observability::IntField;
using observability::StringField;

namespace {

class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&)            = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }

 private:
  int fd_;
};

class SpawnAttr {
 public:
  SpawnAttr() { ::posix_spawnattr_init(&attr_); }
  ~SpawnAttr() { ::posix_spawnattr_destroy(&attr_); }

  SpawnAttr(const SpawnAttr&)            = delete;
  SpawnAttr& operator=(const SpawnAttr&) = delete;

  posix_spawnattr_t* get() { return &attr_; }

 private:
  posix_spawnattr_t attr_;
};

sigset_t MakeSet(const std::vector<int>& signals) {
  sigset_t set;
  sigemptyset(&set);
  for (int signo : signals) {
    sigaddset(&set, signo);
  }
  return set;
}

std::vector<std::string> BuildEnvironment(const ProcessSupervisor::Environment& extra) {
  std::set<std::string> overridden;
  for (const auto& [key, value] : extra) {
    overridden.insert(key);
  }

  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string kv(*entry);
    const auto        eq = kv.find('=');
    if (overridden.count(kv.substr(0, eq)) == 0) {
      env.push_back(kv);
    }
  }
  for (const auto& [key, value] : extra) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> ToCStrings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& v : values) {
    out.push_back(v.data());
  }
  out.push_back(nullptr);
  return out;
}

int PidfdOpen(pid_t pid) {
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
}

int WaitStatus(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw util::SupervisorError(util::ErrnoMessage("waitpid"));
    }
  }
  return status;
}

} // namespace

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<pipeline::ObjectChannel> channel,
                                     std::shared_ptr<metrics::MetricsSampler> sampler, std::vector<int> relayed_signals)
    : channel_(std::move(channel)), sampler_(std::move(sampler)), relayed_signals_(std::move(relayed_signals)) {}

void ProcessSupervisor::BlockSignals(const std::vector<int>& signals) {
  const sigset_t set = MakeSet(signals);
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
    throw util::SupervisorError("pthread_sigmask failed: " + std::string(std::strerror(rc)));
  }
}

ChildExit ProcessSupervisor::Supervise(const std::string& executable, const std::vector<std::string>& argv,
                                       const Environment& extra_env) {
  if (argv.empty()) {
    throw util::SupervisorError("empty command line");
  }

  BlockSignals(relayed_signals_);
  const sigset_t relayed = MakeSet(relayed_signals_);

  ScopedFd signal_fd(::signalfd(-1, &relayed, SFD_CLOEXEC | SFD_NONBLOCK));
  if (signal_fd.get() < 0) {
    throw util::SupervisorError(util::ErrnoMessage("signalfd"));
  }

  // the child starts with no blocked signals and default dispositions
  SpawnAttr attr;
  sigset_t  empty;
  sigemptyset(&empty);
  ::posix_spawnattr_setsigmask(attr.get(), &empty);
  ::posix_spawnattr_setsigdefault(attr.get(), &relayed);
  ::posix_spawnattr_setflags(attr.get(), POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  std::vector<std::string> args = argv;
  std::vector<std::string> env  = BuildEnvironment(extra_env);
  auto                     c_args = ToCStrings(args);
  auto                     c_env  = ToCStrings(env);

  pid_t pid = -1;
  if (const int rc = ::posix_spawn(&pid, executable.c_str(), nullptr, attr.get(), c_args.data(), c_env.data()); rc != 0) {
    throw util::SupervisorError("failed to start " + executable + ": " + std::strerror(rc));
  }
  child_pid_ = pid;
  sampler_->Prime();
  AUKLET_LOG_INFO("child started", {StringField("executable", executable), IntField("pid", pid)});

  const ChildExit exit = Wait(pid, signal_fd.get());
  AUKLET_LOG_INFO("child exited", {IntField("pid", pid), IntField("exit_status", exit.exit_status),
                                   StringField("signal", exit.signal)});

  const auto exited_at = util::Now();
  const auto metrics   = sampler_->Sample();
  if (on_child_exit_) {
    on_child_exit_();
  }

  channel_->Send(std::make_unique<model::Event>(exited_at, exit.exit_status, exit.signal, metrics));
  return exit;
}

ChildExit ProcessSupervisor::Wait(pid_t pid, int signal_fd) {
  ScopedFd pid_fd(PidfdOpen(pid));
  if (pid_fd.get() < 0) {
    const auto msg = util::ErrnoMessage("pidfd_open");
    ::kill(pid, SIGKILL);
    WaitStatus(pid);
    throw util::SupervisorError(msg);
  }

  pollfd fds[2] = {
      {.fd = pid_fd.get(), .events = POLLIN, .revents = 0},
      {.fd = signal_fd, .events = POLLIN, .revents = 0},
  };

  while (true) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw util::SupervisorError(util::ErrnoMessage("poll"));
    }
    if (fds[1].revents & POLLIN) {
      Forward(pid, signal_fd);
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      break;
    }
  }

  const int status = WaitStatus(pid);
  if (WIFSIGNALED(status)) {
    return ChildExit{.exit_status = -1, .signal = SignalName(WTERMSIG(status))};
  }
  return ChildExit{.exit_status = WEXITSTATUS(status), .signal = {}};
}

void ProcessSupervisor::Forward(pid_t pid, int signal_fd) {
  signalfd_siginfo info{};
  while (::read(signal_fd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
    const int signo = static_cast<int>(info.ssi_signo);
    if (::kill(pid, signo) < 0) {
      AUKLET_LOG_WARN("signal forwarding failed", {StringField("signal", SignalName(signo)),
                                                   StringField("error", std::strerror(errno))});
      continue;
    }
    AUKLET_LOG_INFO("signal forwarded", {StringField("signal", SignalName(signo)), IntField("pid", pid)});
  }
}

} // namespace auklet::process
