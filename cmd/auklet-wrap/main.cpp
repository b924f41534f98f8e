#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/runtime/wrapper.hpp"

namespace {

struct Arguments {
  std::optional<std::string> config_path;
  std::vector<std::string>   command;
};

void PrintUsage(std::ostream& out) {
  out << "Usage: auklet-wrap [--config <config.yaml>] [--] command [args ...]" << std::endl;
}

// nullopt on a usage error
std::optional<Arguments> ParseArguments(int argc, char** argv) {
  Arguments args;
  int       i = 1;
  while (i < argc) {
    const std::string arg = argv[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      args.config_path = argv[i + 1];
      i += 2;
      continue;
    }
    if (arg.rfind("--config=", 0) == 0) {
      args.config_path = arg.substr(9);
      ++i;
      continue;
    }
    if (arg.size() > 1 && arg[0] == '-') {
      return std::nullopt;
    }
    break;
  }

  for (; i < argc; ++i) {
    args.command.emplace_back(argv[i]);
  }
  if (args.command.empty()) {
    return std::nullopt;
  }
  return args;
}

void ShutdownObservability() {
  auklet::observability::ShutdownLogging();
  auklet::observability::ShutdownMetrics();
  auklet::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArguments(argc, argv);
  if (!args) {
    PrintUsage(std::cerr);
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Relayed signals go to the supervisor's signalfd only. Blocked
    // before any exporter or component thread exists.
    // ------------------------------------------------------------
    auklet::process::ProcessSupervisor::BlockSignals({SIGINT});

    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = auklet::config::ConfigLoader::Load(args->config_path);

    auklet::observability::InitializeTracing(config);
    auklet::observability::InitializeMetrics(config);
    auklet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Run the child under supervision
    // ------------------------------------------------------------
    auklet::runtime::Wrapper wrapper(std::move(config), args->command);
    const auto               exit = wrapper.Run();

    AUKLET_LOG_INFO("auklet-wrap finished", {auklet::observability::IntField("child_exit_status", exit.exit_status),
                                             auklet::observability::StringField("child_signal", exit.signal)});
    ShutdownObservability();
  } catch (const std::exception& e) {
    AUKLET_LOG_ERROR("Fatal error", {auklet::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
