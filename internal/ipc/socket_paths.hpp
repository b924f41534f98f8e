#pragma once

#include <sys/types.h>

#include <string>

namespace auklet::ipc {

// Endpoints the instrumented child connects to. Named after the supervisor's
// pid so concurrent wrappers in one directory never collide.
struct SocketPaths {
  std::string data;
  std::string log;
};

// socket_dir empty means the current working directory. Paths are absolute.
SocketPaths ResolveSocketPaths(const std::string& socket_dir, pid_t pid);

} // namespace auklet::ipc
