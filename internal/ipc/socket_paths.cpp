#include "socket_paths.hpp"

#include <filesystem>

namespace auklet::ipc {

SocketPaths ResolveSocketPaths(const std::string& socket_dir, pid_t pid) {
  std::filesystem::path dir = socket_dir.empty() ? std::filesystem::current_path() : std::filesystem::absolute(socket_dir);

  const auto suffix = std::to_string(pid);
  return SocketPaths{
      .data = (dir / ("data-" + suffix)).string(),
      .log  = (dir / ("log-" + suffix)).string(),
  };
}

} // namespace auklet::ipc
