#include "executable.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "internal/util/errors.hpp"

namespace auklet::process {

namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

bool IsExecutableFile(const std::string& path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::string ResolveExecutable(const std::string& command) {
  if (command.empty()) {
    throw util::SupervisorError("empty command");
  }

  if (command.find('/') != std::string::npos) {
    if (!IsExecutableFile(command)) {
      throw util::SupervisorError("not an executable file: " + command);
    }
    return command;
  }

  const char*        env = std::getenv("PATH");
  std::istringstream dirs(env != nullptr && *env != '\0' ? env : kDefaultPath);
  std::string        dir;
  while (std::getline(dirs, dir, ':')) {
    const std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + command;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }

  throw util::SupervisorError("executable not found in PATH: " + command);
}

std::string SignalName(int signo) {
  const char* text = ::strsignal(signo);
  std::string name = text != nullptr ? text : "signal " + std::to_string(signo);
  for (auto& c : name) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return name;
}

} // namespace auklet::process
