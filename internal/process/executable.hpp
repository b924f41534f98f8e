#pragma once

#include <string>

namespace auklet::process {

// Looks the command up on PATH the way execvp does. A name containing '/' is
// taken as given. Throws SupervisorError when nothing executable is found.
std::string ResolveExecutable(const std::string& command);

// Lowercase description of a signal number: "interrupt", "killed", ...
std::string SignalName(int signo);

} // namespace auklet::process
