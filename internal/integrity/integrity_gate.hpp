#pragma once

#include <chrono>
#include <string>

namespace auklet::integrity {

// Lowercase hex SHA-512/224 of the file contents. Throws IntegrityError.
std::string ComputeDigest(const std::string& path);

/*
  IntegrityGate

  Asks the release authority whether a digest belongs to a known build:
  GET <base_url>/check_releases/<digest>. 200 means recognized, 404 means
  unknown. Any other status, or a transport failure, throws IntegrityError.
*/
class IntegrityGate {
 public:
  IntegrityGate(std::string base_url, std::chrono::milliseconds timeout);

  bool IsRecognized(const std::string& digest) const;

 private:
  std::string               base_url_;
  std::chrono::milliseconds timeout_;
};

} // namespace auklet::integrity
