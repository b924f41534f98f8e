#include "internal/integrity/integrity_gate.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using auklet::integrity::ComputeDigest;
using auklet::integrity::IntegrityGate;

/*
  Minimal HTTP/1.1 responder on 127.0.0.1. The status of each reply is
  picked from the request path; every request path is recorded.
*/
class ReleaseAuthority {
 public:
  ReleaseAuthority() {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    assert(fd_ >= 0);

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    assert(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd_, 8) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { Serve(); });
  }

  ~ReleaseAuthority() {
    ::shutdown(fd_, SHUT_RDWR);
    thread_.join();
    ::close(fd_);
  }

  std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::vector<std::string> paths() {
    std::lock_guard lock(mutex_);
    return paths_;
  }

 private:
  void Serve() {
    while (true) {
      const int conn = ::accept(fd_, nullptr, nullptr);
      if (conn < 0) {
        return;
      }

      std::string request;
      char        buf[1024];
      while (request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
        if (n <= 0) {
          break;
        }
        request.append(buf, static_cast<std::size_t>(n));
      }

      const auto        start = request.find(' ') + 1;
      const std::string path  = request.substr(start, request.find(' ', start) - start);
      {
        std::lock_guard lock(mutex_);
        paths_.push_back(path);
      }

      std::string status = "500 Internal Server Error";
      if (path.find("known-") != std::string::npos && path.find("unknown-") == std::string::npos) {
        status = "200 OK";
      } else if (path.find("unknown-") != std::string::npos) {
        status = "404 Not Found";
      }

      const std::string reply = "HTTP/1.1 " + status + "\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
      ::send(conn, reply.data(), reply.size(), MSG_NOSIGNAL);
      ::close(conn);
    }
  }

  int                      fd_   = -1;
  int                      port_ = 0;
  std::thread              thread_;
  std::mutex               mutex_;
  std::vector<std::string> paths_;
};

std::filesystem::path WriteFile(const std::string& name, const std::string& contents) {
  const auto dir = std::filesystem::temp_directory_path() / "auklet_integrity_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << contents;
  return path;
}

void TestDigestMatchesKnownVector() {
  const auto path = WriteFile("abc.bin", "abc");
  assert(ComputeDigest(path.string()) == "4634270f707b6a54daae7530460842e20e37ed265ceee9a43e8924aa");

  const auto empty = WriteFile("empty.bin", "");
  assert(ComputeDigest(empty.string()) == "6ed0dd02806fa89e25de060c19d3ac86cabb87d6a0ddd05c333b84f4");
}

void TestDigestOfLargeFileIsStable() {
  const auto path   = WriteFile("large.bin", std::string(200 * 1024, 'z'));
  const auto first  = ComputeDigest(path.string());
  const auto second = ComputeDigest(path.string());
  assert(first == second);
  assert(first.size() == 56);
}

void TestUnreadableExecutableIsIntegrityError() {
  bool threw = false;
  try {
    (void)ComputeDigest("/nonexistent/auklet-binary");
  } catch (const auklet::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
}

void TestStatusCodesMapToAnswer() {
  ReleaseAuthority authority;
  IntegrityGate    gate(authority.base_url() + "/", std::chrono::seconds(5));

  assert(gate.IsRecognized("known-digest"));
  assert(!gate.IsRecognized("unknown-digest"));

  bool threw = false;
  try {
    (void)gate.IsRecognized("broken-digest");
  } catch (const auklet::util::IntegrityError&) {
    threw = true;
  }
  assert(threw && "statuses other than 200 and 404 are fatal");

  const auto paths = authority.paths();
  assert(paths.size() == 3);
  assert(paths[0] == "/check_releases/known-digest");
  assert(paths[1] == "/check_releases/unknown-digest");
}

void TestUnreachableAuthorityIsIntegrityError() {
  IntegrityGate gate("http://127.0.0.1:1", std::chrono::seconds(2));

  bool threw = false;
  try {
    (void)gate.IsRecognized("known-digest");
  } catch (const auklet::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDigestMatchesKnownVector();
  TestDigestOfLargeFileIsStable();
  TestUnreadableExecutableIsIntegrityError();
  TestStatusCodesMapToAnswer();
  TestUnreachableAuthorityIsIntegrityError();

  std::cout << "auklet_unit_integrity_gate: pass\n";
  return 0;
}
