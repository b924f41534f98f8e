#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace auklet::ipc {

/*
  Unix socket that serves exactly one client for the life of the process.

  Start() binds and listens, then a background thread accepts the first
  connection, closes the listening socket so later clients are refused, and
  hands the connection to the session callback. The session runs until it
  returns or throws.

  Close() waits for the session to end on its own (client EOF), then removes
  the socket and rethrows whatever the session threw. A client that never
  connects or never closes keeps Close() waiting.

  WaitIfConnected() waits for the session only when a client has connected or
  is queued on the listening socket; otherwise it returns false at once.
*/
class SessionListener {
 public:
  using Session = std::function<void(int fd)>;

  SessionListener(std::string name, std::string path, int socket_type, Session session);
  ~SessionListener();

  SessionListener(const SessionListener&)            = delete;
  SessionListener& operator=(const SessionListener&) = delete;

  // Throws IpcError if the socket cannot be bound.
  void Start();

  // Blocks until the session has ended. The socket stays in place.
  void Wait();

  bool WaitIfConnected();

  void Close();

  const std::string& path() const { return path_; }

 private:
  void Run();
  void Abort();
  void Release();

  const std::string name_;
  const std::string path_;
  const int         socket_type_;
  Session           session_;

  std::mutex fd_mutex_;
  int        listen_fd_ = -1;
  int        conn_fd_   = -1;
  bool       bound_     = false;
  bool       accepted_  = false;
  bool       finished_  = false;

  std::condition_variable finished_cv_;

  std::thread        thread_;
  std::exception_ptr error_;
};

} // namespace auklet::ipc
