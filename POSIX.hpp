#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <ios>

#include <sys/socket.h>
#include <unistd.h>

// Thin, timeout aware wrappers over the system calls used by the relay
// client.  Errors are returned as -1 with errno set, never fatal.

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  // Non-blocking connect(2) that waits at most timeout for completion.
  static int connect(int                       fd,
                     sockaddr const*           addr,
                     socklen_t                 addr_len,
                     std::chrono::milliseconds timeout);

  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);
};

#endif // POSIX_DOT_HPP
