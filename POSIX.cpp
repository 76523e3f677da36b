#include "POSIX.hpp"

#include <cerrno>

#include <glog/logging.h>

#include <fcntl.h>
#include <sys/select.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace {
timeval as_timeval(milliseconds wait)
{
  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;
  return tv;
}
} // namespace

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_in, &fds);

  auto tv{as_timeval(wait)};

  int puts;
  while ((puts = select(fd_in + 1, &fds, nullptr, nullptr, &tv)) == -1) {
    PCHECK(errno == EINTR) << "select(2) failed";
  }

  return 0 != puts;
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_out, &fds);

  auto tv{as_timeval(wait)};

  int puts;
  while ((puts = select(fd_out + 1, nullptr, &fds, nullptr, &tv)) == -1) {
    PCHECK(errno == EINTR) << "select(2) failed";
  }

  return 0 != puts;
}

int POSIX::connect(int             fd,
                   sockaddr const* addr,
                   socklen_t       addr_len,
                   milliseconds    timeout)
{
  set_nonblocking(fd);

  if (::connect(fd, addr, addr_len) == 0)
    return 0;

  if (errno != EINPROGRESS)
    return -1;

  if (!output_ready(fd, timeout)) {
    errno = ETIMEDOUT;
    return -1;
  }

  int       so_error = 0;
  socklen_t len      = sizeof(so_error);
  PCHECK(getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0);
  if (so_error) {
    errno = so_error;
    return -1;
  }
  return 0;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = system_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: continue; // try read again

    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      break;

    default: PLOG(WARNING) << "read(2) failed"; return -1;
    }

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o   = true;
    errno = ETIMEDOUT;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = system_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    // MSG_NOSIGNAL: a peer that went away is an error, not a SIGPIPE.
    auto const n_ret
        = ::send(fd, static_cast<const void*>(s), n - written, MSG_NOSIGNAL);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EAGAIN:
#if EWOULDBLOCK != EAGAIN
      case EWOULDBLOCK:
#endif
        break;

      default: PLOG(WARNING) << "send(2) failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o   = true;
    errno = ETIMEDOUT;
    LOG(WARNING) << "send(2) timed out";
    return -1;
  }
}
