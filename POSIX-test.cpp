#include "POSIX.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <glog/logging.h>

#include <netinet/in.h>
#include <sys/socket.h>

using std::chrono::milliseconds;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], milliseconds(1)));
  CHECK(POSIX::output_ready(fds[1], milliseconds(1)));

  auto t_o = false;

  char const msg[] = "220 ready\r\n";
  CHECK_EQ(POSIX::write(fds[1], msg, sizeof(msg) - 1, milliseconds(100), t_o),
           static_cast<std::streamsize>(sizeof(msg) - 1));
  CHECK(!t_o);

  CHECK(POSIX::input_ready(fds[0], milliseconds(100)));
  char bfr[64];
  auto const n = POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(100), t_o);
  CHECK_EQ(n, static_cast<std::streamsize>(sizeof(msg) - 1));
  CHECK_EQ(std::string(bfr, n), msg);
  CHECK(!t_o);

  // Nothing more to read: times out.
  CHECK_EQ(POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(10), t_o), -1);
  CHECK(t_o);
  CHECK_EQ(errno, ETIMEDOUT);

  // Peer closed: read returns 0, write fails without SIGPIPE.
  close(fds[1]);
  t_o = false;
  CHECK_EQ(POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(100), t_o), 0);
  CHECK_EQ(POSIX::write(fds[0], msg, sizeof(msg) - 1, milliseconds(100), t_o),
           -1);
  CHECK(!t_o);
  close(fds[0]);

  // Connect to a port nobody is listening on.
  auto const lfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lfd >= 0);
  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(lfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  socklen_t len = sizeof(sin);
  PCHECK(getsockname(lfd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  close(lfd);

  auto const cfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(cfd >= 0);
  CHECK_EQ(POSIX::connect(cfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin),
                          milliseconds(1000)),
           -1);
  CHECK_EQ(errno, ECONNREFUSED) << strerror(errno);
  close(cfd);
}
