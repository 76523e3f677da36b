#include "SockBuffer.hpp"

#include <cerrno>
#include <chrono>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  boost::iostreams::stream<SockBuffer> ours{fds[0], fds[0], 100ms, 100ms};
  boost::iostreams::stream<SockBuffer> theirs{fds[1], fds[1], 100ms, 100ms};

  ours << "EHLO example.com\r\n" << std::flush;
  CHECK(ours.good());

  std::string line;
  CHECK(std::getline(theirs, line));
  CHECK_EQ(line, "EHLO example.com\r");

  theirs << "250 OK\r\n" << std::flush;
  CHECK(std::getline(ours, line));
  CHECK_EQ(line, "250 OK\r");

  // Nothing more is coming.
  CHECK(!std::getline(ours, line));
  CHECK(ours->timed_out());

  ours->log_totals();

  // Other end hangs up.
  PCHECK(close(fds[1]) == 0);
  boost::iostreams::stream<SockBuffer> again{fds[0], fds[0], 100ms, 100ms};
  CHECK(!std::getline(again, line));
  CHECK(!again->timed_out());
  CHECK_EQ(again->last_errno(), ECONNRESET);

  // Writes now fail, the stream goes bad rather than throwing.
  again.clear();
  again << "QUIT\r\n" << std::flush;
  CHECK(!again.good());
  CHECK_EQ(again->last_errno(), EPIPE);

  PCHECK(close(fds[0]) == 0);
}
