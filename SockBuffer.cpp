#include "SockBuffer.hpp"

#include <cerrno>
#include <ios>
#include <system_error>

#include <glog/logging.h>

SockBuffer::SockBuffer(int                       fd_in,
                       int                       fd_out,
                       std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout)
  : fd_in_(fd_in)
  , fd_out_(fd_out)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout)
{
  POSIX::set_nonblocking(fd_in_);
  POSIX::set_nonblocking(fd_out_);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  auto const read = POSIX::read(fd_in_, s, n, read_timeout_, timed_out_);
  if (read == static_cast<std::streamsize>(-1)) {
    last_errno_ = errno;
    return -1;
  }
  if (read == 0) {
    // boost::iostreams wants -1 for end of stream.
    last_errno_ = ECONNRESET;
    return -1;
  }
  total_octets_read_ += read;
  return read;
}

std::streamsize SockBuffer::write(const char* s, std::streamsize n)
{
  auto const written = POSIX::write(fd_out_, s, n, write_timeout_, timed_out_);
  if (written == static_cast<std::streamsize>(-1)) {
    // Devices report write errors by throwing, the stream turns this
    // into badbit.
    last_errno_ = errno;
    throw std::ios_base::failure(
        "write to socket failed",
        std::error_code(last_errno_, std::system_category()));
  }
  total_octets_written_ += written;
  return written;
}

void SockBuffer::log_totals() const
{
  LOG(INFO) << "total_octets_read_==" << total_octets_read_;
  LOG(INFO) << "total_octets_written_==" << total_octets_written_;
}
