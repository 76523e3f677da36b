#ifndef SOCKBUFFER_DOT_HPP
#define SOCKBUFFER_DOT_HPP

#include <chrono>
#include <streambuf>

#include "POSIX.hpp"

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace Config {
constexpr std::chrono::seconds default_read_timeout{30};
constexpr std::chrono::seconds default_write_timeout{30};
} // namespace Config

// A bidirectional boost::iostreams device over a pair of file
// descriptors, with read and write timeouts.  Does not own the fds.

class SockBuffer
  : public boost::iostreams::device<boost::iostreams::bidirectional> {
public:
  SockBuffer(int                       fd_in,
             int                       fd_out,
             std::chrono::milliseconds read_timeout
             = Config::default_read_timeout,
             std::chrono::milliseconds write_timeout
             = Config::default_write_timeout);

  SockBuffer& operator=(const SockBuffer&) = delete;
  SockBuffer(SockBuffer const& that) = default;

  bool input_ready(std::chrono::milliseconds wait) const
  {
    return POSIX::input_ready(fd_in_, wait);
  }
  bool timed_out() const { return timed_out_; }

  // errno of the last failed read or write, 0 if none.
  int last_errno() const { return last_errno_; }

  std::streamsize read(char* s, std::streamsize n);
  std::streamsize write(const char* s, std::streamsize n);

  void log_totals() const;

private:
  int fd_in_;
  int fd_out_;

  std::streamsize total_octets_read_{0};
  std::streamsize total_octets_written_{0};

  std::chrono::milliseconds read_timeout_;
  std::chrono::milliseconds write_timeout_;

  bool timed_out_{false};
  int  last_errno_{0};
};

#endif // SOCKBUFFER_DOT_HPP
