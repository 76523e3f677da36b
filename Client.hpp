#ifndef CLIENT_DOT_HPP
#define CLIENT_DOT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "SockBuffer.hpp"

namespace SMTP {

struct refusal {
  int         code;
  std::string message;

  bool operator==(refusal const& rhs) const
  {
    return (code == rhs.code) && (message == rhs.message);
  }
  bool operator!=(refusal const& rhs) const { return !(*this == rhs); }
};

// Recipient address to (code, message) for every recipient the
// receiving server would not take.
using refused_t = std::map<std::string, refusal>;

struct reply {
  int         code{0};
  std::string text; // lines joined with '\n'
};

// An SMTP level failure.  Carries the reply code and text when the
// server gave us one.
class error : public std::runtime_error {
public:
  explicit error(std::string const& what)
    : std::runtime_error(what)
  {
  }
  error(std::string const& what, reply const& rep)
    : std::runtime_error(what)
    , code_(rep.code)
    , reply_(rep.text)
  {
  }

  std::optional<int> const&         code() const { return code_; }
  std::optional<std::string> const& reply() const { return reply_; }

private:
  std::optional<int>         code_;
  std::optional<std::string> reply_;
};

// Every recipient was refused, nothing was sent.
class recipients_refused : public std::runtime_error {
public:
  explicit recipients_refused(refused_t recipients)
    : std::runtime_error("all recipients refused")
    , recipients_(std::move(recipients))
  {
  }

  refused_t const& recipients() const { return recipients_; }

private:
  refused_t recipients_;
};

// A single client session with one SMTP server.  Socket failures and
// time outs are thrown as std::system_error, SMTP failures as
// SMTP::error.

class Client {
public:
  Client(std::string host, uint16_t port);
  ~Client();

  Client(Client const&) = delete;
  Client& operator=(Client const&) = delete;

  // Connect and read the greeting.
  void connect();

  // Submit one message.  Returns the recipients that were refused when
  // at least one was accepted, throws recipients_refused when none was.
  refused_t sendmail(std::string_view                from,
                     std::vector<std::string> const& to,
                     std::string_view                msg);

  // Say goodbye and close.  Never throws.
  void quit();

  bool connected() const { return fd_ != -1; }

  bool has_extension(char const* name) const
  {
    return ehlo_params_.find(name) != ehlo_params_.end();
  }

private:
  reply command_(std::string_view cmd);
  reply read_reply_(char const* what);
  void  ehlo_or_helo_();
  void  rset_();
  void  send_data_(std::string_view msg);
  void  check_out_(char const* what);

  [[noreturn]] void io_error_(char const* what);

  void close_();

  std::string host_;
  uint16_t    port_;

  int fd_{-1};

  std::unique_ptr<boost::iostreams::stream<SockBuffer>> sock_;

  std::unordered_map<std::string, std::vector<std::string>> ehlo_params_;

  bool hello_done_{false};
};

} // namespace SMTP

#endif // CLIENT_DOT_HPP
