#include "Client.hpp"

#include "osutil.hpp"

#include <algorithm>
#include <cerrno>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

// This needs to be at least the length of each string it's trying to match.
DEFINE_uint64(pbfr_size, 4 * 1024, "parser buffer size");

DEFINE_uint64(relay_timeout, 300, "relay session I/O timeout in seconds");

DEFINE_string(relay_client_id, "", "client name (ID) for EHLO/HELO");

DEFINE_bool(use_esmtp, true, "use ESMTP (EHLO)");

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace SMTP {

// clang-format off

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

// textstring     = 1*(%d09 / %d32-126) ; HT, SP, Printable US-ASCII

// In practice servers put UTF-8 and worse in here, take anything but
// the line ending.

struct textstring : plus<not_one<'\r', '\n'>> {};

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

struct reply_line_more : seq<reply_code, one<'-'>, opt<textstring>, CRLF> {};

struct reply_line_last : seq<reply_code, opt<SP, opt<textstring>>, CRLF> {};

// Each line is dropped from the input buffer once its actions have run,
// so only a single line has to fit in pbfr_size.

struct reply_lines : seq<star<seq<reply_line_more, discard>>,
                         reply_line_last, discard> {};

// clang-format on

struct reply_ctx {
  std::string              code;
  std::string              text;
  std::vector<std::string> lines;
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<reply_code> {
  template <typename Input>
  static void apply(Input const& in, reply_ctx& ctx)
  {
    ctx.code = in.string();
  }
};

template <>
struct action<textstring> {
  template <typename Input>
  static void apply(Input const& in, reply_ctx& ctx)
  {
    ctx.text = in.string();
  }
};

template <>
struct action<reply_line_more> {
  template <typename Input>
  static void apply(Input const& in, reply_ctx& ctx)
  {
    ctx.lines.emplace_back(std::move(ctx.text));
    ctx.text.clear();
  }
};

template <>
struct action<reply_line_last> {
  template <typename Input>
  static void apply(Input const& in, reply_ctx& ctx)
  {
    ctx.lines.emplace_back(std::move(ctx.text));
    ctx.text.clear();
  }
};

} // namespace SMTP

namespace {
bool is_ascii(std::string_view str)
{
  return std::all_of(begin(str), end(str), [](char ch) {
    return (static_cast<unsigned char>(ch) & 0x80) == 0;
  });
}

std::chrono::milliseconds relay_timeout()
{
  return std::chrono::seconds(FLAGS_relay_timeout);
}

std::string client_id()
{
  if (!FLAGS_relay_client_id.empty())
    return FLAGS_relay_client_id;
  return osutil::get_hostname();
}
} // namespace

namespace SMTP {

Client::Client(std::string host, uint16_t port)
  : host_(std::move(host))
  , port_(port)
{
}

Client::~Client() { close_(); }

void Client::connect()
{
  CHECK(!connected()) << "already connected to " << host_;

  auto hints{addrinfo{}};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  auto const service = std::to_string(port_);

  addrinfo* res = nullptr;
  if (auto const rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
      rc != 0) {
    LOG(WARNING) << "can't resolve " << host_ << ": " << gai_strerror(rc);
    throw std::system_error(EHOSTUNREACH, std::generic_category(),
                            fmt::format("can't resolve {}: {}", host_,
                                        gai_strerror(rc)));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs(res, freeaddrinfo);

  auto last_errno = EHOSTUNREACH;
  for (auto ai = res; ai != nullptr; ai = ai->ai_next) {
    auto const fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      last_errno = errno;
      PLOG(WARNING) << "socket() failed";
      continue;
    }
    if (POSIX::connect(fd, ai->ai_addr, ai->ai_addrlen, relay_timeout())
        == 0) {
      fd_ = fd;
      break;
    }
    last_errno = errno;
    PLOG(WARNING) << "connect failed " << host_ << ":" << port_;
    ::close(fd);
  }
  if (fd_ == -1) {
    throw std::system_error(last_errno, std::generic_category(),
                            fmt::format("can't connect to {}:{}", host_,
                                        port_));
  }

  LOG(INFO) << "connected to " << host_ << ":" << port_;

  sock_ = std::make_unique<boost::iostreams::stream<SockBuffer>>(
      SockBuffer{fd_, fd_, relay_timeout(), relay_timeout()});

  auto const greeting = read_reply_("greeting");
  if (greeting.code != 220) {
    LOG(WARNING) << "greeting was not in the affirmative";
    throw error("greeting was not in the affirmative", greeting);
  }
}

void Client::check_out_(char const* what)
{
  if (!sock_->good())
    io_error_(what);
}

void Client::io_error_(char const* what)
{
  auto const& dev = **sock_;
  if (dev.timed_out()) {
    throw std::system_error(ETIMEDOUT, std::generic_category(),
                            fmt::format("{} timed out", what));
  }
  auto const err = dev.last_errno() ? dev.last_errno() : ECONNRESET;
  throw std::system_error(err, std::generic_category(),
                          fmt::format("connection lost during {}", what));
}

reply Client::read_reply_(char const* what)
{
  CHECK(sock_) << "not connected";

  auto in = istream_input<eol::crlf, 1>{*sock_, FLAGS_pbfr_size, what};

  reply_ctx ctx;
  auto      parsed = false;
  try {
    parsed = parse<reply_lines, action>(in, ctx);
  }
  catch (std::overflow_error const& e) {
    LOG(WARNING) << what << " reply: " << e.what();
    throw error(fmt::format("{} reply line too long", what));
  }
  if (!parsed) {
    if (!sock_->good())
      io_error_(what);
    LOG(WARNING) << what << " reply was unrecognizable";
    throw error(fmt::format("{} reply was unrecognizable", what));
  }

  for (auto const& line : ctx.lines) {
    LOG(INFO) << "S: " << ctx.code << ' ' << line;
  }

  auto rep{reply{}};
  rep.code = std::stoi(ctx.code);
  rep.text = boost::algorithm::join(ctx.lines, "\n");

  if (std::string_view(what) == "EHLO") {
    // First line is the server's name, then one extension per line.
    if (!ctx.lines.empty()) {
      for (auto it = std::next(ctx.lines.begin()); it != ctx.lines.end();
           ++it) {
        std::vector<std::string> params;
        boost::algorithm::split(params, *it, boost::algorithm::is_any_of(" ="),
                                boost::algorithm::token_compress_on);
        if (params.empty() || params.front().empty())
          continue;
        auto keyword = params.front();
        boost::to_upper(keyword);
        params.erase(params.begin());
        ehlo_params_.emplace(std::move(keyword), std::move(params));
      }
    }
  }

  return rep;
}

reply Client::command_(std::string_view cmd)
{
  CHECK(sock_) << "not connected";

  auto const verb = std::string(cmd.substr(0, cmd.find(' ')));

  LOG(INFO) << "C: " << cmd;
  *sock_ << cmd << "\r\n" << std::flush;
  check_out_(verb.c_str());

  return read_reply_(verb.c_str());
}

void Client::ehlo_or_helo_()
{
  if (hello_done_)
    return;

  auto const id = client_id();

  if (FLAGS_use_esmtp) {
    auto const rep = command_(fmt::format("EHLO {}", id));
    if (rep.code / 100 == 2) {
      hello_done_ = true;
      return;
    }
    LOG(WARNING) << "EHLO rejected, trying HELO";
    ehlo_params_.clear();
  }

  auto const rep = command_(fmt::format("HELO {}", id));
  if (rep.code / 100 != 2) {
    throw error("HELO rejected", rep);
  }
  hello_done_ = true;
}

void Client::rset_()
{
  try {
    command_("RSET");
  }
  catch (std::system_error const& e) {
    LOG(WARNING) << "RSET failed: " << e.what();
  }
  catch (error const& e) {
    LOG(WARNING) << "RSET failed: " << e.what();
  }
}

void Client::send_data_(std::string_view msg)
{
  auto lineno = 0;

  while (!msg.empty()) {
    auto const eol  = msg.find('\n');
    auto       line = msg.substr(0, eol);
    msg.remove_prefix(eol == std::string_view::npos ? msg.size() : eol + 1);

    ++lineno;
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);

    if (!line.empty() && (line.front() == '.'))
      *sock_ << '.';
    *sock_ << line << "\r\n";

    if (!sock_->good()) {
      LOG(ERROR) << "output no good at line " << lineno;
      io_error_("DATA");
    }
  }

  // Done!
  *sock_ << ".\r\n" << std::flush;
  check_out_("DATA");
}

refused_t Client::sendmail(std::string_view                from,
                           std::vector<std::string> const& to,
                           std::string_view                msg)
{
  CHECK(connected()) << "sendmail before connect";

  ehlo_or_helo_();

  auto const params
      = (has_extension("8BITMIME") && !is_ascii(msg)) ? " BODY=8BITMIME" : "";

  auto rep = command_(fmt::format("MAIL FROM:<{}>{}", from, params));
  if (rep.code != 250) {
    LOG(WARNING) << "MAIL FROM: negative reply " << rep.code;
    rset_();
    throw error(fmt::format("sender <{}> refused", from), rep);
  }

  refused_t refused;
  auto      n_refused = 0u;
  for (auto const& rcpt : to) {
    rep = command_(fmt::format("RCPT TO:<{}>", rcpt));
    if ((rep.code != 250) && (rep.code != 251)) {
      LOG(WARNING) << "RCPT TO: negative reply " << rep.code;
      refused[rcpt] = refusal{rep.code, rep.text};
      ++n_refused;
    }
  }
  if (n_refused == to.size()) {
    rset_();
    throw recipients_refused(std::move(refused));
  }

  rep = command_("DATA");
  if (rep.code != 354) {
    LOG(ERROR) << "DATA returned " << rep.code;
    rset_();
    throw error("DATA refused", rep);
  }

  send_data_(msg);

  rep = read_reply_("end of data");
  if (rep.code != 250) {
    LOG(ERROR) << "message refused with " << rep.code;
    rset_();
    throw error("message refused", rep);
  }

  return refused;
}

void Client::quit()
{
  if (!sock_)
    return;

  try {
    if (sock_->good())
      command_("QUIT");
  }
  catch (std::system_error const& e) {
    LOG(WARNING) << "QUIT failed: " << e.what();
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "QUIT failed: " << e.what();
  }

  close_();
}

void Client::close_()
{
  if (sock_) {
    (*sock_)->log_totals();
    sock_.reset();
  }
  if (fd_ != -1) {
    PLOG_IF(WARNING, ::close(fd_) == -1) << "close failed";
    fd_ = -1;
  }
  hello_done_ = false;
  ehlo_params_.clear();
}

} // namespace SMTP
