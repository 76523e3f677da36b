// Build a handler by name and feed it one transaction, the way an SMTP
// server would at the end of DATA.

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include "Debugging.hpp"
#include "Handler.hpp"
#include "Mailbox.hpp"
#include "Proxy.hpp"
#include "Sink.hpp"
#include "osutil.hpp"

DEFINE_string(handler, "debugging", "debugging, mailbox, proxy or sink");

DEFINE_string(peer_host, "127.0.0.1", "address the message came from");
DEFINE_int32(peer_port, 0, "port the message came from");
DEFINE_string(mail_from, "", "envelope sender");
DEFINE_string(rcpt_to, "", "envelope recipients, comma separated");

DEFINE_bool(decode_data, false, "hand the body over as text, not octets");
DEFINE_string(mail_options, "", "MAIL FROM parameters, comma separated");
DEFINE_string(rcpt_options, "", "RCPT TO parameters, comma separated");

DEFINE_string(relay_host, "localhost", "where proxy sends messages");
DEFINE_string(relay_port, "smtp", "port or service name for proxy");

DEFINE_string(maildir, "", "mailbox directory, default $MAILDIR or ~/Maildir");

DEFINE_string(message, "", "file holding the message, default stdin");

namespace {
std::vector<std::string> split_list(std::string const& list)
{
  std::vector<std::string> items;
  if (list.empty())
    return items;
  boost::algorithm::split(items, list, boost::algorithm::is_any_of(","));
  return items;
}

std::string read_message()
{
  if (FLAGS_message.empty()) {
    return std::string(std::istreambuf_iterator<char>(std::cin), {});
  }
  std::ifstream ifs(FLAGS_message, std::ios::binary);
  if (!ifs) {
    throw usage_error(fmt::format("can't open message {}", FLAGS_message));
  }
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

std::unique_ptr<Handler> make_handler(std::string_view       name,
                                      Handler::args_t const& args)
{
  if (name == "debugging")
    return construct<Debugging>(name, args);

  if (name == "sink")
    return construct<Sink>(name, args);

  if (name == "proxy") {
    auto const port = osutil::get_port(FLAGS_relay_port.c_str(), "tcp");
    if (port == 0) {
      throw usage_error(fmt::format("bad relay port {}", FLAGS_relay_port));
    }
    return construct<Proxy>(name, args, FLAGS_relay_host, port);
  }

  if (name == "mailbox") {
    auto const dir
        = FLAGS_maildir.empty() ? Maildir::locate() : fs::path(FLAGS_maildir);
    return construct<Mailbox>(name, args, dir);
  }

  throw usage_error(fmt::format("unknown handler \"{}\", use one of: {}", name,
                                fmt::join(handler_names(), ", ")));
}

Transaction make_transaction()
{
  if (FLAGS_rcpt_to.empty()) {
    throw usage_error("at least one --rcpt_to is required");
  }
  if ((FLAGS_peer_port < 0) || (FLAGS_peer_port > 65535)) {
    throw usage_error(fmt::format("bad peer port {}", FLAGS_peer_port));
  }

  Transaction tx;
  tx.peer      = Peer{FLAGS_peer_host, static_cast<uint16_t>(FLAGS_peer_port)};
  tx.mail_from = FLAGS_mail_from;
  tx.rcpt_tos  = split_list(FLAGS_rcpt_to);

  auto msg = read_message();
  if (FLAGS_decode_data)
    tx.data = std::move(msg);
  else
    tx.data = bytes(begin(msg), end(msg));

  if (!FLAGS_mail_options.empty())
    tx.options[mail_options] = split_list(FLAGS_mail_options);
  if (!FLAGS_rcpt_options.empty())
    tx.options[rcpt_options] = split_list(FLAGS_rcpt_options);

  return tx;
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage(fmt::format("[flags] [handler arguments...]\n"
                                "handlers: {}",
                                fmt::join(handler_names(), ", ")));
    ParseCommandLineFlags(&argc, &argv, true);
  }

  auto const log_dir{getenv("GOOGLE_LOG_DIR")};
  if (log_dir) {
    error_code ec;
    fs::create_directories(log_dir, ec);
  }

  google::InitGoogleLogging(argv[0]);

  Handler::args_t const args(argv + 1, argv + argc);

  try {
    auto const handler = make_handler(FLAGS_handler, args);
    handler->message_complete(make_transaction());
  }
  catch (usage_error const& e) {
    std::cerr << argv[0] << ": " << e.what() << '\n';
    return 2;
  }
  catch (std::system_error const& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  return 0;
}
