#include "Debugging.hpp"

#include <iostream>
#include <sstream>
#include <string>

#include <glog/logging.h>

namespace {
Transaction make_tx()
{
  Transaction tx;
  tx.peer      = Peer{"192.0.2.7", 46012};
  tx.mail_from = "anne@example.com";
  tx.rcpt_tos  = {"bart@example.com"};
  tx.data      = std::string{"From: anne@example.com\r\n"
                        "Subject: test\r\n"
                        "\r\n"
                        "Testing\r\n"};
  return tx;
}

bool usage_error_for(Handler::args_t const& args)
{
  try {
    Debugging::from_cli(args);
  }
  catch (usage_error const& e) {
    CHECK_EQ(std::string(e.what()), "Debugging usage: [stdout|stderr]");
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    std::ostringstream os;
    Debugging          dbg{os};
    dbg.message_complete(make_tx());
    CHECK_EQ(os.str(), "---------- MESSAGE FOLLOWS ----------\n"
                       "From: anne@example.com\n"
                       "Subject: test\n"
                       "X-Peer: 192.0.2.7:46012\n"
                       "\n"
                       "Testing\n"
                       "------------ END MESSAGE ------------\n");
  }

  { // With options.
    std::ostringstream os;
    Debugging          dbg{os};
    auto               tx = make_tx();
    tx.options[mail_options] = {"BODY=8BITMIME", "SIZE=1000"};
    tx.options[rcpt_options] = {"NOTIFY=NEVER"};
    dbg.message_complete(tx);
    CHECK_EQ(os.str(), "---------- MESSAGE FOLLOWS ----------\n"
                       "mail options: BODY=8BITMIME SIZE=1000\n"
                       "rcpt options: NOTIFY=NEVER\n"
                       "\n"
                       "From: anne@example.com\n"
                       "Subject: test\n"
                       "X-Peer: 192.0.2.7:46012\n"
                       "\n"
                       "Testing\n"
                       "------------ END MESSAGE ------------\n");
  }

  { // Octets, some of them not UTF-8; no blank line.
    std::ostringstream os;
    Debugging          dbg{os};
    auto               tx  = make_tx();
    auto const         txt = std::string{"Subject: caf\xc3\xa9 \xff!\n"};
    tx.data                = bytes(begin(txt), end(txt));
    tx.peer                = Peer{"::1", 25};
    dbg.message_complete(tx);
    CHECK_EQ(os.str(), "---------- MESSAGE FOLLOWS ----------\n"
                       "Subject: caf\xc3\xa9 \xef\xbf\xbd!\n"
                       "X-Peer: [::1]:25\n"
                       "------------ END MESSAGE ------------\n");
  }

  CHECK_EQ(Debugging::to_utf8("plain"), "plain");
  CHECK_EQ(Debugging::to_utf8("\xe2\x82\xac"), "\xe2\x82\xac");
  // Truncated sequence, then a lone continuation byte.
  CHECK_EQ(Debugging::to_utf8("\xe2\x82" "x\x80"),
           "\xef\xbf\xbd\xef\xbf\xbd" "x\xef\xbf\xbd");

  // Which stream each choice writes to.
  auto const output_of = [](std::ostream& os, Handler::args_t const& args) {
    std::ostringstream captured;
    auto const         saved = os.rdbuf(captured.rdbuf());
    Debugging::from_cli(args)->message_complete(make_tx());
    os.rdbuf(saved);
    return captured.str();
  };
  auto const is_dump = [](std::string const& out) {
    return out.find("---------- MESSAGE FOLLOWS ----------\n") == 0
           && out.find("X-Peer: 192.0.2.7:46012\n") != std::string::npos;
  };
  CHECK(is_dump(output_of(std::cout, {})));
  CHECK(is_dump(output_of(std::cout, {"stdout"})));
  CHECK(output_of(std::cerr, {"stdout"}).empty());
  CHECK(is_dump(output_of(std::cerr, {"stderr"})));
  CHECK(output_of(std::cout, {"stderr"}).empty());
  CHECK(usage_error_for({"bogus"}));
  CHECK(usage_error_for({"stdout", "stderr"}));

  // Through the bootstrap path.
  CHECK(construct<Debugging>("debugging", {"stderr"}));
  static_assert(has_from_cli<Debugging>::value);

  auto tx = make_tx();
  tx.data = std::monostate{};
  std::ostringstream os;
  Debugging          dbg{os};
  auto               threw = false;
  try {
    dbg.message_complete(tx);
  }
  catch (type_mismatch const&) {
    threw = true;
  }
  CHECK(threw);
}
