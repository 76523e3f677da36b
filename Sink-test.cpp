#include "Sink.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  static_assert(has_from_cli<Sink>::value);

  auto sink = construct<Sink>("sink", {});
  CHECK(sink);

  Transaction tx;
  tx.peer      = Peer{"192.0.2.7", 46012};
  tx.mail_from = "anne@example.com";
  tx.rcpt_tos  = {"bart@example.com"};
  tx.data      = std::string{"Subject: nothing\n\nto see\n"};
  sink->message_complete(tx);

  // Not even a missing body bothers it.
  tx.data = std::monostate{};
  sink->message_complete(tx);

  auto threw = false;
  try {
    Sink::from_cli({"anything"});
  }
  catch (usage_error const& e) {
    threw = true;
    CHECK_EQ(std::string(e.what()), "Sink handler does not accept arguments");
  }
  CHECK(threw);
}
