#include "Proxy.hpp"

#include "test-server.hpp"

#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_uint64(relay_timeout);

namespace {
Transaction make_tx(std::vector<std::string> rcpt_tos)
{
  Transaction tx;
  tx.peer      = Peer{"192.0.2.7", 46012};
  tx.mail_from = "anne@example.com";
  tx.rcpt_tos  = std::move(rcpt_tos);
  tx.data      = std::string{"From: anne@example.com\n"
                        "Subject: relay me\n"
                        "\n"
                        "hello\n"};
  return tx;
}

auto constexpr relayed = "From: anne@example.com\n"
                         "Subject: relay me\n"
                         "X-Peer: 192.0.2.7\n"
                         "\n"
                         "hello\n";
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Where the X-Peer line goes.
  CHECK_EQ(Proxy::add_peer("", "h"), "X-Peer: h\n");
  CHECK_EQ(Proxy::add_peer("\n", "h"), "X-Peer: h\n\n");
  CHECK_EQ(Proxy::add_peer("A: b", "h"), "A: b\nX-Peer: h");
  CHECK_EQ(Proxy::add_peer("A: b\n", "h"), "A: b\nX-Peer: h\n");
  CHECK_EQ(Proxy::add_peer("A: b\n\nbody", "h"), "A: b\nX-Peer: h\n\nbody");
  CHECK_EQ(Proxy::add_peer("A: b\n\nx\n\ny\n", "h"),
           "A: b\nX-Peer: h\n\nx\n\ny\n");
  CHECK_EQ(Proxy::add_peer("A: b\r\nC: d\r\n\r\nbody\r\n", "h"),
           "A: b\r\nC: d\r\nX-Peer: h\r\n\r\nbody\r\n");

  // Line endings follow the header section.
  CHECK_EQ(Proxy::add_peer("A: b\r\n", "h"), "A: b\r\nX-Peer: h\r\n");
  CHECK_EQ(Proxy::add_peer("A: b\n\nbody\r\n", "h"),
           "A: b\nX-Peer: h\n\nbody\r\n");
  CHECK_EQ(Proxy::add_peer("A: b\nC: d\n", "h"), "A: b\nC: d\nX-Peer: h\n");

  SMTP::refused_t reported;
  auto            report_calls = 0;
  auto const      reporter     = [&](SMTP::refused_t const& refused) {
    reported = refused;
    ++report_calls;
  };

  { // Everyone accepted.
    test_server server{test_server::script{}};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com", "cate@example.com"}));
    server.wait();

    CHECK_EQ(report_calls, 1);
    CHECK(reported.empty());
    CHECK_EQ(server.data, relayed);
    CHECK_EQ(server.accepted.size(), 2U);
    CHECK(server.quit_seen);
  }

  { // Nobody listening, everyone refused with the made up code.
    Proxy proxy{"127.0.0.1", unused_port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com", "cate@example.com"}));

    CHECK_EQ(report_calls, 2);
    CHECK_EQ(reported.size(), 2U);
    for (auto const& [rcpt, why] : reported) {
      CHECK_EQ(why.code, Proxy::no_code);
      CHECK_EQ(why.message, Proxy::no_message);
    }
  }

  { // Some refused.
    auto script = test_server::script{};
    script.rcpt["nobody@example.com"] = 550;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com", "nobody@example.com"}));
    server.wait();

    CHECK_EQ(reported.size(), 1U);
    CHECK(reported.at("nobody@example.com")
          == (SMTP::refusal{550, "no such user"}));
    CHECK_EQ(server.data, relayed);
    CHECK(server.quit_seen);
  }

  { // All refused, the server's codes come through as is.
    auto script = test_server::script{};
    script.rcpt["x@example.com"] = 550;
    script.rcpt["y@example.com"] = 452;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"x@example.com", "y@example.com"}));
    server.wait();

    CHECK_EQ(reported.size(), 2U);
    CHECK(reported.at("x@example.com") == (SMTP::refusal{550, "no such user"}));
    CHECK(reported.at("y@example.com") == (SMTP::refusal{452, "no such user"}));
    CHECK(server.data.empty());
    CHECK(server.quit_seen);
  }

  { // Sender refused, everyone gets that reply.
    auto script = test_server::script{};
    script.mail = 550;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com", "cate@example.com"}));
    server.wait();

    CHECK_EQ(reported.size(), 2U);
    for (auto const& [rcpt, why] : reported) {
      CHECK_EQ(why.code, 550);
      CHECK_EQ(why.message, "sender no good");
    }
    CHECK(server.quit_seen);
  }

  { // Message refused at the end of data.
    auto script        = test_server::script{};
    script.end_of_data = 554;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com"}));
    server.wait();

    CHECK(reported.at("bart@example.com")
          == (SMTP::refusal{554, "content rejected"}));
    CHECK(server.quit_seen);
  }

  { // Unfriendly greeting.
    auto script     = test_server::script{};
    script.greeting = 554;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com"}));
    server.wait();

    CHECK(reported.at("bart@example.com")
          == (SMTP::refusal{554, "test.example ESMTP"}));
  }

  { // Server goes away after the greeting.
    auto script                   = test_server::script{};
    script.hang_up_after_greeting = true;
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com"}));
    server.wait();

    CHECK(reported.at("bart@example.com")
          == (SMTP::refusal{Proxy::no_code, Proxy::no_message}));
  }

  // Everyone refused with the made up code, message_complete returns.
  auto const all_ignored = [&](test_server::script const& script) {
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    auto const  before = report_calls;
    proxy.message_complete(make_tx({"bart@example.com", "cate@example.com"}));
    server.wait();

    CHECK_EQ(report_calls, before + 1);
    CHECK_EQ(reported.size(), 2U);
    for (auto const& [rcpt, why] : reported) {
      CHECK_EQ(why.code, Proxy::no_code);
      CHECK_EQ(why.message, Proxy::no_message);
    }
    CHECK(server.data.empty());
  };

  { // Greeting too long for the reply parser.
    auto script          = test_server::script{};
    script.greeting_text = std::string(8 * 1024, 'x');
    all_ignored(script);
  }

  { // MAIL answered with nonsense.
    auto script             = test_server::script{};
    script.garbage_for_mail = true;
    all_ignored(script);
  }

  { // Silence until the relay timeout.
    FLAGS_relay_timeout          = 1;
    auto script                  = test_server::script{};
    script.silent_after_greeting = true;
    all_ignored(script);
    FLAGS_relay_timeout = 300;
  }

  { // A long EHLO reply is fine, and so is a long goodbye.
    auto script       = test_server::script{};
    script.ehlo_lines = 100;
    script.quit_text  = std::string(8 * 1024, 'x');
    test_server server{script};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    proxy.message_complete(make_tx({"bart@example.com"}));
    server.wait();

    CHECK(reported.empty());
    CHECK_EQ(server.data, relayed);
    CHECK(server.quit_seen);
  }

  { // Octets are relayed as octets.
    test_server server{test_server::script{}};
    Proxy       proxy{"127.0.0.1", server.port(), reporter};
    auto        tx  = make_tx({"bart@example.com"});
    auto const  txt = std::string{"Subject: caf\xc3\xa9\n\n\xff\xfe\n"};
    tx.data         = bytes(begin(txt), end(txt));
    proxy.message_complete(tx);
    server.wait();

    CHECK(reported.empty());
    CHECK_EQ(server.data, "Subject: caf\xc3\xa9\nX-Peer: 192.0.2.7\n\n\xff\xfe\n");
    CHECK_EQ(server.commands[1], "MAIL FROM:<anne@example.com> BODY=8BITMIME");
  }

  { // No body at all is a programming error, and it escapes.
    Proxy proxy{"127.0.0.1", unused_port(), reporter};
    auto  tx     = make_tx({"bart@example.com"});
    tx.data      = std::monostate{};
    auto threw   = false;
    auto before  = report_calls;
    try {
      proxy.message_complete(tx);
    }
    catch (type_mismatch const&) {
      threw = true;
    }
    CHECK(threw);
    CHECK_EQ(report_calls, before);
  }

  // The default reporter only logs.
  Proxy::log_refusals({});
  Proxy::log_refusals({{"x@example.com", SMTP::refusal{550, "no"}}});
}
