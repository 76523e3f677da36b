#include "Client.hpp"

#include "test-server.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_uint64(relay_timeout);

auto constexpr msg = "From: anne@example.com\r\n"
                     "Subject: dots\r\n"
                     "\r\n"
                     ".hidden\n"
                     "last line\r\n";

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  { // Everybody accepted.
    test_server server{test_server::script{}};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    CHECK(client.connected());
    auto const refused = client.sendmail(
        "anne@example.com", {"bart@example.com", "cate@example.com"}, msg);
    CHECK(refused.empty());
    CHECK(client.has_extension("8BITMIME"));
    CHECK(client.has_extension("SIZE"));
    CHECK(!client.has_extension("CHUNKING"));
    client.quit();
    CHECK(!client.connected());

    server.wait();
    CHECK(server.quit_seen);
    CHECK_EQ(server.accepted.size(), 2U);
    // Dot-stuffing undone by the server, line endings normalized.
    CHECK_EQ(server.data, "From: anne@example.com\n"
                          "Subject: dots\n"
                          "\n"
                          ".hidden\n"
                          "last line\n");
    CHECK_EQ(server.commands.front().substr(0, 5), "EHLO ");
    CHECK_EQ(server.commands[1], "MAIL FROM:<anne@example.com>");
  }

  { // 8-bit data asks for 8BITMIME.
    test_server server{test_server::script{}};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    CHECK(client.sendmail("anne@example.com", {"bart@example.com"},
                          "Subject: caf\xc3\xa9\r\n\r\nx\r\n")
              .empty());
    client.quit();

    server.wait();
    CHECK_EQ(server.commands[1], "MAIL FROM:<anne@example.com> BODY=8BITMIME");
  }

  { // Some refused.
    auto script = test_server::script{};
    script.rcpt["nobody@example.com"] = 550;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    auto const refused = client.sendmail(
        "anne@example.com", {"bart@example.com", "nobody@example.com"}, msg);
    client.quit();
    server.wait();

    CHECK_EQ(refused.size(), 1U);
    CHECK(refused.at("nobody@example.com")
          == (SMTP::refusal{550, "no such user"}));
    CHECK_EQ(server.accepted.size(), 1U);
    CHECK(!server.data.empty());
  }

  { // All refused.
    auto script = test_server::script{};
    script.rcpt["x@example.com"] = 550;
    script.rcpt["y@example.com"] = 451;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    auto threw = false;
    try {
      client.sendmail("anne@example.com", {"x@example.com", "y@example.com"},
                      msg);
    }
    catch (SMTP::recipients_refused const& e) {
      threw = true;
      CHECK_EQ(e.recipients().size(), 2U);
      CHECK_EQ(e.recipients().at("x@example.com").code, 550);
      CHECK_EQ(e.recipients().at("y@example.com").code, 451);
    }
    CHECK(threw);
    client.quit();
    server.wait();

    CHECK(server.data.empty());
    CHECK(server.quit_seen);
    CHECK_EQ(server.commands[server.commands.size() - 2], "RSET");
  }

  { // Sender refused.
    auto script = test_server::script{};
    script.mail = 553;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    auto threw = false;
    try {
      client.sendmail("anne@example.com", {"bart@example.com"}, msg);
    }
    catch (SMTP::error const& e) {
      threw = true;
      CHECK(e.code());
      CHECK_EQ(*e.code(), 553);
      CHECK_EQ(*e.reply(), "sender no good");
    }
    CHECK(threw);
    client.quit();
    server.wait();
  }

  { // EHLO not understood, HELO it is.
    auto script = test_server::script{};
    script.ehlo = 502;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    CHECK(client.sendmail("anne@example.com", {"bart@example.com"}, msg)
              .empty());
    CHECK(!client.has_extension("8BITMIME"));
    client.quit();
    server.wait();
    CHECK_EQ(server.commands[1].substr(0, 5), "HELO ");
  }

  { // Long EHLO reply, more than fits in the parser buffer at once.
    auto script       = test_server::script{};
    script.ehlo_lines = 100;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    CHECK(client.sendmail("anne@example.com", {"bart@example.com"}, msg)
              .empty());
    CHECK(client.has_extension("X-FILLER-0"));
    CHECK(client.has_extension("X-FILLER-99"));
    CHECK(client.has_extension("8BITMIME"));
    client.quit();
    server.wait();
    CHECK(server.quit_seen);
  }

  { // A single reply line too long to parse.
    auto script          = test_server::script{};
    script.greeting_text = std::string(8 * 1024, 'x');
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    auto         threw = false;
    try {
      client.connect();
    }
    catch (SMTP::error const& e) {
      threw = true;
      CHECK(!e.code());
    }
    CHECK(threw);
    client.quit();
    server.wait();
  }

  { // Same for the goodbye, quit() still doesn't throw.
    auto script      = test_server::script{};
    script.quit_text = std::string(8 * 1024, 'x');
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    CHECK(client.sendmail("anne@example.com", {"bart@example.com"}, msg)
              .empty());
    client.quit();
    CHECK(!client.connected());
    server.wait();
    CHECK(server.quit_seen);
  }

  { // Not an SMTP reply at all.
    auto script             = test_server::script{};
    script.garbage_for_mail = true;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    auto threw = false;
    try {
      client.sendmail("anne@example.com", {"bart@example.com"}, msg);
    }
    catch (SMTP::error const& e) {
      threw = true;
      CHECK(!e.code());
      CHECK(!e.reply());
    }
    CHECK(threw);
    client.quit();
    server.wait();
  }

  { // Server stops talking.
    FLAGS_relay_timeout = 1;

    auto script                  = test_server::script{};
    script.silent_after_greeting = true;
    test_server server{script};

    SMTP::Client client{"127.0.0.1", server.port()};
    client.connect();
    auto threw = false;
    try {
      client.sendmail("anne@example.com", {"bart@example.com"}, msg);
    }
    catch (std::system_error const& e) {
      threw = true;
      CHECK_EQ(e.code().value(), ETIMEDOUT);
    }
    CHECK(threw);
    client.quit();
    CHECK(!client.connected());
    server.wait();
    CHECK(!server.quit_seen);

    FLAGS_relay_timeout = 300;
  }

  { // Nobody home.
    SMTP::Client client{"127.0.0.1", unused_port()};
    auto         threw = false;
    try {
      client.connect();
    }
    catch (std::system_error const& e) {
      threw = true;
      CHECK_EQ(e.code().value(), ECONNREFUSED);
    }
    CHECK(threw);
    CHECK(!client.connected());
    client.quit(); // harmless
  }
}
