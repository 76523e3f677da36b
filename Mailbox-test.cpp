#include "Mailbox.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
Transaction make_tx(int n)
{
  Transaction tx;
  tx.peer      = Peer{"192.0.2.7", 46012};
  tx.mail_from = "anne@example.com";
  tx.rcpt_tos  = {"bart@example.com", "cate@example.com"};
  tx.data      = fmt::format("From: anne@example.com\r\n"
                        "Subject: number {}\r\n"
                        "\r\n"
                        "body {}\r\n",
                        n, n);
  return tx;
}

std::string slurp(fs::path const& p)
{
  std::ifstream ifs(p, std::ios::binary);
  CHECK(ifs) << "can't open " << p;
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const root = fs::temp_directory_path()
                    / fmt::format("Mailbox-test-{}", getpid());
  error_code ec;
  fs::remove_all(root, ec);

  {
    Mailbox mbx{root};
    for (auto const sub : {"tmp", "new", "cur"})
      CHECK(fs::is_directory(root / sub));

    static_assert(!has_from_cli<Mailbox>::value);

    mbx.message_complete(make_tx(1));
    auto const msgs = mbx.maildir().messages();
    CHECK_EQ(msgs.size(), 1U);
    CHECK_EQ(msgs[0].parent_path().filename().string(), "new");
    CHECK(fs::is_empty(root / "tmp"));

    message::parsed stored;
    auto const      contents = slurp(msgs[0]);
    CHECK(stored.parse(contents));
    CHECK_EQ(stored.get_header("Subject"), "number 1");
    CHECK_EQ(stored.get_header("X-Peer"), "192.0.2.7:46012");
    CHECK_EQ(stored.get_header("X-MailFrom"), "anne@example.com");
    CHECK_EQ(stored.get_header("X-RcptTos"),
             "bart@example.com, cate@example.com");
    CHECK_EQ(stored.body, "body 1\r\n");
    // Headers one per LF terminated line, body as received.
    CHECK_EQ(contents, MessageEnricher::enrich(make_tx(1))->as_string("\n"));

    // Same thing as octets.
    auto       tx  = make_tx(2);
    auto const txt = std::get<std::string>(tx.data);
    tx.data        = bytes(begin(txt), end(txt));
    mbx.message_complete(tx);
    CHECK_EQ(mbx.maildir().messages().size(), 2U);

    // Many at once, every one gets its own file.
    std::vector<std::thread> threads;
    for (auto n = 0; n < 8; ++n) {
      threads.emplace_back([&mbx, n] {
        for (auto i = 0; i < 10; ++i)
          mbx.message_complete(make_tx(100 + n * 10 + i));
      });
    }
    for (auto& t : threads)
      t.join();
    CHECK_EQ(mbx.maildir().messages().size(), 82U);

    mbx.reset();
    CHECK(mbx.maildir().messages().empty());

    // No body, nothing stored.
    tx.data    = std::monostate{};
    auto threw = false;
    try {
      mbx.message_complete(tx);
    }
    catch (type_mismatch const&) {
      threw = true;
    }
    CHECK(threw);
    CHECK(mbx.maildir().messages().empty());

    // Bootstrap path, ctor arguments only.
    auto const other = construct<Mailbox>("mailbox", {}, root);
    CHECK(other);
    threw = false;
    try {
      construct<Mailbox>("mailbox", {"extra"}, root);
    }
    catch (usage_error const& e) {
      threw = true;
      CHECK_EQ(std::string(e.what()), "Handler class mailbox takes no arguments");
    }
    CHECK(threw);
  }

  { // A folder inside the Maildir.
    Maildir md{root, ".Junk"};
    CHECK(fs::is_directory(root / ".Junk" / "new"));
    auto const p = md.add("Subject: junk\n\nbuy now\n");
    CHECK_EQ(slurp(p), "Subject: junk\n\nbuy now\n");
    md.clear();
    CHECK(md.messages().empty());
  }

  { // Somewhere we can't write.
    auto const file = root / "plain-file";
    std::ofstream(file) << "not a directory\n";
    auto threw = false;
    try {
      Maildir md{file};
    }
    catch (std::system_error const&) {
      threw = true;
    }
    CHECK(threw);
  }

  setenv("MAILDIR", root.c_str(), 1);
  CHECK_EQ(Maildir::locate(), root);

  fs::remove_all(root, ec);
}
