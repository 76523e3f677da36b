#include "MessageEnricher.hpp"

#include <stdexcept>
#include <thread>

#include <glog/logging.h>

namespace {
Transaction make_tx(std::string_view body)
{
  Transaction tx;
  tx.peer      = Peer{"192.0.2.7", 40123};
  tx.mail_from = "anne@example.com";
  tx.rcpt_tos  = {"bart@example.com", "cate@example.org"};
  tx.data      = std::string(body);
  return tx;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto constexpr body = "From: anne@example.com\r\n"
                        "To: bart@example.com\r\n"
                        "Subject: lunch\r\n"
                        "\r\n"
                        "Noon?\r\n";

  std::unique_ptr<message::parsed> got;
  MessageEnricher enricher{
      [&got](std::unique_ptr<message::parsed> msg) { got = std::move(msg); }};

  auto const tx = make_tx(body);
  enricher.message_complete(tx);
  CHECK(got);

  // Existing fields untouched, provenance appended.
  CHECK_EQ(got->headers.size(), 6U);
  CHECK_EQ(got->headers[0].as_string(), "From: anne@example.com");
  CHECK_EQ(got->headers[1].as_string(), "To: bart@example.com");
  CHECK_EQ(got->headers[2].as_string(), "Subject: lunch");
  CHECK_EQ(got->get_header(message::X_Peer), "192.0.2.7:40123");
  CHECK_EQ(got->get_header(message::X_MailFrom), "anne@example.com");
  CHECK_EQ(got->get_header(message::X_RcptTos),
           "bart@example.com, cate@example.org");
  CHECK_EQ(got->body, "Noon?\r\n");

  // Forged provenance is kept, ours is added as another occurrence.
  got.reset();
  enricher.message_complete(make_tx("X-Peer: 10.0.0.1:25\nX-MailFrom: "
                                    "forged@example.net\n\nhi\n"));
  CHECK(got);
  auto const peers = got->get_all(message::X_Peer);
  CHECK_EQ(peers.size(), 2U);
  CHECK_EQ(peers[0], "10.0.0.1:25");
  CHECK_EQ(peers[1], "192.0.2.7:40123");
  CHECK_EQ(got->get_all(message::X_MailFrom).size(), 2U);
  CHECK_EQ(got->get_all(message::X_RcptTos).size(), 1U);

  // Text and the same content as octets give equal messages.
  auto       btx  = make_tx("");
  auto const text = std::string(body);
  btx.data        = bytes(text.begin(), text.end());
  CHECK(*MessageEnricher::enrich(tx) == *MessageEnricher::enrich(btx));
  CHECK(*MessageEnricher::from_string(text)
        == *MessageEnricher::from_bytes(bytes(text.begin(), text.end())));

  // IPv6 peers are bracketed.
  auto v6tx = make_tx(body);
  v6tx.peer = Peer{"2001:db8::1", 25};
  CHECK_EQ(MessageEnricher::enrich(v6tx)->get_header(message::X_Peer),
           "[2001:db8::1]:25");

  // Neither text nor bytes.
  auto bad_tx = make_tx(body);
  bad_tx.data = std::monostate{};
  auto threw  = false;
  try {
    enricher.message_complete(bad_tx);
  }
  catch (type_mismatch const& e) {
    threw = true;
  }
  CHECK(threw);

  // The step's failure is the enricher's failure.
  MessageEnricher failing{[](std::unique_ptr<message::parsed>) {
    throw std::runtime_error("mailbox full");
  }};
  threw = false;
  try {
    failing.message_complete(tx);
  }
  catch (std::runtime_error const& e) {
    CHECK_EQ(std::string(e.what()), "mailbox full");
    threw = true;
  }
  CHECK(threw);

  // Async: provenance is in place before the step starts, and the step
  // runs on another thread.
  auto const caller = std::this_thread::get_id();
  auto       seen_peer{std::string{}};
  auto       other_thread{false};
  MessageEnricher async_enricher{
      [&](std::unique_ptr<message::parsed> msg) {
        seen_peer    = std::string(msg->get_header(message::X_Peer));
        other_thread = std::this_thread::get_id() != caller;
      }};
  async_enricher.message_complete_async(tx).get();
  CHECK_EQ(seen_peer, "192.0.2.7:40123");
  CHECK(other_thread);

  auto fut = failing.message_complete_async(tx);
  threw    = false;
  try {
    fut.get();
  }
  catch (std::runtime_error const& e) {
    threw = true;
  }
  CHECK(threw);

  // A bad body fails before anything is scheduled.
  threw = false;
  try {
    async_enricher.message_complete_async(bad_tx);
  }
  catch (type_mismatch const& e) {
    threw = true;
  }
  CHECK(threw);
}
