#include "message.hpp"

#include <sstream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto constexpr simple = "From: a@example.com\r\n"
                          "To: b@example.com\r\n"
                          "Subject: Testing, one, two, three.\r\n"
                          "\r\n"
                          "This is the body of the email.\r\n";

  message::parsed msg;
  CHECK(msg.parse(simple));
  CHECK_EQ(msg.headers.size(), 3U);
  CHECK_EQ(msg.headers[0].name, "From");
  CHECK_EQ(msg.headers[0].value, " a@example.com");
  CHECK_EQ(msg.get_header("subject"), "Testing, one, two, three.");
  CHECK_EQ(msg.get_header(message::Subject), "Testing, one, two, three.");
  CHECK_EQ(msg.get_header("X-Missing"), "");
  CHECK_EQ(msg.body, "This is the body of the email.\r\n");
  CHECK_EQ(msg.as_string(), simple);

  // LF only, folded field, repeated field.
  auto constexpr folded = "Received: from a\n"
                          "\tby b\n"
                          "Received: from c\n"
                          "Subject: hi\n"
                          "\n"
                          "body\n";
  message::parsed fmsg;
  CHECK(fmsg.parse(folded));
  CHECK_EQ(fmsg.headers.size(), 3U);
  CHECK_EQ(fmsg.headers[0].value, " from a\n\tby b");
  auto const received = fmsg.get_all("received");
  CHECK_EQ(received.size(), 2U);
  CHECK_EQ(received[0], "from a\n\tby b");
  CHECK_EQ(received[1], "from c");
  CHECK_EQ(fmsg.as_string("\n"), folded);

  // Adding a field keeps existing ones.
  fmsg.add_header("Subject", "again");
  CHECK_EQ(fmsg.get_all(message::Subject).size(), 2U);
  CHECK_EQ(fmsg.get_header(message::Subject), "hi");
  CHECK_EQ(fmsg.headers.back().as_string(), "Subject: again");

  // No blank line, a line that is not a field starts the body.
  message::parsed nmsg;
  CHECK(nmsg.parse("Subject: x\nnot a header\nmore\n"));
  CHECK_EQ(nmsg.headers.size(), 1U);
  CHECK_EQ(nmsg.body, "not a header\nmore\n");

  // Headers only, last one without a line ending.
  message::parsed hmsg;
  CHECK(hmsg.parse("A: b\nC: d"));
  CHECK_EQ(hmsg.headers.size(), 2U);
  CHECK_EQ(hmsg.get_header("c"), "d");
  CHECK(hmsg.body.empty());

  // Body only.
  message::parsed bmsg;
  CHECK(bmsg.parse("just some text\n"));
  CHECK(bmsg.headers.empty());
  CHECK_EQ(bmsg.body, "just some text\n");

  message::parsed emsg;
  CHECK(emsg.parse(""));
  CHECK(emsg.headers.empty());
  CHECK(emsg.body.empty());

  // 8-bit octets in a field value are kept.
  message::parsed umsg;
  CHECK(umsg.parse("Subject: caf\xc3\xa9 \xe9\r\n\r\nx"));
  CHECK_EQ(umsg.get_header("Subject"), "caf\xc3\xa9 \xe9");

  // Equality is by content.
  message::parsed again;
  CHECK(again.parse(simple));
  CHECK(again == msg);
  again.add_header("X-Extra", "1");
  CHECK(again != msg);

  std::ostringstream os;
  CHECK(msg.write(os, "\n"));
  CHECK_EQ(os.str(), msg.as_string("\n"));
}
