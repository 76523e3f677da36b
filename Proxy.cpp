#include "Proxy.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

auto constexpr NEWLINE = "\n";

Proxy::Proxy(std::string remote_hostname, uint16_t remote_port, report_t report)
  : hostname_(std::move(remote_hostname))
  , port_(remote_port)
  , report_(std::move(report))
{
  CHECK(report_) << "a proxy needs somewhere to report refusals";
}

std::string Proxy::add_peer(std::string_view data, std::string_view host)
{
  std::vector<std::string_view> lines;
  for (;;) {
    auto const nl = data.find('\n');
    lines.push_back(data.substr(0, nl));
    if (nl == std::string_view::npos)
      break;
    data.remove_prefix(nl + 1);
  }

  // Look for the last header.  CRLF data has "\r" for an empty line.
  auto const blank = std::find_if(begin(lines), end(lines), [](auto line) {
    return line.empty() || (line == "\r");
  });

  // Match the line ending of the header section, not the body.
  auto const crlf
      = ((blank != end(lines)) && (*blank == "\r"))
        || ((blank != begin(lines)) && !std::prev(blank)->empty()
            && (std::prev(blank)->back() == '\r'));

  auto const peer_line = fmt::format("X-Peer: {}{}", host, crlf ? "\r" : "");

  std::vector<std::string_view> out(begin(lines), blank);
  out.push_back(peer_line);
  out.insert(end(out), blank, end(lines));

  return fmt::format("{}", fmt::join(out, NEWLINE));
}

SMTP::refused_t Proxy::deliver(std::string_view                mail_from,
                               std::vector<std::string> const& rcpt_tos,
                               std::string_view                data) const
{
  SMTP::refused_t refused;
  try {
    SMTP::Client client{hostname_, port_};

    // Whatever happens once connected, the session is closed on the way out.
    struct quit_on_exit {
      SMTP::Client& client;
      ~quit_on_exit() { client.quit(); }
    };

    client.connect();
    quit_on_exit guard{client};
    refused = client.sendmail(mail_from, rcpt_tos, data);
  }
  catch (SMTP::recipients_refused const& e) {
    LOG(INFO) << "got recipients_refused";
    refused = e.recipients();
  }
  catch (SMTP::error const& e) {
    LOG(ERROR) << "got SMTP::error: " << e.what();
    // All recipients were refused.  If the exception had an associated
    // error code, use it.  Otherwise, fake it with a non-triggering
    // code.
    auto const code = e.code().value_or(no_code);
    auto const msg  = e.reply().value_or(no_message);
    for (auto const& rcpt : rcpt_tos)
      refused[rcpt] = SMTP::refusal{code, msg};
  }
  catch (std::system_error const& e) {
    LOG(ERROR) << "got std::system_error: " << e.what();
    for (auto const& rcpt : rcpt_tos)
      refused[rcpt] = SMTP::refusal{no_code, no_message};
  }
  return refused;
}

void Proxy::message_complete(Transaction const& tx)
{
  auto const data = add_peer(tx.data_view(), tx.peer.host);
  auto const refused = deliver(tx.mail_from, tx.rcpt_tos, data);
  report_(refused);
}

void Proxy::log_refusals(SMTP::refused_t const& refused)
{
  if (refused.empty()) {
    LOG(INFO) << "all recipients accepted";
    return;
  }
  for (auto const& [rcpt, why] : refused) {
    LOG(INFO) << "we got a refusal: <" << rcpt << "> " << why.code << ' '
              << why.message;
  }
}
