#ifndef PROXY_DOT_HPP
#define PROXY_DOT_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "Client.hpp"
#include "Handler.hpp"

// Relays each transaction to another SMTP server, adding an X-Peer
// field.  Refused recipients are reported, not retried, and never fail
// the transaction.

class Proxy : public Handler {
public:
  using report_t = std::function<void(SMTP::refused_t const& refused)>;

  // No checks here, a bad host or port shows up at delivery time.
  Proxy(std::string remote_hostname,
        uint16_t    remote_port,
        report_t    report = log_refusals);

  void message_complete(Transaction const& tx) override;

  // Insert "X-Peer: <host>" before the first empty line of data, or at
  // the end if there is none.
  static std::string add_peer(std::string_view data, std::string_view host);

  // One session, one submission.  Never throws for delivery problems.
  SMTP::refused_t deliver(std::string_view                mail_from,
                          std::vector<std::string> const& rcpt_tos,
                          std::string_view                data) const;

  static void log_refusals(SMTP::refused_t const& refused);

  // Code and text for a refusal when the failure had none.
  static constexpr int no_code    = -1;
  static constexpr auto no_message = "ignore";

private:
  std::string hostname_;
  uint16_t    port_;
  report_t    report_;
};

#endif // PROXY_DOT_HPP
