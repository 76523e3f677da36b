#include "MessageEnricher.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <glog/logging.h>

auto constexpr COMMASPACE = ", ";

namespace {
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

MessageEnricher::MessageEnricher(handle_message_t handle_message)
  : handle_message_(std::move(handle_message))
{
  CHECK(handle_message_) << "a message handler needs a handle_message step";
}

std::unique_ptr<message::parsed>
MessageEnricher::from_string(std::string_view text)
{
  auto msg = std::make_unique<message::parsed>();
  if (!msg->parse(text)) {
    LOG(WARNING) << "message text did not parse to the end";
  }
  return msg;
}

std::unique_ptr<message::parsed> MessageEnricher::from_bytes(bytes const& octets)
{
  auto msg = std::make_unique<message::parsed>();
  auto const data = std::string_view(
      reinterpret_cast<char const*>(octets.data()), octets.size());
  if (!msg->parse(data)) {
    LOG(WARNING) << "message octets did not parse to the end";
  }
  return msg;
}

std::unique_ptr<message::parsed> MessageEnricher::enrich(Transaction const& tx)
{
  auto msg = std::visit(
      overloaded{
          [](std::string const& text) { return from_string(text); },
          [](bytes const& octets) { return from_bytes(octets); },
          [](std::monostate) -> std::unique_ptr<message::parsed> {
            throw type_mismatch("expected str or bytes, got neither");
          },
      },
      tx.data);

  msg->add_header(message::X_Peer, tx.peer.as_string());
  msg->add_header(message::X_MailFrom, tx.mail_from);
  msg->add_header(message::X_RcptTos,
                  fmt::format("{}", fmt::join(tx.rcpt_tos, COMMASPACE)));

  return msg;
}

void MessageEnricher::message_complete(Transaction const& tx) const
{
  handle_message_(enrich(tx));
}

std::future<void>
MessageEnricher::message_complete_async(Transaction const& tx) const
{
  auto msg = enrich(tx);
  return std::async(std::launch::async,
                    [handle = handle_message_, m = std::move(msg)]() mutable {
                      handle(std::move(m));
                    });
}
