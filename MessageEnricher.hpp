#ifndef MESSAGEENRICHER_DOT_HPP
#define MESSAGEENRICHER_DOT_HPP

#include <functional>
#include <future>
#include <memory>

#include "Handler.hpp"
#include "message.hpp"

// Turns a transaction into a parsed message carrying X-Peer,
// X-MailFrom and X-RcptTos, then hands it to a handler supplied step.
// Handlers that want a message rather than raw data embed one of these.

class MessageEnricher {
public:
  using handle_message_t
      = std::function<void(std::unique_ptr<message::parsed> msg)>;

  explicit MessageEnricher(handle_message_t handle_message);

  // Decode, add provenance, run the step.  Exceptions from the step
  // propagate.
  void message_complete(Transaction const& tx) const;

  // As above, but the step runs on its own thread.  Decoding and the
  // provenance headers are done before this returns; exceptions from
  // the step come out of the future.
  std::future<void> message_complete_async(Transaction const& tx) const;

  static std::unique_ptr<message::parsed> enrich(Transaction const& tx);

  static std::unique_ptr<message::parsed> from_string(std::string_view text);
  static std::unique_ptr<message::parsed> from_bytes(bytes const& octets);

private:
  handle_message_t handle_message_;
};

#endif // MESSAGEENRICHER_DOT_HPP
