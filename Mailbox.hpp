#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include <memory>

#include "Handler.hpp"
#include "Maildir.hpp"
#include "MessageEnricher.hpp"

// Files each message, provenance headers added, into a Maildir.

class Mailbox : public Handler {
public:
  explicit Mailbox(fs::path mail_dir);

  void message_complete(Transaction const& tx) override
  {
    enricher_.message_complete(tx);
  }

  void handle_message(std::unique_ptr<message::parsed> msg);

  // Remove every stored message.
  void reset() { maildir_.clear(); }

  Maildir const& maildir() const { return maildir_; }

private:
  Maildir         maildir_;
  MessageEnricher enricher_;
};

#endif // MAILBOX_DOT_HPP
