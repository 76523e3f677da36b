#include "Mailbox.hpp"

#include <glog/logging.h>

Mailbox::Mailbox(fs::path mail_dir)
  : maildir_(std::move(mail_dir))
  , enricher_([this](std::unique_ptr<message::parsed> msg) {
    handle_message(std::move(msg));
  })
{
}

void Mailbox::handle_message(std::unique_ptr<message::parsed> msg)
{
  CHECK(msg);
  maildir_.add(*msg);
}
