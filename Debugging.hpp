#ifndef DEBUGGING_DOT_HPP
#define DEBUGGING_DOT_HPP

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "Handler.hpp"

// Prints every message, with its options and an X-Peer line, to a
// stream.

class Debugging : public Handler {
public:
  explicit Debugging(std::ostream& os = std::cout)
    : os_(os)
  {
  }

  // No arguments, "stdout" or "stderr".
  static std::unique_ptr<Debugging> from_cli(args_t const& args);

  void message_complete(Transaction const& tx) override;

  // Octets as UTF-8, each invalid byte replaced by U+FFFD.
  static std::string to_utf8(std::string_view octets);

private:
  std::ostream& os_;
};

#endif // DEBUGGING_DOT_HPP
