#ifndef HANDLER_DOT_HPP
#define HANDLER_DOT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using bytes = std::vector<std::uint8_t>;

struct Peer {
  std::string   host;
  std::uint16_t port{0};

  // host:port, IPv6 hosts bracketed: [::1]:25
  std::string as_string() const;
};

// One accepted mail transaction, as handed over by the protocol layer.
struct Transaction {
  using options_t = std::map<std::string, std::vector<std::string>>;

  Peer                     peer;
  std::string              mail_from;
  std::vector<std::string> rcpt_tos;

  // Text when the server decodes data, raw octets otherwise.  The empty
  // alternative is never produced by a well behaved server.
  std::variant<std::monostate, std::string, bytes> data;

  options_t options; // "mail_options", "rcpt_options", ...

  // The body as octets, whichever alternative holds it.
  std::string_view data_view() const;
};

auto constexpr mail_options = "mail_options";
auto constexpr rcpt_options = "rcpt_options";

// Bad handler arguments.
class usage_error : public std::runtime_error {
public:
  explicit usage_error(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// A transaction body that is neither text nor octets.
class type_mismatch : public std::logic_error {
public:
  explicit type_mismatch(std::string const& what)
    : std::logic_error(what)
  {
  }
};

class Handler {
public:
  using args_t = std::vector<std::string>;

  virtual ~Handler() = default;

  // Called once per completed transaction.  Returning accepts the
  // message, throwing reports failure to the protocol layer.
  virtual void message_complete(Transaction const& tx) = 0;
};

// Does T offer "static std::unique_ptr<T> from_cli(args_t const&)"?
template <typename T, typename = void>
struct has_from_cli : std::false_type {
};

template <typename T>
struct has_from_cli<T,
                    std::void_t<decltype(T::from_cli(
                        std::declval<Handler::args_t const&>()))>>
  : std::true_type {
};

// Build a handler from command line arguments: through from_cli when T
// has one, otherwise from the given constructor arguments, in which case
// there must be no command line arguments.
template <typename T, typename... Ctor>
std::unique_ptr<Handler>
construct(std::string_view name, Handler::args_t const& args, Ctor&&... ctor)
{
  if constexpr (has_from_cli<T>::value) {
    return T::from_cli(args);
  }
  else {
    if (!args.empty())
      throw usage_error(std::string("Handler class ") + std::string(name)
                        + " takes no arguments");
    return std::make_unique<T>(std::forward<Ctor>(ctor)...);
  }
}

// Names known to the bootstrap tool, in help order.
std::vector<std::string_view> const& handler_names();

#endif // HANDLER_DOT_HPP
