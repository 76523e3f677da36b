#include "Handler.hpp"

#include <fmt/format.h>

std::string Peer::as_string() const
{
  if (host.find(':') != std::string::npos)
    return fmt::format("[{}]:{}", host, port);
  return fmt::format("{}:{}", host, port);
}

std::string_view Transaction::data_view() const
{
  if (auto const text = std::get_if<std::string>(&data))
    return *text;
  if (auto const octets = std::get_if<bytes>(&data))
    return std::string_view(reinterpret_cast<char const*>(octets->data()),
                            octets->size());
  throw type_mismatch("expected text or bytes, got neither");
}

std::vector<std::string_view> const& handler_names()
{
  static std::vector<std::string_view> const names{
      "debugging",
      "mailbox",
      "proxy",
      "sink",
  };
  return names;
}
