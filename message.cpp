#include "message.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include <boost/algorithm/string/predicate.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

static std::string_view trim(std::string_view v)
{
  auto constexpr WS = " \t\r\n";
  v.remove_prefix(std::min(v.find_first_not_of(WS), v.size()));
  v.remove_suffix(std::min(v.size() - v.find_last_not_of(WS) - 1, v.size()));
  return v;
}

namespace RFC5322 {

using colon = one<':'>;

// clang-format off

struct ftext            : ranges<33, 57, 59, 126> {};

struct field_name       : plus<ftext> {};

// Any octet but CR, LF and white space.  Mail from the wild carries
// 8-bit and control characters in header fields, keep them.
struct utext            : not_one<'\r', '\n', ' ', '\t'> {};

struct FWS              : seq<opt<seq<star<WSP>, eol>>, plus<WSP>> {};

struct field_value      : seq<star<seq<opt<FWS>, utext>>, star<WSP>> {};

struct field            : seq<field_name, colon, field_value, eolf> {};

struct fields           : star<field> {};

struct body             : until<eof> {};

struct message          : seq<fields, opt<eol>, body, eof> {};

// clang-format on

template <typename Rule>
struct msg_action : nothing<Rule> {
};

template <>
struct msg_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_name = in.string();
  }
};

template <>
struct msg_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_value = in.string();
  }
};

template <>
struct msg_action<field> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.headers.emplace_back(msg.field_name, msg.field_value);
  }
};

template <>
struct msg_action<body> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.body = in.string();
  }
};

} // namespace RFC5322

namespace message {

bool header::operator==(std::string_view n) const
{
  return boost::algorithm::iequals(n, name);
}

std::string header::as_string() const
{
  return fmt::format("{}:{}", name, value);
}

bool parsed::parse(std::string_view input)
{
  headers.clear();
  body.clear();
  auto in{memory_input<>(input.data(), input.size(), "message")};
  return tao::pegtl::parse<RFC5322::message, RFC5322::msg_action>(in, *this);
}

void parsed::add_header(std::string_view name, std::string_view value)
{
  headers.emplace_back(name, fmt::format(" {}", value));
}

std::string_view parsed::get_header(std::string_view name) const
{
  if (auto hdr = std::find(begin(headers), end(headers), name);
      hdr != end(headers)) {
    return trim(hdr->value);
  }
  return "";
}

std::vector<std::string_view> parsed::get_all(std::string_view name) const
{
  std::vector<std::string_view> values;
  for (auto const& hdr : headers) {
    if (hdr == name)
      values.push_back(trim(hdr.value));
  }
  return values;
}

std::string parsed::as_string(std::string_view eol) const
{
  fmt::memory_buffer bfr;

  for (auto const& h : headers)
    fmt::format_to(std::back_inserter(bfr), "{}{}", h.as_string(), eol);

  fmt::format_to(std::back_inserter(bfr), "{}{}", eol, body);

  return fmt::to_string(bfr);
}

bool parsed::write(std::ostream& os, std::string_view eol) const
{
  for (auto const& h : headers)
    os << h.as_string() << eol;

  os << eol << body;

  return os.good();
}

} // namespace message
