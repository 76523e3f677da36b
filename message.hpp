#ifndef MESSAGE_DOT_HPP_INCLUDED
#define MESSAGE_DOT_HPP_INCLUDED

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace message {

// Provenance headers
auto constexpr X_Peer     = "X-Peer";
auto constexpr X_MailFrom = "X-MailFrom";
auto constexpr X_RcptTos  = "X-RcptTos";

auto constexpr Subject = "Subject";

struct header {
  header(std::string_view n, std::string_view v)
    : name(n)
    , value(v)
  {
  }

  std::string as_string() const;

  // Header names compare without regard to case.
  bool operator==(std::string_view n) const;

  bool operator==(header const& rhs) const
  {
    return (name == rhs.name) && (value == rhs.value);
  }
  bool operator!=(header const& rhs) const { return !(*this == rhs); }

  std::string name;
  std::string value; // everything after the ':', folding included
};

// An RFC-5322 message: an ordered list of (possibly repeated) header
// fields and a body.  Owns its storage.
struct parsed {
  // Never rejects input: the first line that is not a header field
  // starts the body.  Returns false only if the grammar failed to reach
  // the end of input.
  bool parse(std::string_view input);

  // Appends a new occurrence, existing fields of that name are kept.
  void add_header(std::string_view name, std::string_view value);

  std::string_view              get_header(std::string_view name) const;
  std::vector<std::string_view> get_all(std::string_view name) const;

  std::string as_string(std::string_view eol = "\r\n") const;
  bool        write(std::ostream& out, std::string_view eol = "\r\n") const;

  bool operator==(parsed const& rhs) const
  {
    return (headers == rhs.headers) && (body == rhs.body);
  }
  bool operator!=(parsed const& rhs) const { return !(*this == rhs); }

  std::vector<header> headers;
  std::string         body;

  // parser scratch
  std::string field_name;
  std::string field_value;
};

} // namespace message

#endif // MESSAGE_DOT_HPP_INCLUDED
