#include "Debugging.hpp"

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC3629 {
// clang-format off
// 4.  Syntax of UTF-8 Byte Sequences

struct UTF8_tail : range<'\x80', '\xBF'> {};

struct UTF8_1 : range<0x00, 0x7F> {};

struct UTF8_2 : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                    seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                    seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                    seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                    seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                    seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

struct UTF8_char : sor<UTF8_1, UTF8_2, UTF8_3, UTF8_4> {};

struct invalid : any {};

struct octets : seq<star<sor<UTF8_char, invalid>>, eof> {};
// clang-format on
} // namespace RFC3629

template <typename Rule>
struct utf8_action : nothing<Rule> {
};

template <>
struct utf8_action<RFC3629::UTF8_char> {
  template <typename Input>
  static void apply(Input const& in, std::string& out)
  {
    out.append(in.begin(), in.end());
  }
};

template <>
struct utf8_action<RFC3629::invalid> {
  template <typename Input>
  static void apply(Input const& in, std::string& out)
  {
    out += "\xEF\xBF\xBD"; // U+FFFD REPLACEMENT CHARACTER
  }
};

std::string Debugging::to_utf8(std::string_view octets)
{
  std::string out;
  out.reserve(octets.size());
  auto in = memory_input<>{octets.data(), octets.size(), "octets"};
  // Every byte matches something, can't fail.
  parse<RFC3629::octets, utf8_action>(in, out);
  return out;
}

std::unique_ptr<Debugging> Debugging::from_cli(args_t const& args)
{
  if (args.empty())
    return std::make_unique<Debugging>();

  if (args.size() == 1) {
    if (args[0] == "stdout")
      return std::make_unique<Debugging>(std::cout);
    if (args[0] == "stderr")
      return std::make_unique<Debugging>(std::cerr);
  }

  throw usage_error("Debugging usage: [stdout|stderr]");
}

namespace {
// Lines without their endings, no empty line for a final newline.
std::vector<std::string_view> split_lines(std::string_view data)
{
  std::vector<std::string_view> lines;
  while (!data.empty()) {
    auto const nl   = data.find('\n');
    auto       line = data.substr(0, nl);
    data.remove_prefix(nl == std::string_view::npos ? data.size() : nl + 1);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    lines.push_back(line);
  }
  return lines;
}
} // namespace

void Debugging::message_complete(Transaction const& tx)
{
  auto const is_bytes = std::holds_alternative<bytes>(tx.data);
  auto const data     = tx.data_view();

  os_ << "---------- MESSAGE FOLLOWS ----------\n";

  auto const mo = tx.options.find(mail_options);
  if (mo != tx.options.end())
    os_ << fmt::format("mail options: {}\n", fmt::join(mo->second, " "));
  auto const ro = tx.options.find(rcpt_options);
  if (ro != tx.options.end())
    os_ << fmt::format("rcpt options: {}\n\n", fmt::join(ro->second, " "));

  auto const peer_line = fmt::format("X-Peer: {}\n", tx.peer.as_string());

  auto in_headers = true;
  for (auto const line : split_lines(data)) {
    if (in_headers && line.empty()) {
      os_ << peer_line;
      in_headers = false;
    }
    if (is_bytes)
      os_ << to_utf8(line) << '\n';
    else
      os_ << line << '\n';
  }
  if (in_headers)
    os_ << peer_line;

  os_ << "------------ END MESSAGE ------------\n" << std::flush;
}
