#include "Pill.hpp"

#include <random>

Pill::Pill()
{
  std::random_device                         rd;
  std::uniform_int_distribution<decltype(s_)> uni_dist;
  s_ = uni_dist(rd);

  // <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>
  constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

  // Five bits per digit, least significant first from the right.
  auto x{s_};
  for (auto i{b32_ndigits_}; i > 0; --i) {
    b32_str_[i - 1] = b32_charset[x & 0x1f];
    x >>= 5;
  }
  b32_str_[b32_ndigits_] = '\0';
}
