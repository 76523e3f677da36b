#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <cstdint>
#include <string>

#include "fs.hpp"

namespace osutil {
fs::path    get_home_dir();
std::string get_hostname();
uint16_t    get_port(char const* const service, char const* const proto);
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
