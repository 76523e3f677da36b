#include "osutil.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include <pwd.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <arpa/inet.h>
#include <netdb.h>

#include <glog/logging.h>

namespace osutil {

fs::path get_home_dir()
{
  auto const homedir_ev{getenv("HOME")};
  if (homedir_ev) {
    return homedir_ev;
  }
  errno = 0; // See GETPWNAM(3)
  passwd* pw;
  PCHECK(pw = getpwuid(getuid()));
  return pw->pw_dir;
}

std::string get_hostname()
{
  utsname un;
  PCHECK(uname(&un) == 0);
  return std::string(un.nodename);
}

// Numeric strings are taken as is, anything else is looked up as a
// service name.  Returns 0 for an unknown service.
uint16_t get_port(char const* const service, char const* const proto)
{
  char*      ep = nullptr;
  auto const service_no{strtoul(service, &ep, 10)};
  if (ep && (ep != service) && (*ep == '\0')) {
    if (service_no > std::numeric_limits<uint16_t>::max()) {
      LOG(WARNING) << "port " << service << " out of range";
      return 0;
    }
    return static_cast<uint16_t>(service_no);
  }

  std::vector<char> str_buf(1024); // suggested by getservbyname_r(3)

  auto     result_buf{servent{}};
  servent* result_ptr = nullptr;
  while (getservbyname_r(service, proto, &result_buf, str_buf.data(),
                         str_buf.size(), &result_ptr)
         == ERANGE) {
    CHECK_LT(str_buf.size(), 64 * 1024); // ridiculous
    str_buf.resize(str_buf.size() * 2);
  }
  if (result_ptr == nullptr) {
    LOG(WARNING) << "service " << service << " unknown";
    return 0;
  }
  return ntohs(result_buf.s_port);
}

} // namespace osutil
