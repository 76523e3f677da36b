#include "osutil.hpp"

#include <cstdlib>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const hostname = osutil::get_hostname();
  CHECK(!hostname.empty());

  char env[] = "HOME=/tmp/smtpsink-home";
  PCHECK(putenv(env) == 0);
  CHECK_EQ(osutil::get_home_dir(), fs::path("/tmp/smtpsink-home"));

  CHECK_EQ(osutil::get_port("25", "tcp"), 25);
  CHECK_EQ(osutil::get_port("8025", "tcp"), 8025);
  CHECK_EQ(osutil::get_port("70000", "tcp"), 0);
  CHECK_EQ(osutil::get_port("no-such-service-here", "tcp"), 0);
}
