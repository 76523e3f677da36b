#include "Pill.hpp"

#include <iostream>
#include <sstream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Pill red, blue;
  CHECK(red != blue);

  std::stringstream red_str, blue_str;

  red_str << red;
  blue_str << blue;

  CHECK_NE(red_str.str(), blue_str.str());

  CHECK_EQ(13U, red_str.str().length());
  CHECK_EQ(13U, blue_str.str().length());
  CHECK_EQ(red_str.str().find_first_not_of("ybndrfg8ejkmcpqxot1uwisza345h769"),
           std::string::npos);

  Pill red2(red);
  CHECK(red == red2);

  std::cout << red << '\n' << blue << '\n';
}
