#include "Maildir.hpp"

#include "Pill.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <system_error>

#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

#include <boost/algorithm/string/replace.hpp>

namespace {
char const* const subdirs[]{"tmp", "new", "cur"};

void make_dir(fs::path const& dir)
{
  error_code ec;
  create_directories(dir, ec);
  if (ec) {
    LOG(ERROR) << "can't create " << dir << ": " << ec.message();
    throw std::system_error(ec, "can't create " + dir.string());
  }
}
} // namespace

fs::path Maildir::locate()
{
  auto const maildir_ev{getenv("MAILDIR")};
  if (maildir_ev) {
    return maildir_ev;
  }
  else {
    return osutil::get_home_dir() / "Maildir";
  }
}

Maildir::Maildir(fs::path root, std::string_view folder)
  : dir_(std::move(root))
{
  if (!folder.empty()) {
    dir_ /= folder;
  }
  for (auto const sub : subdirs) {
    make_dir(dir_ / sub);
  }

  // '/' and ':' can't be in the unique part.
  hostname_ = osutil::get_hostname();
  boost::replace_all(hostname_, "/", "\\057");
  boost::replace_all(hostname_, ":", "\\072");
}

std::string Maildir::unique_name_()
{
  timeval tv;
  PCHECK(gettimeofday(&tv, nullptr) == 0);

  Pill const pill;
  // One process can deliver more than one message per microsecond.
  return fmt::format("{}.M{}P{}Q{}R{}.{}", tv.tv_sec, tv.tv_usec, getpid(),
                     ++deliveries_, pill.as_string_view(), hostname_);
}

fs::path Maildir::add(message::parsed const& msg)
{
  return deliver_([&msg](std::ostream& os) {
    if (!msg.write(os, "\n"))
      throw std::ios_base::failure("message write failed");
  });
}

fs::path Maildir::add(std::string_view contents)
{
  return deliver_([contents](std::ostream& os) {
    os.write(contents.data(), contents.size());
  });
}

fs::path Maildir::deliver_(std::function<void(std::ostream&)> const& put)
{
  std::lock_guard<std::mutex> lock(mutex_);

  auto const uniq  = unique_name_();
  auto const tmpfn = dir_ / "tmp" / uniq;
  auto const newfn = dir_ / "new" / uniq;

  try {
    std::ofstream ofs;
    ofs.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    ofs.open(tmpfn, std::ios::binary);
    put(ofs);
    ofs.close();
  }
  catch (std::system_error const& e) {
    LOG(ERROR) << "can't write " << tmpfn << ": " << e.what();
    error_code ec;
    fs::remove(tmpfn, ec);
    throw;
  }

  error_code ec;
  rename(tmpfn, newfn, ec);
  if (ec) {
    LOG(ERROR) << "can't rename " << tmpfn << " to " << newfn << ": "
               << ec.message();
    fs::remove(tmpfn, ec);
    throw std::system_error(ec, "can't deliver to " + newfn.string());
  }

  LOG(INFO) << "successfully delivered " << newfn;
  return newfn;
}

std::vector<fs::path> Maildir::messages() const
{
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<fs::path> msgs;
  for (auto const sub : {"new", "cur"}) {
    for (auto const& entry : fs::directory_iterator(dir_ / sub)) {
      if (entry.is_regular_file())
        msgs.push_back(entry.path());
    }
  }
  std::sort(begin(msgs), end(msgs));
  return msgs;
}

void Maildir::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<fs::path> files;
  for (auto const sub : subdirs) {
    for (auto const& entry : fs::directory_iterator(dir_ / sub)) {
      if (entry.is_regular_file())
        files.push_back(entry.path());
    }
  }
  for (auto const& file : files) {
    error_code ec;
    fs::remove(file, ec);
    if (ec) {
      LOG(ERROR) << "can't remove " << file << ": " << ec.message();
      throw std::system_error(ec, "can't remove " + file.string());
    }
  }
  LOG(INFO) << "removed " << files.size() << " messages from " << dir_;
}
