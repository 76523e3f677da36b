#ifndef MAILDIR_DOT_HPP
#define MAILDIR_DOT_HPP

#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "fs.hpp"
#include "message.hpp"

// A Maildir, see: <https://cr.yp.to/proto/maildir.html>
//
// Messages are written to tmp/ and renamed into new/.  Safe to share
// between threads.

class Maildir {
public:
  // Creates root/folder with tmp/, new/ and cur/ as needed.  Throws
  // std::system_error when it can't.
  explicit Maildir(fs::path root, std::string_view folder = "");

  Maildir(Maildir const&) = delete;
  Maildir& operator=(Maildir const&) = delete;

  // $MAILDIR, or ~/Maildir
  static fs::path locate();

  fs::path const& path() const { return dir_; }

  // Returns the path of the delivered file.
  fs::path add(message::parsed const& msg);
  fs::path add(std::string_view contents);

  // Everything in new/ and cur/, sorted.
  std::vector<fs::path> messages() const;

  void clear();

private:
  std::string unique_name_();
  fs::path    deliver_(std::function<void(std::ostream&)> const& put);

  fs::path    dir_;
  std::string hostname_;

  mutable std::mutex mutex_;
  unsigned long      deliveries_{0};
};

#endif // MAILDIR_DOT_HPP
