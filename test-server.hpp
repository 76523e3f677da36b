#ifndef TEST_SERVER_DOT_HPP
#define TEST_SERVER_DOT_HPP

// A scripted, single connection SMTP server on the loopback interface,
// for exercising the relay client from tests.

#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

class test_server {
public:
  struct script {
    int greeting{220};
    int ehlo{250};
    int mail{250};
    int data{354};
    int end_of_data{250};

    bool hang_up_after_greeting{false};

    // Filler lines added to the EHLO reply.
    int ehlo_lines{0};

    std::string greeting_text{"test.example ESMTP"};
    std::string quit_text{"bye"};

    // Answer MAIL with something that is not a reply.
    bool garbage_for_mail{false};

    // Read commands, never answer them.
    bool silent_after_greeting{false};

    // Recipients not listed get 250.
    std::map<std::string, int> rcpt;
  };

  explicit test_server(script s)
    : script_(std::move(s))
  {
    lfd_ = socket(AF_INET, SOCK_STREAM, 0);
    PCHECK(lfd_ >= 0);
    int one = 1;
    PCHECK(setsockopt(lfd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == 0);
    auto sin{sockaddr_in{}};
    sin.sin_family      = AF_INET;
    sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    PCHECK(bind(lfd_, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
    socklen_t len = sizeof(sin);
    PCHECK(getsockname(lfd_, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
    port_ = ntohs(sin.sin_port);
    PCHECK(listen(lfd_, 1) == 0);

    thread_ = std::thread([this] { serve_(); });
  }

  ~test_server()
  {
    wait();
    close(lfd_);
  }

  test_server(test_server const&) = delete;
  test_server& operator=(test_server const&) = delete;

  uint16_t port() const { return port_; }

  // Blocks until the session is over.
  void wait()
  {
    if (thread_.joinable())
      thread_.join();
  }

  // Valid after wait().
  std::vector<std::string> commands;
  std::vector<std::string> accepted;
  std::string              data;
  bool                     quit_seen{false};

private:
  bool read_line_(std::string& line)
  {
    line.clear();
    char ch;
    while (recv(fd_, &ch, 1, 0) == 1) {
      line += ch;
      if (line.size() >= 2 && line.compare(line.size() - 2, 2, "\r\n") == 0) {
        line.resize(line.size() - 2);
        return true;
      }
    }
    return false;
  }

  void reply_(int code, std::string_view text)
  {
    auto const rep = std::to_string(code) + " " + std::string(text) + "\r\n";
    send(fd_, rep.data(), rep.size(), MSG_NOSIGNAL);
  }

  void serve_()
  {
    fd_ = accept(lfd_, nullptr, nullptr);
    PCHECK(fd_ >= 0);

    reply_(script_.greeting, script_.greeting_text);
    if (script_.hang_up_after_greeting) {
      close(fd_);
      return;
    }

    std::string line;
    while (read_line_(line)) {
      commands.push_back(line);
      if (script_.silent_after_greeting)
        continue;
      auto const verb = line.substr(0, 4);
      if (verb == "EHLO") {
        if (script_.ehlo == 250) {
          std::string ehlo = "250-test.example\r\n";
          for (auto n = 0; n < script_.ehlo_lines; ++n)
            ehlo += "250-X-FILLER-" + std::to_string(n) + " "
                    + std::string(50, 'x') + "\r\n";
          ehlo += "250-8BITMIME\r\n"
                  "250-SIZE 10240000\r\n"
                  "250 HELP\r\n";
          send(fd_, ehlo.data(), ehlo.size(), MSG_NOSIGNAL);
        }
        else {
          reply_(script_.ehlo, "no EHLO for you");
        }
      }
      else if (verb == "HELO") {
        reply_(250, "test.example");
      }
      else if (verb == "MAIL") {
        if (script_.garbage_for_mail) {
          auto constexpr garbage = "hello there\r\n";
          send(fd_, garbage, strlen(garbage), MSG_NOSIGNAL);
          continue;
        }
        reply_(script_.mail, script_.mail == 250 ? "OK" : "sender no good");
      }
      else if (verb == "RCPT") {
        auto const b    = line.find('<');
        auto const e    = line.find('>');
        auto const rcpt = line.substr(b + 1, e - b - 1);
        auto const code = script_.rcpt.count(rcpt) ? script_.rcpt[rcpt] : 250;
        if (code == 250)
          accepted.push_back(rcpt);
        reply_(code, code == 250 ? "OK" : "no such user");
      }
      else if (verb == "DATA") {
        reply_(script_.data, script_.data == 354 ? "go ahead" : "no data");
        if (script_.data != 354)
          continue;
        while (read_line_(line) && line != ".") {
          if (!line.empty() && line.front() == '.')
            line.erase(0, 1);
          data += line + "\n";
        }
        reply_(script_.end_of_data,
               script_.end_of_data == 250 ? "queued" : "content rejected");
      }
      else if (verb == "RSET") {
        reply_(250, "OK");
      }
      else if (verb == "QUIT") {
        quit_seen = true;
        reply_(221, script_.quit_text);
        break;
      }
      else {
        reply_(500, "what?");
      }
    }
    close(fd_);
  }

  script      script_;
  int         lfd_{-1};
  int         fd_{-1};
  uint16_t    port_{0};
  std::thread thread_;
};

// A loopback port with nothing listening on it.
inline uint16_t unused_port()
{
  auto const fd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(fd >= 0);
  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  socklen_t len = sizeof(sin);
  PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  close(fd);
  return ntohs(sin.sin_port);
}

#endif // TEST_SERVER_DOT_HPP
