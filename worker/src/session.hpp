#pragma once
#include <asio.hpp>
#include <string>
#include <nlohmann/json.hpp>

#include "portbridge/dispatcher.hpp"

namespace portbridge {

// Blocking read-eval-write loop over a pair of file descriptors
// (stdin/stdout for the worker). Takes ownership of both descriptors.
class Session {
public:
  Session(asio::io_context& io, int in_fd, int out_fd, Dispatcher& dispatcher);

  // Sends the ready envelope, then answers lines until end of input.
  // Write failures are thrown as asio::system_error.
  void run();

private:
  bool read_line(std::string& line);
  void send_json(const nlohmann::json& resp);

  asio::posix::stream_descriptor in_;
  asio::posix::stream_descriptor out_;
  std::string inbuf_;
  bool eof_{false};
  Dispatcher& dispatcher_;
};

}
