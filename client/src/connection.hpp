#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <string>

#include "portbridge/protocol.hpp"

namespace portbridge {

// Caller side of the line protocol over a pair of descriptors connected to
// a worker's stdin (to_worker) and stdout (from_worker). Owns both.
class Connection {
public:
  Connection(int to_worker, int from_worker);

  // Reads the ready envelope; throws std::runtime_error if the first line is anything else.
  Capabilities wait_ready();

  Response call(const std::string& module, const std::string& function,
                const List& args = {}, const Dict& kwargs = {});
  nlohmann::json request(const nlohmann::json& req);
  bool ping();

  // Sends raw text as-is; the caller provides the newline.
  void send_raw(const std::string& text);
  std::string read_line();

  void close_input();

private:
  asio::io_context io_;
  asio::posix::stream_descriptor out_;
  asio::posix::stream_descriptor in_;
  std::string inbuf_;
  Codec codec_;
};

} // namespace portbridge
