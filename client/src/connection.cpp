#include "connection.hpp"
#include <array>
#include <stdexcept>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace portbridge {

Connection::Connection(int to_worker, int from_worker)
 : out_(io_, to_worker), in_(io_, from_worker) {}

Capabilities Connection::wait_ready() {
  const auto ready = nlohmann::json::parse(read_line());
  if (!ready.is_object() || !ready.value("ready", false)) {
    throw std::runtime_error("worker did not announce readiness: " + ready.dump());
  }
  // decode what the worker can actually carry
  codec_ = Codec(capabilities_from_ready(ready));
  return codec_.capabilities();
}

Response Connection::call(const std::string& module, const std::string& function,
                          const List& args, const Dict& kwargs) {
  send_raw(encode_request(codec_, module, function, args, kwargs));
  return decode_response(codec_, read_line());
}

nlohmann::json Connection::request(const nlohmann::json& req) {
  send_raw(frame_json(req));
  return nlohmann::json::parse(read_line());
}

bool Connection::ping() {
  auto resp = request({{"cmd", "ping"}});
  auto it = resp.find("ok");
  return it != resp.end() && it->is_string() && *it == "pong";
}

void Connection::send_raw(const std::string& text) {
  asio::write(out_, asio::buffer(text));
}

std::string Connection::read_line() {
  std::string line;
  std::array<char, 4096> chunk;
  while (!try_extract_line(inbuf_, line)) {
    // eof is reported as asio::error::eof by the throwing overload
    std::size_t n = in_.read_some(asio::buffer(chunk));
    inbuf_.append(chunk.data(), n);
  }
  return line;
}

void Connection::close_input() {
  asio::error_code ignore;
  out_.close(ignore);
}

} // namespace portbridge
