#include "session.hpp"
#include "portbridge/protocol.hpp"
#include <array>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <spdlog/spdlog.h>

namespace portbridge {

Session::Session(asio::io_context& io, int in_fd, int out_fd, Dispatcher& dispatcher)
 : in_(io, in_fd), out_(io, out_fd), dispatcher_(dispatcher) {}

void Session::run() {
  send_json(dispatcher_.ready_envelope());

  std::string line;
  while (read_line(line)) {
    auto resp = dispatcher_.handle_line(line);
    if (resp) send_json(*resp);
  }
  spdlog::info("input closed after {} requests", dispatcher_.requests_served());
}

bool Session::read_line(std::string& line) {
  std::array<char, 4096> chunk;
  for (;;) {
    if (try_extract_line(inbuf_, line)) return true;

    if (eof_) {
      // last line without a trailing newline still counts
      if (inbuf_.empty()) return false;
      line.swap(inbuf_);
      inbuf_.clear();
      return true;
    }

    asio::error_code ec;
    std::size_t n = in_.read_some(asio::buffer(chunk), ec);
    if (ec == asio::error::eof) {
      eof_ = true;
    } else if (ec) {
      spdlog::error("read failed: {}", ec.message());
      eof_ = true;
    }
    inbuf_.append(chunk.data(), n);
  }
}

void Session::send_json(const nlohmann::json& resp) {
  const std::string bytes = frame_json(resp);
  asio::write(out_, asio::buffer(bytes)); // blocking write, nothing buffered in user space
}

} // namespace portbridge
