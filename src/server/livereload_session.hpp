#pragma once

#include "reload_bus.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One browser tab waiting for the next rebuild. The session subscribes to the
// reload bus, upgrades to WebSocket, waits for one message, sends a single
// "reload" text frame and closes. A reloaded page opens a new session.
class LiveReloadSession
    : public std::enable_shared_from_this<LiveReloadSession> {
public:
  enum class State {
    Start,
    Subscribed,
    Waiting,
    Notify,
    Closed,
  };

  LiveReloadSession(tcp::socket &&socket, std::shared_ptr<ReloadBus> bus);

  // Takes the upgrade request that was read by the HTTP session.
  void run(http::request<http::string_body> req);

  State state() const { return state_; }

private:
  void transition(State next);

  void on_accept(beast::error_code ec);
  void on_reload(ReceiveResult result);
  void on_write(beast::error_code ec, std::size_t bytes);
  void on_close(beast::error_code ec);

  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);

  std::string remote_address() const;

  websocket::stream<beast::tcp_stream> ws_;
  std::shared_ptr<ReloadBus> bus_;
  std::unique_ptr<ReloadSubscriber> subscriber_;
  beast::flat_buffer buffer_;
  std::string notification_;
  State state_ = State::Start;
};

const char *to_string(LiveReloadSession::State state);
