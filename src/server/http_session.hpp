#pragma once

#include "reload_bus.hpp"
#include "router.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// A keep-alive HTTP/1.1 connection. Every request goes through the router;
// a live-reload upgrade hands the socket over to a LiveReloadSession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, std::shared_ptr<const Router> router,
              std::shared_ptr<ReloadBus> bus);

  void run();

private:
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);
  void handle_request();

  void send_upgrade();
  void send_redirect(const std::string &location);
  void send_file(const fs::path &path);
  void send_not_found(const fs::path &page);
  void send_text(http::status status, const std::string &body);

  template <class Body> void send(http::response<Body> &&res);
  template <class Body> void prepare(http::response<Body> &res) const;

  void on_write(bool close, beast::error_code ec, std::size_t bytes);
  void do_close();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<ReloadBus> bus_;
  http::request<http::string_body> req_;
  std::string method_;
  std::string target_;
  std::shared_ptr<void> res_;
};
