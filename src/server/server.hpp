#pragma once

#include "reload_bus.hpp"
#include "router.hpp"
#include "serving_context.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Accepts connections on the serving endpoint and starts one HttpSession per
// connection. Everything runs on the io_context passed in; the caller decides
// which thread runs it.
class Server {
private:
  net::io_context &ioc;
  tcp::acceptor acceptor;
  std::shared_ptr<const ServingContext> context;
  std::shared_ptr<const Router> router;
  std::shared_ptr<ReloadBus> bus;

  void do_accept();
  void on_accept(beast::error_code ec, tcp::socket socket);

public:
  Server(net::io_context &ioc, std::shared_ptr<const ServingContext> context,
         std::shared_ptr<ReloadBus> bus);

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  // Binds and starts accepting. Throws boost::system::system_error when the
  // endpoint cannot be bound.
  void listen();

  // Stops accepting new connections. Safe to call from any thread.
  void stop();

  tcp::endpoint local_endpoint() const { return acceptor.local_endpoint(); }
  const ServingContext &serving_context() const { return *context; }
};
