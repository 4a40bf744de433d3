#include "server.hpp"
#include "http_session.hpp"
#include "utils/log.hpp"
#include <boost/asio/post.hpp>

Server::Server(net::io_context &ioc,
               std::shared_ptr<const ServingContext> context,
               std::shared_ptr<ReloadBus> bus)
    : ioc(ioc), acceptor(ioc), context(context),
      router(std::make_shared<const Router>(context)), bus(std::move(bus)) {}

void Server::listen() {
  const tcp::endpoint &endpoint = context->endpoint;

  acceptor.open(endpoint.protocol());
  acceptor.set_option(net::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen(net::socket_base::max_listen_connections);

  log_trace("listening on " + endpoint.address().to_string() + ":" +
            std::to_string(acceptor.local_endpoint().port()));

  do_accept();
}

void Server::stop() {
  net::post(ioc, [this]() {
    beast::error_code ec;
    acceptor.close(ec);
  });
}

void Server::do_accept() {
  acceptor.async_accept(
      ioc, beast::bind_front_handler(&Server::on_accept, this));
}

void Server::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  if (ec) {
    log_warning("accept failed: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), router, bus)->run();
  }

  if (acceptor.is_open()) {
    do_accept();
  }
}
