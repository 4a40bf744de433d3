#include "livereload_session.hpp"
#include "utils/log.hpp"

const char *to_string(LiveReloadSession::State state) {
  switch (state) {
  case LiveReloadSession::State::Start:
    return "start";
  case LiveReloadSession::State::Subscribed:
    return "subscribed";
  case LiveReloadSession::State::Waiting:
    return "waiting";
  case LiveReloadSession::State::Notify:
    return "notify";
  case LiveReloadSession::State::Closed:
    return "closed";
  }
  return "unknown";
}

LiveReloadSession::LiveReloadSession(tcp::socket &&socket,
                                     std::shared_ptr<ReloadBus> bus)
    : ws_(std::move(socket)), bus_(std::move(bus)) {}

std::string LiveReloadSession::remote_address() const {
  beast::error_code ec;
  auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

void LiveReloadSession::transition(State next) {
  log_trace(std::string("websocket ") + remote_address() + ": " +
            to_string(state_) + " -> " + to_string(next));
  state_ = next;
}

void LiveReloadSession::run(http::request<http::string_body> req) {
  // Subscribe before the handshake so a rebuild finishing while the client
  // is still upgrading is not lost.
  subscriber_ = bus_->subscribe(ws_.get_executor());
  transition(State::Subscribed);

  beast::get_lowest_layer(ws_).expires_never();

  auto timeouts =
      websocket::stream_base::timeout::suggested(beast::role_type::server);
  timeouts.keep_alive_pings = true;
  ws_.set_option(timeouts);
  ws_.set_option(
      websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(http::field::server, "inkwell");
      }));

  ws_.async_accept(req, beast::bind_front_handler(&LiveReloadSession::on_accept,
                                                  shared_from_this()));
}

void LiveReloadSession::on_accept(beast::error_code ec) {
  if (ec) {
    log_trace("websocket handshake failed: " + ec.message());
    subscriber_.reset();
    transition(State::Closed);
    return;
  }

  log_trace("websocket got connection from " + remote_address());
  transition(State::Waiting);

  subscriber_->async_receive(
      [self = shared_from_this()](ReceiveResult result) {
        self->on_reload(std::move(result));
      });

  do_read();
}

void LiveReloadSession::on_reload(ReceiveResult result) {
  if (state_ != State::Waiting) {
    return;
  }

  // One notification per connection, nothing more is awaited.
  subscriber_.reset();

  if (result.status == ReceiveStatus::Closed) {
    transition(State::Closed);
    ws_.async_close(websocket::close_code::going_away,
                    beast::bind_front_handler(&LiveReloadSession::on_close,
                                              shared_from_this()));
    return;
  }

  if (result.status == ReceiveStatus::Lagged) {
    log_trace("websocket subscriber lagged by " +
              std::to_string(result.missed) + " messages");
    notification_ = ReloadMessage{}.text;
  } else {
    notification_ = result.message.text;
  }

  log_trace("notify of reload");
  transition(State::Notify);

  ws_.text(true);
  ws_.async_write(net::buffer(notification_),
                  beast::bind_front_handler(&LiveReloadSession::on_write,
                                            shared_from_this()));
}

void LiveReloadSession::on_write(beast::error_code ec, std::size_t) {
  transition(State::Closed);

  if (ec) {
    log_trace("websocket write failed: " + ec.message());
    return;
  }

  ws_.async_close(websocket::close_code::normal,
                  beast::bind_front_handler(&LiveReloadSession::on_close,
                                            shared_from_this()));
}

void LiveReloadSession::on_close(beast::error_code ec) {
  if (ec) {
    log_trace("websocket close failed: " + ec.message());
  }
}

void LiveReloadSession::do_read() {
  ws_.async_read(buffer_, beast::bind_front_handler(&LiveReloadSession::on_read,
                                                    shared_from_this()));
}

void LiveReloadSession::on_read(beast::error_code ec, std::size_t) {
  if (ec) {
    if (state_ == State::Waiting) {
      // The client went away before anything changed.
      if (subscriber_) {
        subscriber_->cancel();
        subscriber_.reset();
      }
      transition(State::Closed);
    }
    if (ec != websocket::error::closed) {
      log_trace("websocket read ended: " + ec.message());
    }
    return;
  }

  // Clients have nothing to say. Keep reading until the stream errors so
  // pongs and the closing handshake are processed.
  buffer_.consume(buffer_.size());
  do_read();
}
