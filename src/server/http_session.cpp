#include "http_session.hpp"
#include "livereload_session.hpp"
#include "static_files.hpp"
#include "utils/log.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string_view>

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

std::string_view to_std(beast::string_view value) {
  return std::string_view(value.data(), value.size());
}

} // namespace

HttpSession::HttpSession(tcp::socket &&socket,
                         std::shared_ptr<const Router> router,
                         std::shared_ptr<ReloadBus> bus)
    : stream_(std::move(socket)), router_(std::move(router)),
      bus_(std::move(bus)) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read,
                                          shared_from_this()));
}

void HttpSession::do_read() {
  req_ = {};
  stream_.expires_after(kReadTimeout);
  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::on_read,
                                             shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    return do_close();
  }
  if (ec) {
    if (ec != beast::error::timeout) {
      log_trace("http read failed: " + ec.message());
    }
    return;
  }

  method_ = std::string(to_std(req_.method_string()));
  target_ = std::string(to_std(req_.target()));
  handle_request();
}

void HttpSession::handle_request() {
  RouteMatch match = router_->resolve(target_);

  if (match.route == Route::LiveReloadUpgrade) {
    if (beast::websocket::is_upgrade(req_)) {
      return send_upgrade();
    }
    return send_text(http::status::bad_request,
                     "Expected a WebSocket upgrade request\n");
  }

  if (req_.method() != http::verb::get && req_.method() != http::verb::head) {
    http::response<http::string_body> res{http::status::method_not_allowed,
                                          req_.version()};
    res.set(http::field::allow, "GET, HEAD");
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "Method Not Allowed\n";
    res.prepare_payload();
    return send(std::move(res));
  }

  switch (match.route) {
  case Route::LocaleRedirect:
    return send_redirect(match.location);
  case Route::StaticAsset:
    return send_file(match.file);
  case Route::NotFoundFallback:
  case Route::LiveReloadUpgrade:
    return send_not_found(router_->context().fallback_404_path());
  }
}

void HttpSession::send_upgrade() {
  log_request(method_, target_,
              static_cast<unsigned>(http::status::switching_protocols));

  // The WebSocket stream has its own timeouts.
  stream_.expires_never();
  std::make_shared<LiveReloadSession>(stream_.release_socket(), bus_)
      ->run(std::move(req_));
}

template <class Body>
void HttpSession::prepare(http::response<Body> &res) const {
  res.set(http::field::server, "inkwell");
  res.set(http::field::cache_control, "no-cache");
  res.keep_alive(req_.keep_alive());
}

template <class Body> void HttpSession::send(http::response<Body> &&res) {
  prepare(res);
  log_request(method_, target_, res.result_int());

  auto sp = std::make_shared<http::response<Body>>(std::move(res));
  res_ = sp;

  http::async_write(stream_, *sp,
                    beast::bind_front_handler(&HttpSession::on_write,
                                              shared_from_this(),
                                              sp->need_eof()));
}

void HttpSession::send_redirect(const std::string &location) {
  http::response<http::empty_body> res{http::status::temporary_redirect,
                                       req_.version()};
  res.set(http::field::location, location);
  res.content_length(0);
  send(std::move(res));
}

void HttpSession::send_text(http::status status, const std::string &body) {
  http::response<http::string_body> res{status, req_.version()};
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.body() = body;
  res.prepare_payload();
  if (req_.method() == http::verb::head) {
    res.body().clear();
  }
  send(std::move(res));
}

void HttpSession::send_file(const fs::path &path) {
  auto info = stat_file(path);
  if (!info) {
    return send_not_found(router_->context().fallback_404_path());
  }

  if (is_not_modified(to_std(req_[http::field::if_none_match]),
                      to_std(req_[http::field::if_modified_since]), *info)) {
    http::response<http::empty_body> res{http::status::not_modified,
                                         req_.version()};
    res.set(http::field::etag, info->etag);
    res.set(http::field::last_modified, info->last_modified);
    return send(std::move(res));
  }

  if (req_.method() == http::verb::head) {
    http::response<http::empty_body> res{http::status::ok, req_.version()};
    res.set(http::field::content_type, mime_type(path));
    res.set(http::field::etag, info->etag);
    res.set(http::field::last_modified, info->last_modified);
    res.content_length(info->size);
    return send(std::move(res));
  }

  beast::error_code ec;
  http::file_body::value_type body;
  body.open(path.c_str(), beast::file_mode::scan, ec);
  if (ec) {
    log_trace("cannot open " + path.string() + ": " + ec.message());
    return send_not_found(router_->context().fallback_404_path());
  }

  auto size = body.size();
  http::response<http::file_body> res{
      std::piecewise_construct, std::make_tuple(std::move(body)),
      std::make_tuple(http::status::ok, req_.version())};
  res.set(http::field::content_type, mime_type(path));
  res.set(http::field::etag, info->etag);
  res.set(http::field::last_modified, info->last_modified);
  res.content_length(size);
  send(std::move(res));
}

void HttpSession::send_not_found(const fs::path &page) {
  std::ifstream file(page, std::ios::binary);
  if (!file.is_open()) {
    log_trace("404 page not found at " + page.string());
    return send_text(http::status::not_found, "404 Not Found\n");
  }

  std::stringstream content;
  content << file.rdbuf();

  http::response<http::string_body> res{http::status::not_found,
                                        req_.version()};
  res.set(http::field::content_type, mime_type(page));
  res.body() = content.str();
  res.prepare_payload();
  if (req_.method() == http::verb::head) {
    res.body().clear();
  }
  send(std::move(res));
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
  if (ec) {
    log_trace("http write failed: " + ec.message());
    return;
  }

  if (close) {
    return do_close();
  }

  res_ = nullptr;
  do_read();
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
