#include "reload_bus.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>
#include <utility>

std::shared_ptr<ReloadBus> ReloadBus::create(std::size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("ReloadBus capacity must be positive");
  }
  return std::shared_ptr<ReloadBus>(new ReloadBus(capacity));
}

ReloadBus::ReloadBus(std::size_t capacity) : capacity_(capacity) {}

std::size_t ReloadBus::publish(const ReloadMessage &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (closed_ || subscribers_.empty()) {
    return 0;
  }

  buffer_.push_back(Entry{next_seq_++, message});
  if (buffer_.size() > capacity_) {
    buffer_.pop_front();
  }

  for (ReloadSubscriber *subscriber : subscribers_) {
    if (!subscriber->waiter_) {
      continue;
    }
    if (auto result = next_for(*subscriber)) {
      complete(*subscriber, std::move(*result));
    }
  }

  return subscribers_.size();
}

std::unique_ptr<ReloadSubscriber>
ReloadBus::subscribe(net::any_io_executor executor) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unique_ptr<ReloadSubscriber> subscriber(
      new ReloadSubscriber(shared_from_this(), std::move(executor), next_seq_));
  subscribers_.insert(subscriber.get());
  return subscriber;
}

void ReloadBus::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  for (ReloadSubscriber *subscriber : subscribers_) {
    if (!subscriber->waiter_) {
      continue;
    }
    if (auto result = next_for(*subscriber)) {
      complete(*subscriber, std::move(*result));
    }
  }
}

bool ReloadBus::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t ReloadBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

std::optional<ReceiveResult> ReloadBus::next_for(ReloadSubscriber &subscriber) {
  std::uint64_t oldest = buffer_.empty() ? next_seq_ : buffer_.front().seq;

  if (subscriber.next_seq_ < oldest) {
    ReceiveResult result;
    result.status = ReceiveStatus::Lagged;
    result.missed = oldest - subscriber.next_seq_;
    subscriber.next_seq_ = oldest;
    return result;
  }

  if (subscriber.next_seq_ < next_seq_) {
    ReceiveResult result;
    result.message = buffer_[subscriber.next_seq_ - oldest].message;
    subscriber.next_seq_++;
    return result;
  }

  if (closed_) {
    ReceiveResult result;
    result.status = ReceiveStatus::Closed;
    return result;
  }

  return std::nullopt;
}

void ReloadBus::complete(ReloadSubscriber &subscriber, ReceiveResult result) {
  ReloadSubscriber::Handler handler = std::move(subscriber.waiter_);
  subscriber.waiter_ = nullptr;
  net::post(subscriber.executor_,
            [handler = std::move(handler), result = std::move(result)]() {
              handler(result);
            });
}

ReloadSubscriber::ReloadSubscriber(std::shared_ptr<ReloadBus> bus,
                                   net::any_io_executor executor,
                                   std::uint64_t next_seq)
    : bus_(std::move(bus)), executor_(std::move(executor)),
      next_seq_(next_seq) {}

ReloadSubscriber::~ReloadSubscriber() {
  std::lock_guard<std::mutex> lock(bus_->mutex_);
  bus_->subscribers_.erase(this);
}

void ReloadSubscriber::async_receive(Handler handler) {
  std::lock_guard<std::mutex> lock(bus_->mutex_);
  if (waiter_) {
    throw std::logic_error("ReloadSubscriber already has a pending receive");
  }
  waiter_ = std::move(handler);
  if (auto result = bus_->next_for(*this)) {
    bus_->complete(*this, std::move(*result));
  }
}

std::optional<ReceiveResult> ReloadSubscriber::try_receive() {
  std::lock_guard<std::mutex> lock(bus_->mutex_);
  if (waiter_) {
    throw std::logic_error("ReloadSubscriber already has a pending receive");
  }
  return bus_->next_for(*this);
}

void ReloadSubscriber::cancel() {
  Handler dropped;
  {
    std::lock_guard<std::mutex> lock(bus_->mutex_);
    dropped = std::move(waiter_);
    waiter_ = nullptr;
  }
}

bool ReloadSubscriber::is_waiting() const {
  std::lock_guard<std::mutex> lock(bus_->mutex_);
  return static_cast<bool>(waiter_);
}
