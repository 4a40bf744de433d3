#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace net = boost::asio;

// "Content changed, reload now". The text is what live-reload clients receive.
struct ReloadMessage {
  std::string text = "reload";
};

enum class ReceiveStatus {
  Message,
  // The subscriber fell behind the buffer bound and some messages are gone.
  // Treated exactly like a message by live-reload sessions.
  Lagged,
  Closed,
};

struct ReceiveResult {
  ReceiveStatus status = ReceiveStatus::Message;
  ReloadMessage message;
  std::uint64_t missed = 0;
};

class ReloadSubscriber;

// Bounded broadcast channel between the rebuild side and the live-reload
// connections. Publishing never waits on subscribers; a subscriber only sees
// messages published after it subscribed.
class ReloadBus : public std::enable_shared_from_this<ReloadBus> {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  static std::shared_ptr<ReloadBus> create(std::size_t capacity =
                                               kDefaultCapacity);

  ReloadBus(const ReloadBus &) = delete;
  ReloadBus &operator=(const ReloadBus &) = delete;

  // Returns the number of subscribers the message was offered to. With no
  // subscribers the message is dropped.
  std::size_t publish(const ReloadMessage &message = {});

  // Completion handlers of the returned subscriber run on `executor`.
  std::unique_ptr<ReloadSubscriber> subscribe(net::any_io_executor executor);

  // Wakes every waiting subscriber with ReceiveStatus::Closed. Later
  // publishes are ignored.
  void close();

  bool is_closed() const;
  std::size_t subscriber_count() const;
  std::size_t capacity() const { return capacity_; }

private:
  friend class ReloadSubscriber;

  struct Entry {
    std::uint64_t seq;
    ReloadMessage message;
  };

  explicit ReloadBus(std::size_t capacity);

  // Both require mutex_ to be held.
  std::optional<ReceiveResult> next_for(ReloadSubscriber &subscriber);
  void complete(ReloadSubscriber &subscriber, ReceiveResult result);

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<Entry> buffer_;
  std::uint64_t next_seq_ = 0;
  std::set<ReloadSubscriber *> subscribers_;
  bool closed_ = false;
};

// Receiving end owned by exactly one consumer.
class ReloadSubscriber {
public:
  using Handler = std::function<void(ReceiveResult)>;

  ~ReloadSubscriber();

  ReloadSubscriber(const ReloadSubscriber &) = delete;
  ReloadSubscriber &operator=(const ReloadSubscriber &) = delete;

  // Completes immediately (through the executor) when a message is pending,
  // otherwise once the next publish or close happens. Only one receive may
  // be outstanding.
  void async_receive(Handler handler);

  std::optional<ReceiveResult> try_receive();

  // Drops an outstanding receive without invoking its handler.
  void cancel();

  bool is_waiting() const;

private:
  friend class ReloadBus;

  ReloadSubscriber(std::shared_ptr<ReloadBus> bus,
                   net::any_io_executor executor, std::uint64_t next_seq);

  std::shared_ptr<ReloadBus> bus_;
  net::any_io_executor executor_;
  std::uint64_t next_seq_;
  Handler waiter_;
};
