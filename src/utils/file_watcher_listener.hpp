#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// A batch of changed files below `root`.
struct ChangeSet {
  fs::path root;
  std::vector<fs::path> paths;
};

// Collects paths reported by the watcher thread and hands them out in
// batches once the file system has been quiet for a while.
class ChangeBatcher {
private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::set<fs::path> pending_;
  std::uint64_t generation_ = 0;
  bool stopped_ = false;

public:
  // A batch is flushed at the latest this many quiet periods after its first
  // path, even if changes keep arriving.
  static constexpr int kMaxQuietPeriods = 5;

  void push(const fs::path &path);

  // Blocks until at least one path was pushed and no new one arrived for
  // `quiet`, or kMaxQuietPeriods * quiet passed. Returns nullopt once stop()
  // was called.
  std::optional<std::vector<fs::path>>
  next_batch(std::chrono::milliseconds quiet);

  void stop();
  bool stopped() const;
};

// Which paths are worth a rebuild.
struct WatchRules {
  std::vector<fs::path> directories; // watched recursively
  std::vector<fs::path> files;       // watched through their parent directory
  std::vector<fs::path> ignored;     // e.g. the output directory

  bool accepts(const fs::path &path) const;
};

class DevServerListener : public efsw::FileWatchListener {
private:
  ChangeBatcher &batcher;
  const WatchRules &rules;

public:
  DevServerListener(ChangeBatcher &batcher, const WatchRules &rules);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;
};

// Watches the book sources and calls back with debounced change sets. The
// callback runs on the thread that called run(), one batch at a time.
class ChangeWatcher {
public:
  static constexpr std::chrono::milliseconds kDefaultDebounce{1000};

  ChangeWatcher(const fs::path &root, WatchRules rules,
                std::chrono::milliseconds debounce = kDefaultDebounce);

  // Blocks until stop() is called from another thread or a signal handler.
  void run(const std::function<void(const ChangeSet &)> &on_change);

  void stop();

  const WatchRules &rules() const { return rules_; }

private:
  fs::path root_;
  WatchRules rules_;
  std::chrono::milliseconds debounce_;
  ChangeBatcher batcher_;
};
