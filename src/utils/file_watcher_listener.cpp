#include "file_watcher_listener.hpp"
#include "log.hpp"
#include "paths.hpp"
#include <algorithm>

namespace {

fs::path normalize(const fs::path &path) {
  std::error_code ec;
  fs::path normal = fs::weakly_canonical(path, ec);
  if (ec) {
    normal = fs::absolute(path).lexically_normal();
  }
  return normal;
}

std::vector<fs::path> normalize_all(const std::vector<fs::path> &paths) {
  std::vector<fs::path> result;
  result.reserve(paths.size());
  for (const auto &path : paths) {
    result.push_back(normalize(path));
  }
  return result;
}

} // namespace

void ChangeBatcher::push(const fs::path &path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    pending_.insert(path);
    generation_++;
  }
  cv_.notify_all();
}

std::optional<std::vector<fs::path>>
ChangeBatcher::next_batch(std::chrono::milliseconds quiet) {
  std::unique_lock<std::mutex> lock(mutex_);

  cv_.wait(lock, [this] { return stopped_ || !pending_.empty(); });
  if (stopped_) {
    return std::nullopt;
  }

  const auto deadline =
      std::chrono::steady_clock::now() + quiet * kMaxQuietPeriods;
  std::uint64_t seen = generation_;
  for (;;) {
    auto until = std::min(std::chrono::steady_clock::now() + quiet, deadline);
    bool changed = cv_.wait_until(
        lock, until, [&] { return stopped_ || generation_ != seen; });
    if (stopped_) {
      return std::nullopt;
    }
    if (!changed || std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    seen = generation_;
  }

  std::vector<fs::path> batch(pending_.begin(), pending_.end());
  pending_.clear();
  return batch;
}

void ChangeBatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool ChangeBatcher::stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

bool WatchRules::accepts(const fs::path &path) const {
  std::string name = path.filename().string();
  if (name.empty() || name[0] == '.' || name[0] == '~' || name.back() == '~') {
    return false;
  }

  for (const auto &dir : ignored) {
    if (path_is_within(path, dir)) {
      return false;
    }
  }

  if (std::find(files.begin(), files.end(), path) != files.end()) {
    return true;
  }

  for (const auto &dir : directories) {
    if (path_is_within(path, dir)) {
      return true;
    }
  }
  return false;
}

DevServerListener::DevServerListener(ChangeBatcher &batcher,
                                     const WatchRules &rules)
    : batcher(batcher), rules(rules) {}

void DevServerListener::handleFileAction(efsw::WatchID watchid,
                                         const std::string &dir,
                                         const std::string &filename,
                                         efsw::Action action,
                                         std::string oldFilename) {
  (void)watchid;

  fs::path changed = (fs::path(dir) / filename).lexically_normal();
  if (rules.accepts(changed)) {
    batcher.push(changed);
  }

  if (action == efsw::Actions::Moved && !oldFilename.empty()) {
    fs::path previous = (fs::path(dir) / oldFilename).lexically_normal();
    if (rules.accepts(previous)) {
      batcher.push(previous);
    }
  }
}

ChangeWatcher::ChangeWatcher(const fs::path &root, WatchRules rules,
                             std::chrono::milliseconds debounce)
    : root_(normalize(root)), debounce_(debounce) {
  rules_.directories = normalize_all(rules.directories);
  rules_.files = normalize_all(rules.files);
  rules_.ignored = normalize_all(rules.ignored);
}

void ChangeWatcher::run(
    const std::function<void(const ChangeSet &)> &on_change) {
  DevServerListener listener(batcher_, rules_);
  efsw::FileWatcher watcher;

  std::set<fs::path> recursive(rules_.directories.begin(),
                               rules_.directories.end());
  for (const auto &dir : recursive) {
    if (!fs::is_directory(dir)) {
      log_warning("Skipping " + dir.string() + " (not found)");
      continue;
    }
    efsw::WatchID id = watcher.addWatch(dir.string(), &listener, true);
    if (id < 0) {
      log_warning("Cannot watch " + dir.string() + ": " +
                  efsw::Errors::Log::getLastErrorLog());
    } else {
      log_info("Watching " + dir.string());
    }
  }

  std::set<fs::path> parents;
  for (const auto &file : rules_.files) {
    fs::path parent = file.parent_path();
    bool covered = std::any_of(
        recursive.begin(), recursive.end(),
        [&](const fs::path &dir) { return path_is_within(parent, dir); });
    if (!covered) {
      parents.insert(parent);
    }
  }
  for (const auto &dir : parents) {
    efsw::WatchID id = watcher.addWatch(dir.string(), &listener, false);
    if (id < 0) {
      log_warning("Cannot watch " + dir.string() + ": " +
                  efsw::Errors::Log::getLastErrorLog());
    }
  }

  watcher.watch();

  while (auto batch = batcher_.next_batch(debounce_)) {
    on_change(ChangeSet{root_, std::move(*batch)});
  }
}

void ChangeWatcher::stop() { batcher_.stop(); }
