#include "rebuild_trigger.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <sstream>

RebuildTrigger::RebuildTrigger(Builder &builder, ConfigLoader load_config,
                               ServeOverrides overrides,
                               std::shared_ptr<ReloadBus> bus)
    : builder(builder), load_config(std::move(load_config)),
      overrides(std::move(overrides)), bus(std::move(bus)) {}

bool RebuildTrigger::on_change(const ChangeSet &changes) {
  std::ostringstream files;
  files << "Files changed:";
  for (const auto &path : changes.paths) {
    std::error_code ec;
    fs::path relative = fs::relative(path, changes.root, ec);
    files << " " << (ec || relative.empty() ? path : relative).string();
  }
  log_info(files.str());
  log_info("Building book...");

  auto start = std::chrono::high_resolution_clock::now();

  try {
    // The configuration may have changed on disk, and the live-reload
    // endpoint is not part of it, so both are re-applied every time.
    BookConfig config = load_config();
    apply_serve_overrides(config, overrides);
    builder.build(config);
  } catch (const std::exception &e) {
    log_error("Unable to rebuild the book: " + std::string(e.what()));
    return false;
  }

  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - start);

  std::size_t notified = bus->publish(ReloadMessage{});

  std::ostringstream done;
  done << "Rebuild complete in " << duration.count() << "ms";
  if (notified == 0) {
    done << ", no clients connected";
  } else if (notified == 1) {
    done << ", notified 1 client";
  } else {
    done << ", notified " << notified << " clients";
  }
  log_success(done.str());
  return true;
}
