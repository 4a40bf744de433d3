#ifndef REBUILD_TRIGGER_HPP
#define REBUILD_TRIGGER_HPP

#include "core/builder.hpp"
#include "server/reload_bus.hpp"
#include "utils/config.hpp"
#include "utils/file_watcher_listener.hpp"
#include <functional>
#include <memory>

// Rebuilds the book for every batch of changed files and tells connected
// browsers to reload once the build succeeded. Failures are logged and the
// last good output keeps being served.
class RebuildTrigger {
public:
  using ConfigLoader = std::function<BookConfig()>;

  RebuildTrigger(Builder &builder, ConfigLoader load_config,
                 ServeOverrides overrides, std::shared_ptr<ReloadBus> bus);

  // Returns true when the rebuild succeeded and a reload was published.
  bool on_change(const ChangeSet &changes);

private:
  Builder &builder;
  ConfigLoader load_config;
  ServeOverrides overrides;
  std::shared_ptr<ReloadBus> bus;
};

#endif
