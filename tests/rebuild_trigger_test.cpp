#include "server/rebuild_trigger.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <vector>

namespace {

class RecordingBuilder : public Builder {
public:
  std::vector<BookConfig> builds;
  bool fail = false;

  void build(const BookConfig &config) override {
    if (fail) {
      throw BuildError("broken page");
    }
    builds.push_back(config);
  }
};

const ServeOverrides kOverrides{"ws://localhost:3000/__livereload", "/"};

ChangeSet changes_in(const fs::path &root) {
  return ChangeSet{root, {root / "src" / "index.md"}};
}

} // namespace

TEST(RebuildTrigger, SuccessfulRebuildPublishes) {
  TempDir dir;
  net::io_context ioc;
  auto bus = ReloadBus::create();
  auto subscriber = bus->subscribe(ioc.get_executor());

  RecordingBuilder builder;
  RebuildTrigger trigger(builder, [&] { return BookConfig::load(dir.path()); },
                         kOverrides, bus);

  EXPECT_TRUE(trigger.on_change(changes_in(dir.path())));
  ASSERT_EQ(builder.builds.size(), 1U);

  auto received = subscriber->try_receive();
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->status, ReceiveStatus::Message);
  EXPECT_EQ(received->message.text, "reload");
}

TEST(RebuildTrigger, OverridesAppliedToEveryBuild) {
  TempDir dir;
  dir.write("inkwell.yaml", "output:\n"
                            "  site_url: /docs/\n");
  auto bus = ReloadBus::create();

  RecordingBuilder builder;
  RebuildTrigger trigger(builder, [&] { return BookConfig::load(dir.path()); },
                         kOverrides, bus);

  trigger.on_change(changes_in(dir.path()));
  dir.write("inkwell.yaml", "title: Renamed\n"
                            "output:\n"
                            "  site_url: /other/\n");
  trigger.on_change(changes_in(dir.path()));

  ASSERT_EQ(builder.builds.size(), 2U);
  EXPECT_EQ(builder.builds[1].title, "Renamed");
  for (const auto &config : builder.builds) {
    EXPECT_EQ(config.site_url, "/");
    EXPECT_EQ(config.livereload_url, kOverrides.livereload_url);
  }
}

TEST(RebuildTrigger, FailedBuildPublishesNothing) {
  TempDir dir;
  net::io_context ioc;
  auto bus = ReloadBus::create();
  auto subscriber = bus->subscribe(ioc.get_executor());

  int notified = 0;
  subscriber->async_receive([&](ReceiveResult) { notified++; });

  RecordingBuilder builder;
  builder.fail = true;
  RebuildTrigger trigger(builder, [&] { return BookConfig::load(dir.path()); },
                         kOverrides, bus);

  EXPECT_FALSE(trigger.on_change(changes_in(dir.path())));
  ioc.poll();
  EXPECT_EQ(notified, 0);
  EXPECT_TRUE(subscriber->is_waiting());

  builder.fail = false;
  EXPECT_TRUE(trigger.on_change(changes_in(dir.path())));
  ioc.restart();
  ioc.poll();
  EXPECT_EQ(notified, 1);
}

TEST(RebuildTrigger, BrokenConfigurationPublishesNothing) {
  TempDir dir;
  net::io_context ioc;
  auto bus = ReloadBus::create();
  auto subscriber = bus->subscribe(ioc.get_executor());

  dir.write("inkwell.yaml", "title: [oops\n");
  RecordingBuilder builder;
  RebuildTrigger trigger(builder, [&] { return BookConfig::load(dir.path()); },
                         kOverrides, bus);

  EXPECT_FALSE(trigger.on_change(changes_in(dir.path())));
  EXPECT_TRUE(builder.builds.empty());
  EXPECT_FALSE(subscriber->try_receive().has_value());
}

TEST(RebuildTrigger, OutputDirectoryStaysFixed) {
  TempDir dir;
  dir.write("inkwell.yaml", "build_dir: public\n");
  auto bus = ReloadBus::create();

  ServeOverrides overrides = kOverrides;
  overrides.build_dir = BookConfig::load(dir.path()).build_dir;

  RecordingBuilder builder;
  RebuildTrigger trigger(builder, [&] { return BookConfig::load(dir.path()); },
                         overrides, bus);

  EXPECT_TRUE(trigger.on_change(changes_in(dir.path())));
  dir.write("inkwell.yaml", "build_dir: moved\n");
  EXPECT_TRUE(trigger.on_change(changes_in(dir.path())));

  ASSERT_EQ(builder.builds.size(), 2U);
  EXPECT_EQ(builder.builds[0].output_dir(), dir.path() / "public");
  EXPECT_EQ(builder.builds[1].output_dir(), builder.builds[0].output_dir());
}
