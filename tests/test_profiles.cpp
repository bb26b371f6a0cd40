#include "minitest.hpp"
#include "app/Profiles.hpp"
#include <string>

using reclaim::app::Config;
using reclaim::app::disk_profile;
using reclaim::app::memory_profile;
using reclaim::app::ProfileFlags;

static std::vector<std::string> names(const std::vector<reclaim::app::CategorySpec>& cats) {
  std::vector<std::string> out;
  for (const auto& c : cats) out.push_back(c.name);
  return out;
}

TEST(profiles_memory_default_categories) {
  Config cfg;
  auto n = names(memory_profile(cfg, ProfileFlags{}));
  ASSERT_EQ(n.size(), 2u);
  ASSERT_EQ(n[0], "purge");
  ASSERT_EQ(n[1], "caches");
}

TEST(profiles_memory_flags_add_categories) {
  Config cfg;
  auto cats = memory_profile(cfg, ProfileFlags{true, true});
  auto n = names(cats);
  ASSERT_EQ(n.size(), 4u);
  ASSERT_EQ(n[2], "services");
  ASSERT_EQ(n[3], "apps");
  ASSERT_TRUE(cats[3].processes);
  ASSERT_TRUE(!cats[0].processes);
  ASSERT_TRUE(cats[0].commands[0].needs_root);
}

TEST(profiles_disk_order_and_extra) {
  Config cfg;
  cfg.extra_paths = {"/srv/scratch/*"};
  auto cats = disk_profile(cfg);
  auto n = names(cats);
  ASSERT_EQ(n.size(), 6u);
  ASSERT_EQ(n[0], "temp");
  ASSERT_EQ(n[1], "caches");
  ASSERT_EQ(n[2], "trash");
  ASSERT_EQ(n[3], "logs");
  ASSERT_EQ(n[4], "development");
  ASSERT_EQ(n[5], "extra");
  ASSERT_EQ(cats[5].paths[0].pattern, "/srv/scratch/*");
  for (const auto& c : cats) ASSERT_TRUE(!c.processes);
}

TEST(profiles_disabled_categories_dropped) {
  Config cfg;
  cfg.categories = {{"trash", false}, {"temp", true}, {"purge", false}};
  auto disk = names(disk_profile(cfg));
  ASSERT_EQ(disk.size(), 4u);
  for (const auto& n : disk) ASSERT_NE(n, "trash");
  auto mem = names(memory_profile(cfg, ProfileFlags{}));
  ASSERT_EQ(mem.size(), 1u);
  ASSERT_EQ(mem[0], "caches");
}
