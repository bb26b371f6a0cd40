#include "minitest.hpp"
#include "app/Cli.hpp"
#include <string>
#include <vector>

using reclaim::app::CliOptions;
using reclaim::app::ToolInfo;
using reclaim::app::parse_args;

static const ToolInfo kMem{"reclaim-mem", true, true};
static const ToolInfo kDisk{"reclaim-disk", false, false};

static bool parse(const ToolInfo& tool, std::vector<std::string> args, CliOptions& opts, std::string& err) {
  std::vector<char*> argv;
  std::string prog = tool.name;
  argv.push_back(prog.data());
  for (auto& a : args) argv.push_back(a.data());
  return parse_args(static_cast<int>(argv.size()), argv.data(), tool, opts, err);
}

TEST(cli_long_flags) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse(kMem, {"--yes", "--dry-run", "--aggressive", "--quit-apps", "--summary"}, o, err));
  ASSERT_TRUE(o.yes && o.dry_run && o.aggressive && o.quit_apps && o.summary);
  ASSERT_TRUE(!o.verbose);
}

TEST(cli_combined_short_flags) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse(kMem, {"-yvd", "-q"}, o, err));
  ASSERT_TRUE(o.yes);
  ASSERT_TRUE(o.verbose);
  ASSERT_TRUE(o.dry_run);
  ASSERT_TRUE(o.quit_apps);
  ASSERT_TRUE(!o.aggressive);
}

TEST(cli_disk_tool_rejects_memory_flags) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(!parse(kDisk, {"-a"}, o, err));
  ASSERT_TRUE(err.find("-a") != std::string::npos);
  CliOptions o2;
  ASSERT_TRUE(!parse(kDisk, {"--quit-apps"}, o2, err));
  CliOptions o3;
  ASSERT_TRUE(parse(kDisk, {"-ys"}, o3, err));
}

TEST(cli_unknown_option) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(!parse(kMem, {"--frobnicate"}, o, err));
  ASSERT_TRUE(err.find("--frobnicate") != std::string::npos);
  ASSERT_TRUE(!parse(kMem, {"stray"}, o, err));
}

TEST(cli_value_options) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse(kDisk, {"--config", "/etc/reclaim.toml", "--log-dir=/var/log/reclaim"}, o, err));
  ASSERT_EQ(o.config_path, "/etc/reclaim.toml");
  ASSERT_EQ(o.log_dir, "/var/log/reclaim");
  CliOptions o2;
  ASSERT_TRUE(!parse(kDisk, {"--log-dir"}, o2, err));
  CliOptions o3;
  ASSERT_TRUE(!parse(kDisk, {"--yes=no"}, o3, err));
}

TEST(cli_help_and_version) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(parse(kMem, {"-h", "--version"}, o, err));
  ASSERT_TRUE(o.help && o.version);
  auto mem = reclaim::app::usage(kMem);
  auto disk = reclaim::app::usage(kDisk);
  ASSERT_TRUE(mem.find("--quit-apps") != std::string::npos);
  ASSERT_TRUE(disk.find("--quit-apps") == std::string::npos);
  ASSERT_TRUE(disk.find("--dry-run") != std::string::npos);
}

TEST(cli_platform_check) {
  std::string err;
  ASSERT_TRUE(reclaim::app::platform_supported(err));
  ASSERT_TRUE(err.empty());
}
