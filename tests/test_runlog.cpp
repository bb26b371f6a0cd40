#include "minitest.hpp"
#include "app/RunLog.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using reclaim::app::RunLog;
using reclaim::model::ActionResult;
using reclaim::model::ActionStatus;
using reclaim::model::CleanupSession;

static fs::path test_dir(const char* suffix) {
  return fs::temp_directory_path() /
         ("reclaim_runlog_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static CleanupSession sample_session() {
  CleanupSession s;
  s.tool = "reclaim-disk";
  s.end_time = std::chrono::system_clock::now();
  ActionResult ok;
  ok.status = ActionStatus::Success;
  ok.bytes_freed = 4096;
  ActionResult bad;
  bad.status = ActionStatus::Failed;
  s.actions = {ok, bad};
  reclaim::model::ResourceSnapshot b, f;
  b.available_bytes = 1000;
  f.available_bytes = 600;
  s.baseline = b;
  s.final_snapshot = f;
  return s;
}

TEST(runlog_line_fields) {
  auto line = RunLog::format_line(sample_session());
  ASSERT_TRUE(line.find("tool=reclaim-disk") != std::string::npos);
  ASSERT_TRUE(line.find("mode=live") != std::string::npos);
  ASSERT_TRUE(line.find("success=1") != std::string::npos);
  ASSERT_TRUE(line.find("failed=1") != std::string::npos);
  ASSERT_TRUE(line.find("freed_bytes=4096") != std::string::npos);
  ASSERT_TRUE(line.find("delta_bytes=-400") != std::string::npos);
  ASSERT_TRUE(line.find("cancelled=0") != std::string::npos);
  ASSERT_TRUE(line.find('\n') == std::string::npos);
}

TEST(runlog_creates_directory_and_appends) {
  auto dir = test_dir("append");
  fs::remove_all(dir);
  RunLog log(dir);
  auto s = sample_session();
  ASSERT_TRUE(log.append(s));
  ASSERT_TRUE(log.append(s));
  auto path = log.chunk_path(s.end_time);
  ASSERT_TRUE(fs::exists(path));
  auto name = path.filename().string();
  ASSERT_TRUE(name.rfind("reclaim_", 0) == 0);
  ASSERT_EQ(name.size(), std::string("reclaim_2026-01.log").size());

  std::ifstream f(path);
  int lines = 0;
  std::string line;
  while (std::getline(f, line)) {
    ASSERT_TRUE(line.find("tool=reclaim-disk") != std::string::npos);
    ++lines;
  }
  ASSERT_EQ(lines, 2);
  fs::remove_all(dir);
}

TEST(runlog_unwritable_dir_fails) {
  RunLog log("/proc/reclaim_cannot_create_here");
  ASSERT_TRUE(!log.append(sample_session()));
}
