#include "minitest.hpp"
#include "util/Command.hpp"
#include <chrono>
#include <string>

using namespace std::chrono_literals;
using reclaim::util::command_program;
using reclaim::util::program_on_path;
using reclaim::util::run_command;

TEST(command_success_captures_output) {
  auto r = run_command("echo hello; echo oops 1>&2", 5000ms);
  ASSERT_TRUE(r.started);
  ASSERT_TRUE(!r.timed_out);
  ASSERT_EQ(r.exit_code, 0);
  ASSERT_TRUE(r.output.find("hello") != std::string::npos);
  ASSERT_TRUE(r.output.find("oops") != std::string::npos);
}

TEST(command_nonzero_exit) {
  auto r = run_command("exit 3", 5000ms);
  ASSERT_TRUE(r.started);
  ASSERT_EQ(r.exit_code, 3);
}

TEST(command_stdin_is_devnull) {
  auto r = run_command("cat", 5000ms);
  ASSERT_TRUE(r.started);
  ASSERT_TRUE(!r.timed_out);
  ASSERT_EQ(r.exit_code, 0);
  ASSERT_TRUE(r.output.empty());
}

TEST(command_timeout_terminates_child) {
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command("sleep 30", 300ms);
  auto took = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(r.started);
  ASSERT_TRUE(r.timed_out);
  ASSERT_TRUE(took < 5s);
}

TEST(command_timeout_kills_background_grandchild) {
  // The whole process group goes, so the pipe closes and we return promptly
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command("sleep 30 & sleep 30", 300ms);
  ASSERT_TRUE(r.timed_out);
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < 5s);
}

TEST(command_program_extraction) {
  ASSERT_EQ(command_program("npm cache clean --force"), "npm");
  ASSERT_EQ(command_program("sudo -n sh -c 'sync'"), "sh");
  ASSERT_EQ(command_program("  resolvectl flush-caches"), "resolvectl");
  ASSERT_EQ(command_program("sync;"), "sync");
  ASSERT_EQ(command_program(""), "");
}

TEST(command_program_lookup) {
  ASSERT_TRUE(program_on_path("sh"));
  ASSERT_TRUE(program_on_path("/bin/sh"));
  ASSERT_TRUE(!program_on_path("reclaim-no-such-program-xyz"));
  ASSERT_TRUE(!program_on_path(""));
}
