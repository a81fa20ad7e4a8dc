#include "runctl/process_table.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>

using namespace runctl;
using namespace std::chrono_literals;

TEST(ProcessTableTest, SelfIsAlive) {
  EXPECT_TRUE(ProcessTable::is_alive(getpid()));
}

TEST(ProcessTableTest, InvalidPidsAreNotAlive) {
  EXPECT_FALSE(ProcessTable::is_alive(0));
  EXPECT_FALSE(ProcessTable::is_alive(-1));
}

TEST(ProcessTableTest, ReapedPidIsNotAlive) {
  EXPECT_FALSE(ProcessTable::is_alive(test::dead_pid()));
}

TEST(ProcessTableTest, ZombieIsNotAlive) {
  pid_t pid = fork();
  if (pid == 0) {
    _exit(0);
  }
  // Exited, not yet reaped
  EXPECT_TRUE(test::wait_until([pid]() { return !ProcessTable::is_alive(pid); }, 2s));
  waitpid(pid, nullptr, 0);
}

TEST(ProcessTableTest, ReadCmdlineJoinsArguments) {
  pid_t pid = test::spawn_child({"/bin/sleep", "4401"});
  ASSERT_GT(pid, 0);

  std::optional<std::string> cmdline;
  ASSERT_TRUE(test::wait_until(
      [&]() {
        cmdline = ProcessTable::read_cmdline(pid);
        return cmdline && *cmdline == "/bin/sleep 4401";
      },
      2s));

  test::kill_child(pid);
}

TEST(ProcessTableTest, ReadCmdlineOfMissingProcessIsEmpty) {
  EXPECT_FALSE(ProcessTable::read_cmdline(test::dead_pid()).has_value());
}

TEST(ProcessTableTest, MatchesIsSubstringSearch) {
  EXPECT_TRUE(ProcessTable::matches("python3 app.py --port 5000", "app.py"));
  EXPECT_TRUE(ProcessTable::matches("python3 app.py", "python3 app.py"));
  EXPECT_FALSE(ProcessTable::matches("python3 telegram_bot.py", "app.py"));
  EXPECT_FALSE(ProcessTable::matches("python3 app.py", ""));
}

TEST(ProcessTableTest, FindMatchingListsLiveProcesses) {
  pid_t pid = test::spawn_child({"/bin/sleep", "4402"});
  ASSERT_GT(pid, 0);

  std::vector<ProcessInfo> found;
  ASSERT_TRUE(test::wait_until(
      [&]() {
        found = ProcessTable::find_matching("/bin/sleep 4402");
        return !found.empty();
      },
      2s));
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].pid, pid);
  EXPECT_EQ(found[0].cmdline, "/bin/sleep 4402");

  test::kill_child(pid);
  EXPECT_TRUE(ProcessTable::find_matching("/bin/sleep 4402").empty());
}

TEST(ProcessTableTest, FindMatchingExcludesSelf) {
  std::string self = ProcessTable::read_cmdline(getpid()).value_or("");
  ASSERT_FALSE(self.empty());

  auto found = ProcessTable::find_matching(self);
  EXPECT_TRUE(std::none_of(found.begin(), found.end(),
                           [](const ProcessInfo &info) { return info.pid == getpid(); }));
}

TEST(ProcessTableTest, FindMatchingWithEmptyPatternFindsNothing) {
  EXPECT_TRUE(ProcessTable::find_matching("").empty());
}

TEST(ProcessTableTest, StartTimeOfLiveProcesses) {
  auto self = ProcessTable::read_start_time(getpid());
  ASSERT_TRUE(self.has_value());

  pid_t pid = test::spawn_child({"/bin/sleep", "4403"});
  ASSERT_GT(pid, 0);
  auto child = ProcessTable::read_start_time(pid);
  ASSERT_TRUE(child.has_value());
  EXPECT_GE(*child, *self);
  EXPECT_EQ(ProcessTable::read_start_time(pid), child);

  test::kill_child(pid);
}

TEST(ProcessTableTest, StartTimeOfMissingProcessIsEmpty) {
  EXPECT_FALSE(ProcessTable::read_start_time(test::dead_pid()).has_value());
  EXPECT_FALSE(ProcessTable::read_start_time(0).has_value());
}
