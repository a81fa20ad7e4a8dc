#include "runctl/audit_logger.hpp"
#include "runctl/log_manager.hpp"
#include "runctl/errors.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace runctl;

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(LogManagerTest, SessionHeaderDescribesLaunch) {
  test::TempDir dir;
  LogManager log(dir.path() / "app.log");

  log.open_session("python3 app.py", dir.path());
  EXPECT_TRUE(log.is_log_open());
  log.note_started(4242);
  log.close();
  EXPECT_FALSE(log.is_log_open());

  std::string content = test::read_file(dir.path() / "app.log");
  EXPECT_TRUE(contains(content, "runctl session"));
  EXPECT_TRUE(contains(content, "Start Time: "));
  EXPECT_TRUE(contains(content, "Unix Timestamp: "));
  EXPECT_TRUE(contains(content, "Command: python3 app.py"));
  EXPECT_TRUE(contains(content, "Working Directory: " + dir.path().string()));
  EXPECT_TRUE(contains(content, "Process Output:"));
  EXPECT_TRUE(contains(content, "[runctl] Started PID 4242"));
}

TEST(LogManagerTest, AppendsByDefault) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.log", "previous run\n");

  LogManager log(dir.path() / "app.log");
  log.open_session("app", dir.path());
  log.close();

  std::string content = test::read_file(dir.path() / "app.log");
  EXPECT_EQ(content.rfind("previous run\n", 0), 0u);
  EXPECT_TRUE(contains(content, "runctl session"));
}

TEST(LogManagerTest, TruncateEmptiesPreviousContent) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.log", "previous run\n");

  LogManager log(dir.path() / "app.log", true);
  log.open_session("app", dir.path());
  log.close();

  std::string content = test::read_file(dir.path() / "app.log");
  EXPECT_FALSE(contains(content, "previous run"));
  EXPECT_TRUE(contains(content, "runctl session"));
}

TEST(LogManagerTest, FinalizeAppendsFooterToClosedLog) {
  test::TempDir dir;
  {
    LogManager log(dir.path() / "app.log");
    log.open_session("app", dir.path());
  }

  LogManager(dir.path() / "app.log").finalize("Graceful termination");

  std::string content = test::read_file(dir.path() / "app.log");
  EXPECT_TRUE(contains(content, "runctl teardown"));
  EXPECT_TRUE(contains(content, "Stop Time: "));
  EXPECT_TRUE(contains(content, "Shutdown Method: Graceful termination"));
  EXPECT_TRUE(contains(content, "End of session"));
}

TEST(LogManagerTest, FinalizeWithoutLogFileCreatesNothing) {
  test::TempDir dir;
  LogManager(dir.path() / "app.log").finalize("Already stopped");
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "app.log"));
}

TEST(LogManagerTest, LogFdIsSharedWithWriters) {
  test::TempDir dir;
  LogManager log(dir.path() / "app.log");
  log.open_session("app", dir.path());

  int fd = log.get_log_fd();
  const char line[] = "child output\n";
  ASSERT_EQ(write(fd, line, sizeof(line) - 1), static_cast<ssize_t>(sizeof(line) - 1));
  log.close();

  EXPECT_TRUE(contains(test::read_file(dir.path() / "app.log"), "child output"));
}

TEST(LogManagerTest, LastLines) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.log", "one\ntwo\nthree\n");
  LogManager log(dir.path() / "app.log");

  EXPECT_EQ(log.get_last_lines(2), "two\nthree\n");
  EXPECT_EQ(log.get_last_lines(10), "one\ntwo\nthree\n");
  EXPECT_EQ(LogManager(dir.path() / "missing.log").get_last_lines(5), "");
}

TEST(LogManagerTest, OpenFailureIsIoError) {
  test::TempDir dir;
  std::filesystem::create_directories(dir.path() / "app.log");
  LogManager log(dir.path() / "app.log");

  try {
    log.open_session("app", dir.path());
    FAIL() << "expected IO_ERROR";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO_ERROR);
  }
}

TEST(AuditLoggerTest, WritesCategorizedLines) {
  test::TempDir dir;
  AuditLogger audit(dir.path() / "audit" / "audit.log");
  ASSERT_TRUE(audit.is_enabled());

  audit.log_command("start", "cli");
  audit.log_state_transition("NotRunning", "Running(7)");
  audit.log_warning("Stale PID file", "stale");
  audit.log_success("Started", "PID 7");

  std::string lines = audit.get_last_lines(10);
  EXPECT_TRUE(contains(lines, "[CMD] Command received: start from cli"));
  EXPECT_TRUE(contains(lines, "[STATE] NotRunning -> Running(7)"));
  EXPECT_TRUE(contains(lines, "[WARN] [stale] Stale PID file"));
  EXPECT_TRUE(contains(lines, "[SUCCESS] Started: PID 7"));
  EXPECT_TRUE(contains(lines, "[" + std::to_string(getpid()) + "]"));
}

TEST(AuditLoggerTest, EmptyPathDisablesLogging) {
  AuditLogger audit("");
  EXPECT_FALSE(audit.is_enabled());
  audit.log_info("ignored");
  EXPECT_EQ(audit.get_last_lines(5), "");
}
