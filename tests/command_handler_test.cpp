#include "runctl/audit_logger.hpp"
#include "runctl/command_handler.hpp"
#include "runctl/pid_record.hpp"
#include "runctl/supervisor.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace runctl;

namespace {

class CommandHandlerTest : public ::testing::Test {
protected:
  test::TempDir dir_;
  AuditLogger audit_{dir_.path() / "audit.log"};
  Supervisor supervisor_{test::make_config(dir_.path(), {"/bin/sleep", "4701"}), audit_};
  CommandHandler handler_{supervisor_, audit_};
  pid_t launched_ = -1;

  void TearDown() override { test::kill_detached(launched_); }
};

} // namespace

TEST_F(CommandHandlerTest, StatusWithoutRecord) {
  nlohmann::json response = handler_.execute(Command::STATUS);

  EXPECT_EQ(response["CMD"], "status");
  EXPECT_TRUE(response["error"].is_null());
  EXPECT_FALSE(response["result"]["running"].get<bool>());
  EXPECT_TRUE(response["result"]["pid"].is_null());
  EXPECT_EQ(CommandHandler::exit_code(response), 0);
  EXPECT_EQ(CommandHandler::format_text(response), "NotRunning");
}

TEST_F(CommandHandlerTest, StopWithoutRecordFails) {
  nlohmann::json response = handler_.execute(Command::STOP);

  EXPECT_TRUE(response["result"].is_null());
  EXPECT_EQ(response["error_kind"], "NotRunning");
  EXPECT_EQ(CommandHandler::exit_code(response), 1);
  EXPECT_EQ(CommandHandler::format_text(response), "PID file not found. Is the app running?");
}

TEST_F(CommandHandlerTest, StartStatusStop) {
  nlohmann::json started = handler_.execute(Command::START);
  ASSERT_TRUE(started["error"].is_null()) << started.dump();
  launched_ = started["result"]["pid"].get<pid_t>();

  EXPECT_EQ(started["result"]["status"], "running");
  EXPECT_EQ(CommandHandler::format_text(started),
            "App started with PID " + std::to_string(launched_) + ". Logs are in " +
                (dir_.path() / "app.log").string() + ".");

  nlohmann::json again = handler_.execute(Command::START);
  EXPECT_EQ(again["error_kind"], "AlreadyRunning");
  EXPECT_EQ(again["pid"].get<pid_t>(), launched_);
  EXPECT_EQ(CommandHandler::exit_code(again), 1);
  EXPECT_EQ(CommandHandler::format_text(again),
            "App is already running with PID " + std::to_string(launched_) + ".");

  nlohmann::json status = handler_.execute(Command::STATUS);
  EXPECT_EQ(CommandHandler::format_text(status), "Running(" + std::to_string(launched_) + ")");
  EXPECT_EQ(status["result"]["pid"].get<pid_t>(), launched_);

  nlohmann::json stopped = handler_.execute(Command::STOP);
  EXPECT_TRUE(stopped["error"].is_null());
  EXPECT_EQ(stopped["result"]["status"], "stopped");
  EXPECT_EQ(stopped["result"]["method"], "Graceful termination");
  EXPECT_EQ(CommandHandler::exit_code(stopped), 0);
  EXPECT_EQ(CommandHandler::format_text(stopped), "App stopped (Graceful termination).");
}

TEST_F(CommandHandlerTest, StopOfGoneProcessSucceeds) {
  PidRecord(dir_.path() / "app.pid").write(getpid());

  nlohmann::json response = handler_.execute(Command::STOP);

  EXPECT_EQ(CommandHandler::exit_code(response), 0);
  EXPECT_EQ(response["result"]["status"], "already_stopped");
  EXPECT_EQ(CommandHandler::format_text(response), "App was already stopped.");
}

TEST_F(CommandHandlerTest, LogsShowsTail) {
  test::write_file(dir_.path() / "app.log", "a\nb\nc\n");

  nlohmann::json response = handler_.execute(Command::LOGS, 2);

  EXPECT_EQ(response["result"]["lines"], "b\nc\n");
  EXPECT_EQ(CommandHandler::format_text(response), "b\nc");
}

TEST_F(CommandHandlerTest, ConfigShowsEffectiveSettings) {
  nlohmann::json response = handler_.execute(Command::CONFIG);

  EXPECT_EQ(response["result"]["pidfile"], (dir_.path() / "app.pid").string());
  EXPECT_EQ(response["result"]["match"], "/bin/sleep 4701");
}

TEST_F(CommandHandlerTest, CommandsAreAudited) {
  handler_.execute(Command::STATUS);
  EXPECT_NE(audit_.get_last_lines(5).find("[CMD] Command received: status from cli"),
            std::string::npos);
}

TEST(CommandHandlerStaticTest, ConfigErrorsExitWithTwo) {
  nlohmann::json response =
      CommandHandler::make_error("start", ErrorKind::CONFIG_ERROR, "Unknown signal: FOO");

  EXPECT_EQ(response["CMD"], "start");
  EXPECT_EQ(response["error"], "Unknown signal: FOO");
  EXPECT_FALSE(response.contains("pid"));
  EXPECT_EQ(CommandHandler::exit_code(response), 2);
}

TEST_F(CommandHandlerTest, InvalidUtf8IsReplacedInJsonOutput) {
  test::TempDir dir;
  AuditLogger audit("");
  Supervisor supervisor(test::make_config(dir.path(), {"/bin/sleep", "30\xff"}), audit);
  CommandHandler handler(supervisor, audit);

  nlohmann::json response = handler.execute(Command::CONFIG);
  ASSERT_TRUE(response["error"].is_null());

  std::string text;
  EXPECT_NO_THROW(text = CommandHandler::to_json_text(response));
  EXPECT_NE(text.find("30\xEF\xBF\xBD"), std::string::npos);
  EXPECT_NO_THROW(CommandHandler::format_text(response));

  nlohmann::json error =
      CommandHandler::make_error("status", ErrorKind::IO_ERROR, "bad \xff byte");
  EXPECT_NO_THROW(text = CommandHandler::to_json_text(error, 2));
  EXPECT_NE(text.find("bad \xEF\xBF\xBD byte"), std::string::npos);
}
