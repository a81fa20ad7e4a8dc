#include "runctl/errors.hpp"
#include "runctl/pid_record.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace runctl;

TEST(PidRecordTest, MissingFileIsAbsent) {
  test::TempDir dir;
  PidRecord record(dir.path() / "app.pid");

  RecordContents contents = record.read();
  EXPECT_EQ(contents.status, RecordStatus::ABSENT);
  EXPECT_EQ(contents.pid, -1);
  EXPECT_FALSE(record.exists());
}

TEST(PidRecordTest, WriteStoresDecimalPidAndNewline) {
  test::TempDir dir;
  PidRecord record(dir.path() / "app.pid");

  record.write(12345);

  EXPECT_EQ(test::read_file(dir.path() / "app.pid"), "12345\n");
  RecordContents contents = record.read();
  EXPECT_EQ(contents.status, RecordStatus::VALID);
  EXPECT_EQ(contents.pid, 12345);
}

TEST(PidRecordTest, WriteOverwritesAndLeavesNoTempFile) {
  test::TempDir dir;
  PidRecord record(dir.path() / "app.pid");

  record.write(111);
  record.write(222);

  EXPECT_EQ(record.read().pid, 222);
  size_t entries = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir.path())) {
    (void)entry;
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST(PidRecordTest, WriteCreatesParentDirectories) {
  test::TempDir dir;
  PidRecord record(dir.path() / "run" / "nested" / "app.pid");

  record.write(42);

  EXPECT_TRUE(record.exists());
  EXPECT_EQ(record.read().pid, 42);
}

TEST(PidRecordTest, GarbageIsCorrupt) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.pid", "not-a-pid\n");
  PidRecord record(dir.path() / "app.pid");

  RecordContents contents = record.read();
  EXPECT_EQ(contents.status, RecordStatus::CORRUPT);
  EXPECT_EQ(contents.raw, "not-a-pid\n");
}

TEST(PidRecordTest, EmptyFileIsCorrupt) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.pid", "");
  PidRecord record(dir.path() / "app.pid");

  EXPECT_EQ(record.read().status, RecordStatus::CORRUPT);
}

TEST(PidRecordTest, ParseAcceptsSurroundingWhitespace) {
  EXPECT_EQ(PidRecord::parse("  777 \n"), 777);
  EXPECT_EQ(PidRecord::parse("1\r\n"), 1);
}

TEST(PidRecordTest, ParseRejectsNonPositiveAndOverflow) {
  EXPECT_EQ(PidRecord::parse("0"), -1);
  EXPECT_EQ(PidRecord::parse("-5"), -1);
  EXPECT_EQ(PidRecord::parse("12 34"), -1);
  EXPECT_EQ(PidRecord::parse("99999999999"), -1);
  EXPECT_EQ(PidRecord::parse("4294967296"), -1);
  EXPECT_EQ(PidRecord::parse("0x10"), -1);
}

TEST(PidRecordTest, RemoveReportsWhetherAFileWasDeleted) {
  test::TempDir dir;
  PidRecord record(dir.path() / "app.pid");

  record.write(9);
  EXPECT_TRUE(record.remove());
  EXPECT_FALSE(record.remove());
  EXPECT_EQ(record.read().status, RecordStatus::ABSENT);
}

TEST(PidRecordTest, StartTimeIsStoredOnSecondLine) {
  test::TempDir dir;
  PidRecord record(dir.path() / "app.pid");

  record.write(12345, 987654);

  EXPECT_EQ(test::read_file(dir.path() / "app.pid"), "12345\n987654\n");
  RecordContents contents = record.read();
  EXPECT_EQ(contents.status, RecordStatus::VALID);
  EXPECT_EQ(contents.pid, 12345);
  ASSERT_TRUE(contents.start_time.has_value());
  EXPECT_EQ(*contents.start_time, 987654u);
}

TEST(PidRecordTest, PidOnlyRecordHasNoStartTime) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.pid", "4321\n");
  PidRecord record(dir.path() / "app.pid");

  RecordContents contents = record.read();
  EXPECT_EQ(contents.status, RecordStatus::VALID);
  EXPECT_EQ(contents.pid, 4321);
  EXPECT_FALSE(contents.start_time.has_value());
}

TEST(PidRecordTest, GarbageStartTimeIsCorrupt) {
  test::TempDir dir;
  test::write_file(dir.path() / "app.pid", "4321\nyesterday\n");
  PidRecord record(dir.path() / "app.pid");

  EXPECT_EQ(record.read().status, RecordStatus::CORRUPT);
}

TEST(PidRecordTest, DirectoryAtRecordPathIsIoError) {
  test::TempDir dir;
  std::filesystem::create_directory(dir.path() / "app.pid");
  PidRecord record(dir.path() / "app.pid");

  try {
    (void)record.read();
    FAIL() << "expected a SupervisorError";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO_ERROR);
  }
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "app.pid"));
}
