#include <gtest/gtest.h>
#include <sys/stat.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../include/rotalog/rotation_executor.hpp"
#include "../include/rotalog/target_file.hpp"
#include "test_util.hpp"

using rotalog_test::file_exists;
using rotalog_test::list_names;
using rotalog_test::read_file;
using rotalog_test::set_mtime;
using rotalog_test::write_file;

class RecordingObserver : public rotalog::IRotationObserver
{
 public:
  std::vector<std::pair<std::string, std::string>> archived;
  std::vector<std::string> removed;

  void OnArchived(const std::string& target_path, const std::string& archive_path) override
  {
    archived.emplace_back(target_path, archive_path);
  }
  void OnArchiveRemoved(const std::string& archive_path) override
  {
    removed.push_back(archive_path);
  }
};

class RotationExecutorTest : public rotalog_test::TempDirTest
{
 protected:
  std::string Make(const std::string& name, time_t mtime, const std::string& content)
  {
    std::string path = tmp_dir_ + "/" + name;
    write_file(path, content);
    EXPECT_TRUE(set_mtime(path, mtime));
    return path;
  }

  static rotalog::RotationConfig Numbering(uint8_t max_archives)
  {
    rotalog::RotationConfig config;
    config.suffix_policy = rotalog::SuffixPolicy::Numbering;
    config.max_file_size = 10;
    config.max_archived_files = max_archives;
    return config;
  }
};

TEST_F(RotationExecutorTest, RenumberThreeArchivesFreesSlotOne)
{
  Make("app.log.1", 3000, "newest");
  Make("app.log.2", 2000, "middle");
  Make("app.log.3", 1000, "oldest");

  rotalog::RotationExecutor executor(target_, Numbering(5), nullptr);
  EXPECT_EQ(executor.RenumberArchives(), 3u);

  EXPECT_FALSE(file_exists(target_ + ".1"));
  EXPECT_EQ(read_file(target_ + ".2"), "newest");
  EXPECT_EQ(read_file(target_ + ".3"), "middle");
  EXPECT_EQ(read_file(target_ + ".4"), "oldest");
}

TEST_F(RotationExecutorTest, RenumberNeverOverwritesExistingFile)
{
  // Oldest ".2" wants ".3", which is occupied; newest ".3" wants ".2",
  // which is occupied too. Both renames are skipped.
  Make("app.log.2", 1000, "two");
  Make("app.log.3", 2000, "three");

  rotalog::RotationExecutor executor(target_, Numbering(5), nullptr);
  EXPECT_EQ(executor.RenumberArchives(), 0u);
  EXPECT_EQ(read_file(target_ + ".2"), "two");
  EXPECT_EQ(read_file(target_ + ".3"), "three");
}

TEST_F(RotationExecutorTest, RenumberIsSkippedForDateUuid)
{
  Make("app.log.1", 1000, "one");

  rotalog::RotationConfig config = Numbering(5);
  config.suffix_policy = rotalog::SuffixPolicy::DateUuid;
  rotalog::RotationExecutor executor(target_, config, nullptr);
  EXPECT_EQ(executor.RenumberArchives(), 0u);
  EXPECT_EQ(read_file(target_ + ".1"), "one");
}

TEST_F(RotationExecutorTest, ArchiveTargetMovesFileAndNotifies)
{
  rotalog::TargetFile file(target_, 0640);
  ASSERT_EQ(file.Open(), 0);
  ASSERT_EQ(file.Append("payload\n", 8), 0);

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);
  std::string archive;
  EXPECT_TRUE(executor.ArchiveTarget(file, 0, archive));

  EXPECT_EQ(archive, target_ + ".1");
  EXPECT_FALSE(file.IsOpen());
  EXPECT_FALSE(file_exists(target_));
  EXPECT_EQ(read_file(archive), "payload\n");
  ASSERT_EQ(observer.archived.size(), 1u);
  EXPECT_EQ(observer.archived[0].first, target_);
  EXPECT_EQ(observer.archived[0].second, archive);
}

TEST_F(RotationExecutorTest, ArchiveRefusesToOverwriteSlotOne)
{
  Make("app.log", 2000, "current");
  Make("app.log.1", 1000, "previous");

  rotalog::TargetFile file(target_, 0640);
  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);
  std::string archive;
  EXPECT_FALSE(executor.ArchiveTarget(file, 0, archive));
  EXPECT_TRUE(archive.empty());
  EXPECT_EQ(read_file(target_ + ".1"), "previous");
  EXPECT_EQ(read_file(target_), "current");
  EXPECT_TRUE(observer.archived.empty());
}

TEST_F(RotationExecutorTest, EvictsTwoOldestOfSeven)
{
  std::vector<std::string> paths;
  for (int i = 1; i <= 7; ++i)
  {
    // ".7" is the oldest
    paths.push_back(Make("app.log." + std::to_string(i), 10000 - i * 100, "a"));
  }

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);
  EXPECT_EQ(executor.EvictArchives(), 2u);

  EXPECT_FALSE(file_exists(target_ + ".7"));
  EXPECT_FALSE(file_exists(target_ + ".6"));
  for (int i = 1; i <= 5; ++i)
  {
    EXPECT_TRUE(file_exists(target_ + "." + std::to_string(i)));
  }
  ASSERT_EQ(observer.removed.size(), 2u);
  EXPECT_EQ(observer.removed[0], target_ + ".7");
  EXPECT_EQ(observer.removed[1], target_ + ".6");
}

TEST_F(RotationExecutorTest, EvictionWithinLimitRemovesNothing)
{
  Make("app.log.1", 2000, "a");
  Make("app.log.2", 1000, "b");

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(2), &observer);
  EXPECT_EQ(executor.EvictArchives(), 0u);
  EXPECT_TRUE(observer.removed.empty());
}

TEST_F(RotationExecutorTest, ZeroMaxArchivesEvictsEverything)
{
  Make("app.log.1", 2000, "a");
  Make("app.log.2", 1000, "b");

  rotalog::RotationExecutor executor(target_, Numbering(0), nullptr);
  EXPECT_EQ(executor.EvictArchives(), 2u);
  EXPECT_EQ(list_names(tmp_dir_).size(), 0u);
}

TEST_F(RotationExecutorTest, FullCycleNumbering)
{
  Make("app.log.1", 1000, "older content");
  rotalog::TargetFile file(target_, 0640);
  ASSERT_EQ(file.Open(), 0);
  ASSERT_EQ(file.Append("current content", 15), 0);

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);
  rotalog::RotationOutcome outcome = executor.Execute(file, 0);

  EXPECT_EQ(outcome.renumbered, 1u);
  EXPECT_TRUE(outcome.archived);
  EXPECT_EQ(outcome.archive_path, target_ + ".1");
  EXPECT_EQ(outcome.evicted, 0u);
  EXPECT_TRUE(outcome.reopened);

  EXPECT_TRUE(file.IsOpen());
  EXPECT_EQ(read_file(target_), "");
  EXPECT_EQ(read_file(target_ + ".1"), "current content");
  EXPECT_EQ(read_file(target_ + ".2"), "older content");
}

TEST_F(RotationExecutorTest, FullCycleEvictsBeyondLimit)
{
  Make("app.log.1", 2000, "b");
  Make("app.log.2", 1000, "a");
  rotalog::TargetFile file(target_, 0640);
  ASSERT_EQ(file.Open(), 0);
  ASSERT_EQ(file.Append("c", 1), 0);

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(2), &observer);
  rotalog::RotationOutcome outcome = executor.Execute(file, 0);

  EXPECT_EQ(outcome.evicted, 1u);
  ASSERT_EQ(observer.removed.size(), 1u);
  EXPECT_EQ(observer.removed[0], target_ + ".3");
  EXPECT_EQ(read_file(target_ + ".1"), "c");
  EXPECT_EQ(read_file(target_ + ".2"), "b");
  EXPECT_FALSE(file_exists(target_ + ".3"));
}

TEST_F(RotationExecutorTest, MissingTargetStillReopens)
{
  rotalog::TargetFile file(target_, 0640);

  RecordingObserver observer;
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);
  rotalog::RotationOutcome outcome = executor.Execute(file, 0);

  EXPECT_FALSE(outcome.archived);
  EXPECT_TRUE(outcome.reopened);
  EXPECT_TRUE(file_exists(target_));
  EXPECT_TRUE(observer.archived.empty());
}

TEST_F(RotationExecutorTest, ReopenFailureIsReportedNotThrown)
{
  rotalog::TargetFile file(target_, 0640);
  ASSERT_EQ(file.Open(), 0);

  // Occupy the target path with a directory as soon as it is archived.
  std::string target = target_;
  rotalog::CallbackRotationObserver observer(
      [target](const std::string&, const std::string&) { ::mkdir(target.c_str(), 0755); },
      nullptr);
  rotalog::RotationExecutor executor(target_, Numbering(5), &observer);

  rotalog::RotationOutcome outcome;
  EXPECT_NO_THROW(outcome = executor.Execute(file, 0));
  EXPECT_TRUE(outcome.archived);
  EXPECT_FALSE(outcome.reopened);
  EXPECT_FALSE(file.IsOpen());
}

TEST_F(RotationExecutorTest, DateUuidCycleCreatesTimestampedArchive)
{
  rotalog::TargetFile file(target_, 0640);
  ASSERT_EQ(file.Open(), 0);
  ASSERT_EQ(file.Append("x", 1), 0);

  rotalog::RotationConfig config = Numbering(5);
  config.suffix_policy = rotalog::SuffixPolicy::DateUuid;
  rotalog::RotationExecutor executor(target_, config, nullptr);
  // 2025-02-16 07:50:00 UTC
  rotalog::RotationOutcome outcome = executor.Execute(file, 1739692200000000000ULL);

  ASSERT_TRUE(outcome.archived);
  EXPECT_EQ(outcome.archive_path.rfind(target_ + ".20250216T075000Z_", 0), 0u);
  EXPECT_EQ(read_file(outcome.archive_path), "x");
}
