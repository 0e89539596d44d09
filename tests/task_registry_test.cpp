#include "Storage/TaskRegistry.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "utils/errors.hpp"

namespace fs = std::filesystem;

using haul::TaskInfo;
using haul::TaskProgress;
using haul::TaskRegistry;
using haul::TaskStatus;
using haul::TaskUpdate;

namespace {

class TaskRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           (std::string("haul_reg_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    registry_ = std::make_unique<TaskRegistry>(dir_ / "nested" / "tasks.db");
    registry_->connect();
  }

  void TearDown() override {
    registry_.reset();
    fs::remove_all(dir_);
  }

  static TaskUpdate statusUpdate(TaskStatus status) {
    TaskUpdate update;
    update.status = status;
    return update;
  }

  fs::path dir_;
  std::unique_ptr<TaskRegistry> registry_;
};

}  // namespace

TEST_F(TaskRegistryTest, CreatesPendingTask) {
  std::string id = registry_->createTask("https://h/a", "/tmp/out");
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[14], '4');

  auto info = registry_->getTask(id);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->taskId, id);
  EXPECT_EQ(info->url, "https://h/a");
  EXPECT_EQ(info->outputDir, fs::path("/tmp/out"));
  EXPECT_EQ(info->status, TaskStatus::kPending);
  EXPECT_FALSE(info->error.has_value());
  EXPECT_EQ(info->progress.downloaded, 0u);
  EXPECT_FALSE(registry_->getTask("missing").has_value());
}

TEST_F(TaskRegistryTest, DatabaseIsOwnerOnly) {
  fs::perms perms = fs::status(registry_->path()).permissions() &
                    fs::perms::all;
  EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);
  EXPECT_EQ(registry_->schemaVersion(), TaskRegistry::kSchemaVersion);
}

TEST_F(TaskRegistryTest, WalSidecarsAreOwnerOnly) {
  const fs::perms ownerOnly = fs::perms::owner_read | fs::perms::owner_write;
  std::string id = registry_->createTask("https://h/a", "out");
  ASSERT_FALSE(id.empty());

  for (const char* suffix : {"-wal", "-shm"}) {
    fs::path side(registry_->path().string() + suffix);
    ASSERT_TRUE(fs::exists(side)) << side;
    EXPECT_EQ(fs::status(side).permissions() & fs::perms::all, ownerOnly)
        << side;
  }

  // 已存在的宽松权限在重新连接时收紧
  registry_->close();
  fs::permissions(registry_->path(),
                  ownerOnly | fs::perms::group_read | fs::perms::others_read,
                  fs::perm_options::replace);
  registry_->connect();
  EXPECT_EQ(fs::status(registry_->path()).permissions() & fs::perms::all,
            ownerOnly);
  EXPECT_TRUE(registry_->getTask(id).has_value());
}

TEST_F(TaskRegistryTest, UpdatesProgressAndError) {
  std::string id = registry_->createTask("https://h/a", "out");

  TaskUpdate update;
  update.status = TaskStatus::kDownloading;
  TaskProgress progress;
  progress.percentage = 42.5;
  progress.downloaded = 425;
  progress.total = 1000;
  progress.speed = 12.5;
  progress.eta = 46;
  update.progress = progress;
  update.error = std::optional<std::string>("transient");
  EXPECT_TRUE(registry_->updateTask(id, update));

  auto info = registry_->getTask(id);
  EXPECT_EQ(info->status, TaskStatus::kDownloading);
  EXPECT_DOUBLE_EQ(info->progress.percentage, 42.5);
  EXPECT_EQ(info->progress.downloaded, 425u);
  EXPECT_EQ(info->progress.total, 1000u);
  EXPECT_DOUBLE_EQ(info->progress.speed, 12.5);
  EXPECT_EQ(info->error, std::string("transient"));
  EXPECT_GE(info->updatedAt, info->createdAt);

  TaskUpdate clear;
  clear.error = std::optional<std::string>();
  EXPECT_TRUE(registry_->updateTask(id, clear));
  info = registry_->getTask(id);
  EXPECT_FALSE(info->error.has_value());
  EXPECT_EQ(info->progress.downloaded, 425u);

  EXPECT_FALSE(registry_->updateTask("missing", clear));
}

TEST_F(TaskRegistryTest, TerminalRowsIgnoreActiveOnlyUpdates) {
  std::string id = registry_->createTask("https://h/a", "out");
  EXPECT_TRUE(registry_->updateIfActive(id, statusUpdate(TaskStatus::kCancelled)));
  EXPECT_FALSE(
      registry_->updateIfActive(id, statusUpdate(TaskStatus::kDownloading)));
  EXPECT_EQ(registry_->getTask(id)->status, TaskStatus::kCancelled);

  // An unconditional update still goes through.
  EXPECT_TRUE(registry_->updateTask(id, statusUpdate(TaskStatus::kFailed)));
  EXPECT_EQ(registry_->getTask(id)->status, TaskStatus::kFailed);
}

TEST_F(TaskRegistryTest, ListActiveExcludesTerminalOldestFirst) {
  std::string a = registry_->createTask("https://h/a", "out");
  std::string b = registry_->createTask("https://h/b", "out");
  std::string c = registry_->createTask("https://h/c", "out");
  std::string d = registry_->createTask("https://h/d", "out");
  registry_->updateTask(b, statusUpdate(TaskStatus::kCompleted));
  registry_->updateTask(d, statusUpdate(TaskStatus::kFailed));
  registry_->updateTask(c, statusUpdate(TaskStatus::kDownloading));

  auto active = registry_->listActive();
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].taskId, a);
  EXPECT_EQ(active[1].taskId, c);

  auto recent = registry_->listRecent(3);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].taskId, d);
  EXPECT_EQ(recent[2].taskId, b);
}

TEST_F(TaskRegistryTest, ListByStatusNewestFirst) {
  std::string a = registry_->createTask("https://h/a", "out");
  std::string b = registry_->createTask("https://h/b", "out");
  std::string c = registry_->createTask("https://h/c", "out");
  registry_->updateTask(a, statusUpdate(TaskStatus::kCompleted));
  registry_->updateTask(c, statusUpdate(TaskStatus::kCompleted));

  auto completed = registry_->listByStatus(TaskStatus::kCompleted, 10);
  ASSERT_EQ(completed.size(), 2u);
  EXPECT_EQ(completed[0].taskId, c);
  EXPECT_EQ(completed[1].taskId, a);
  EXPECT_EQ(registry_->listByStatus(TaskStatus::kCompleted, 1).size(), 1u);

  auto pending = registry_->listByStatus(TaskStatus::kPending, 10);
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].taskId, b);
  EXPECT_TRUE(registry_->listByStatus(TaskStatus::kFailed, 10).empty());
}

TEST_F(TaskRegistryTest, UrlCompletedOnlyForCompletedRows) {
  std::string a = registry_->createTask("https://h/a", "out");
  registry_->createTask("https://h/b", "out");
  EXPECT_FALSE(registry_->urlCompleted("https://h/a"));

  registry_->updateTask(a, statusUpdate(TaskStatus::kCompleted));
  EXPECT_TRUE(registry_->urlCompleted("https://h/a"));
  EXPECT_FALSE(registry_->urlCompleted("https://h/b"));
  EXPECT_FALSE(registry_->urlCompleted("https://h/A"));
}

TEST_F(TaskRegistryTest, DeleteAndPrune) {
  std::string keep = registry_->createTask("https://h/a", "out");
  std::string done = registry_->createTask("https://h/b", "out");
  std::string gone = registry_->createTask("https://h/c", "out");
  registry_->updateTask(done, statusUpdate(TaskStatus::kCompleted));

  EXPECT_TRUE(registry_->deleteTask(gone));
  EXPECT_FALSE(registry_->deleteTask(gone));

  auto later = std::chrono::system_clock::now() + std::chrono::hours(1);
  EXPECT_EQ(registry_->pruneFinished(later), 1u);
  EXPECT_TRUE(registry_->getTask(keep).has_value());
  EXPECT_FALSE(registry_->getTask(done).has_value());
}

TEST_F(TaskRegistryTest, SecondConnectionSeesWrites) {
  TaskRegistry other(registry_->path());
  other.connect();

  std::string id = registry_->createTask("https://h/a", "out");
  ASSERT_TRUE(other.getTask(id).has_value());

  // 另一个进程取消任务
  EXPECT_TRUE(other.updateIfActive(id, statusUpdate(TaskStatus::kCancelled)));
  EXPECT_EQ(registry_->getTask(id)->status, TaskStatus::kCancelled);
}

TEST_F(TaskRegistryTest, NewerSchemaIsRejected) {
  fs::path path = dir_ / "future.db";
  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
  ASSERT_EQ(sqlite3_exec(db, "PRAGMA user_version = 99", nullptr, nullptr,
                         nullptr),
            SQLITE_OK);
  sqlite3_close(db);

  TaskRegistry future(path);
  EXPECT_THROW(future.connect(), haul::RegistryError);
  EXPECT_FALSE(future.connected());
}

TEST_F(TaskRegistryTest, ClosedRegistryThrows) {
  registry_->close();
  EXPECT_FALSE(registry_->connected());
  EXPECT_THROW(registry_->createTask("https://h/a", "out"),
               haul::RegistryError);
  registry_->connect();
  EXPECT_TRUE(registry_->connected());
}

TEST(TaskStatusTest, RoundTripsNames) {
  for (auto status : {TaskStatus::kPending, TaskStatus::kExtracting,
                      TaskStatus::kDownloading, TaskStatus::kCompleted,
                      TaskStatus::kFailed, TaskStatus::kCancelled}) {
    EXPECT_EQ(haul::parseTaskStatus(haul::toString(status)), status);
  }
  EXPECT_STREQ(haul::toString(TaskStatus::kDownloading), "downloading");
  EXPECT_FALSE(haul::parseTaskStatus("bogus").has_value());
  EXPECT_TRUE(haul::isTerminal(TaskStatus::kCancelled));
  EXPECT_FALSE(haul::isTerminal(TaskStatus::kExtracting));
}

TEST(TaskRegistryPathTest, HonoursXdgConfigHome) {
  const char* saved = std::getenv("XDG_CONFIG_HOME");
  std::string previous = saved != nullptr ? saved : "";
  setenv("XDG_CONFIG_HOME", "/tmp/haul-xdg", 1);
  EXPECT_EQ(TaskRegistry::defaultPath(),
            fs::path("/tmp/haul-xdg") / "haul" / "tasks.db");
  if (saved != nullptr) {
    setenv("XDG_CONFIG_HOME", previous.c_str(), 1);
  } else {
    unsetenv("XDG_CONFIG_HOME");
  }
}
