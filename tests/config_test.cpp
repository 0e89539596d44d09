#include "Service/Config.hpp"

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "utils/flags.hpp"

TEST(ConfigTest, DefaultsMatchFlags) {
  gflags::FlagSaver saver;
  FLAGS_task_db = "/tmp/haul-config-test/tasks.db";

  haul::AppConfig config = haul::configFromFlags();
  EXPECT_EQ(config.manager.outputDir, std::filesystem::path("downloads"));
  EXPECT_EQ(config.manager.maxConcurrent, 3);
  EXPECT_EQ(config.manager.maxRetries, 3);
  EXPECT_EQ(config.manager.downloader.chunkSize, 1024u * 1024u);
  EXPECT_TRUE(config.manager.downloader.enableResume);
  EXPECT_EQ(config.manager.downloader.chunkTimeout, std::chrono::seconds(60));
  EXPECT_DOUBLE_EQ(config.transport.requestsPerSecond, 10.0);
  EXPECT_EQ(config.taskDb,
            std::filesystem::path("/tmp/haul-config-test/tasks.db"));
  EXPECT_FALSE(config.password.has_value());
  EXPECT_EQ(config.cancelPollInterval, std::chrono::milliseconds(1000));
  EXPECT_EQ(config.log.minLevel, haul::utils::LogLevel::INFO);
  EXPECT_TRUE(config.skipCompleted);
  EXPECT_EQ(config.historyLimit, 50u);
}

TEST(ConfigTest, ClampsOutOfRangeValues) {
  gflags::FlagSaver saver;
  FLAGS_max_concurrent = 0;
  FLAGS_max_retries = -4;
  FLAGS_chunk_size = 0;
  FLAGS_max_chunk_retries = -1;
  FLAGS_cancel_poll_ms = 1;
  FLAGS_password = "open sesame";
  FLAGS_log_level = "debug";
  FLAGS_log_dir = "";

  haul::AppConfig config = haul::configFromFlags();
  EXPECT_EQ(config.manager.maxConcurrent, 1);
  EXPECT_EQ(config.manager.maxRetries, 0);
  EXPECT_EQ(config.transport.maxRetries, 0);
  EXPECT_EQ(config.manager.downloader.chunkSize, 1u);
  EXPECT_EQ(config.manager.downloader.maxChunkRetries, 0);
  EXPECT_EQ(config.cancelPollInterval, std::chrono::milliseconds(50));
  EXPECT_EQ(config.password, std::string("open sesame"));
  EXPECT_EQ(config.log.minLevel, haul::utils::LogLevel::DEBUG);
  EXPECT_TRUE(config.log.logFilePath.empty());
}

TEST(ConfigTest, HistoryFlags) {
  gflags::FlagSaver saver;
  FLAGS_skip_completed = false;
  FLAGS_history_limit = -3;

  haul::AppConfig config = haul::configFromFlags();
  EXPECT_FALSE(config.skipCompleted);
  EXPECT_EQ(config.historyLimit, 1u);

  FLAGS_history_limit = 7;
  EXPECT_EQ(haul::configFromFlags().historyLimit, 7u);
}
