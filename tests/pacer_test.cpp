#include "Transport/Pacer.hpp"

#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "utils/errors.hpp"

using haul::Pacer;
using haul::PacerConfig;
using haul::testing::RecordingSleeper;
using std::chrono::milliseconds;

namespace {

PacerConfig noJitter() {
  PacerConfig config;
  config.minBackoff = milliseconds(400);
  config.maxBackoff = milliseconds(5000);
  config.jitter = 0.0;
  return config;
}

}  // namespace

TEST(PacerTest, BackoffDoublesUntilCap) {
  Pacer pacer(noJitter());
  EXPECT_EQ(pacer.backoff(0), milliseconds(400));
  EXPECT_EQ(pacer.backoff(1), milliseconds(800));
  EXPECT_EQ(pacer.backoff(3), milliseconds(3200));
  EXPECT_EQ(pacer.backoff(4), milliseconds(5000));
  EXPECT_EQ(pacer.backoff(100), milliseconds(5000));
  EXPECT_EQ(pacer.backoff(-3), milliseconds(400));
}

TEST(PacerTest, JitterStaysInBounds) {
  PacerConfig config = noJitter();
  config.jitter = 0.1;
  Pacer pacer(config);
  for (int i = 0; i < 200; ++i) {
    auto d = pacer.backoff(2);
    EXPECT_GE(d.count(), 1440);
    EXPECT_LE(d.count(), 1760);
  }
}

TEST(PacerTest, SleepAdvancesAttemptCounter) {
  RecordingSleeper recorder;
  Pacer pacer(noJitter(), recorder.sleeper());

  pacer.sleep();
  pacer.sleep();
  EXPECT_EQ(pacer.attemptCount(), 2);
  EXPECT_EQ(pacer.nextBackoff(), milliseconds(1600));

  auto delays = recorder.delays();
  ASSERT_EQ(delays.size(), 2u);
  EXPECT_EQ(delays[0], milliseconds(400));
  EXPECT_EQ(delays[1], milliseconds(800));

  pacer.reset();
  EXPECT_EQ(pacer.attemptCount(), 0);
  EXPECT_EQ(pacer.nextBackoff(), milliseconds(400));
}

TEST(PacerTest, DetectsFloodPages) {
  EXPECT_TRUE(Pacer::detectFloodOrLock("Your IP address has been locked"));
  EXPECT_TRUE(Pacer::detectFloodOrLock("Too many connections from your host"));
  EXPECT_TRUE(Pacer::detectFloodOrLock("<b>Download limit reached</b>"));
  EXPECT_TRUE(Pacer::detectFloodOrLock("FLOOD CONTROL active"));
  EXPECT_FALSE(Pacer::detectFloodOrLock("<html>Welcome</html>"));
  EXPECT_FALSE(Pacer::detectFloodOrLock(""));
}

TEST(PacerTest, ParsesWaitTimes) {
  EXPECT_EQ(Pacer::parseWaitTime("Please wait 30 seconds"), 30.0);
  EXPECT_EQ(Pacer::parseWaitTime("You must wait 2 minutes"), 120.0);
  EXPECT_EQ(Pacer::parseWaitTime("countdown: 60"), 60.0);
  EXPECT_EQ(Pacer::parseWaitTime("wait_time=45"), 45.0);
  EXPECT_EQ(Pacer::parseWaitTime("var wait = 60;"), 60.0);
  EXPECT_FALSE(Pacer::parseWaitTime("nothing to see here").has_value());
  EXPECT_FALSE(Pacer::parseWaitTime("wait for it").has_value());
}

TEST(PacerTest, WaitIfRequestedSleepsOneSecondExtra) {
  RecordingSleeper recorder;
  Pacer pacer(noJitter(), recorder.sleeper());

  EXPECT_TRUE(pacer.waitIfRequested("Please wait 10 seconds"));
  auto delays = recorder.delays();
  ASSERT_EQ(delays.size(), 1u);
  EXPECT_EQ(delays[0], milliseconds(11000));

  EXPECT_FALSE(pacer.waitIfRequested("no wait here"));
  EXPECT_FALSE(pacer.waitIfRequested("wait 0 seconds"));
  EXPECT_EQ(recorder.delays().size(), 1u);
}

TEST(PacerTest, WaitTooLongThrows) {
  RecordingSleeper recorder;
  Pacer pacer(noJitter(), recorder.sleeper());
  try {
    pacer.waitIfRequested("wait 400 seconds", std::chrono::seconds(300));
    FAIL() << "expected WaitTooLongError";
  } catch (const haul::WaitTooLongError& e) {
    EXPECT_DOUBLE_EQ(e.waitSeconds(), 400.0);
    EXPECT_DOUBLE_EQ(e.maxSeconds(), 300.0);
  }
  EXPECT_TRUE(recorder.delays().empty());
}

TEST(PacerTest, HostileResponseUsesFloodSleep) {
  RecordingSleeper recorder;
  PacerConfig config = noJitter();
  config.floodSleep = milliseconds(30000);
  Pacer pacer(config, recorder.sleeper());

  EXPECT_TRUE(pacer.handleHostileResponse("IP address has been locked"));
  EXPECT_TRUE(pacer.handleHostileResponse("please wait 5 seconds"));
  EXPECT_FALSE(pacer.handleHostileResponse("ok"));

  auto delays = recorder.delays();
  ASSERT_EQ(delays.size(), 2u);
  EXPECT_EQ(delays[0], milliseconds(30000));
  EXPECT_EQ(delays[1], milliseconds(6000));
}
