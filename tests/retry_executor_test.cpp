#include "Transport/RetryExecutor.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>

#include "fake_transport.hpp"
#include "utils/errors.hpp"

using haul::HttpResponse;
using haul::RetryConfig;
using haul::RetryExecutor;
using haul::testing::RecordingSleeper;
using std::chrono::milliseconds;

namespace {

HttpResponse reply(long status, const std::string& body = "",
                   const std::string& retryAfter = "") {
  HttpResponse r;
  r.status = status;
  r.body = body;
  if (!retryAfter.empty()) r.headers["retry-after"] = retryAfter;
  return r;
}

class RetryExecutorTest : public ::testing::Test {
 protected:
  RetryExecutor makeExecutor(int maxRetries = 3) {
    RetryConfig config;
    config.maxRetries = maxRetries;
    return RetryExecutor(config, nullptr, recorder_.sleeper());
  }

  // Plays back the scripted replies, then keeps answering with the last.
  RetryExecutor::Attempt script(std::deque<HttpResponse> replies) {
    replies_ = std::move(replies);
    return [this]() {
      ++calls_;
      HttpResponse r = replies_.front();
      if (replies_.size() > 1) replies_.pop_front();
      return r;
    };
  }

  RecordingSleeper recorder_;
  std::deque<HttpResponse> replies_;
  int calls_ = 0;
};

}  // namespace

TEST_F(RetryExecutorTest, SuccessNeedsNoSleep) {
  auto executor = makeExecutor();
  auto response = executor.execute("GET x", script({reply(200, "ok")}));
  EXPECT_EQ(response.body, "ok");
  EXPECT_EQ(calls_, 1);
  EXPECT_TRUE(recorder_.delays().empty());
}

TEST_F(RetryExecutorTest, HonoursRetryAfterSeconds) {
  auto executor = makeExecutor();
  auto response = executor.execute(
      "GET x", script({reply(429, "", "2"), reply(200, "done")}));
  EXPECT_EQ(response.body, "done");
  EXPECT_EQ(calls_, 2);
  auto delays = recorder_.delays();
  ASSERT_EQ(delays.size(), 1u);
  EXPECT_EQ(delays[0], milliseconds(2000));
}

TEST_F(RetryExecutorTest, CapsRetryAfter) {
  auto executor = makeExecutor();
  executor.execute("GET x", script({reply(429, "", "120"), reply(200)}));
  auto delays = recorder_.delays();
  ASSERT_EQ(delays.size(), 1u);
  EXPECT_EQ(delays[0], milliseconds(60000));
}

TEST_F(RetryExecutorTest, FloodPageOn429SleepsFloodDuration) {
  auto executor = makeExecutor();
  executor.execute(
      "GET x",
      script({reply(429, "Your IP address has been locked"), reply(200)}));
  auto delays = recorder_.delays();
  ASSERT_EQ(delays.size(), 1u);
  EXPECT_EQ(delays[0], milliseconds(30000));
}

TEST_F(RetryExecutorTest, Plain429BacksOff) {
  auto executor = makeExecutor();
  executor.execute("GET x", script({reply(429), reply(200)}));
  auto delays = recorder_.delays();
  ASSERT_EQ(delays.size(), 1u);
  EXPECT_GE(delays[0].count(), 900);
  EXPECT_LE(delays[0].count(), 1100);
}

TEST_F(RetryExecutorTest, ClientErrorIsNotRetried) {
  auto executor = makeExecutor();
  try {
    executor.execute("GET x", script({reply(404, "missing")}));
    FAIL() << "expected HttpStatusError";
  } catch (const haul::HttpStatusError& e) {
    EXPECT_EQ(e.status(), 404);
    EXPECT_EQ(e.body(), "missing");
  }
  EXPECT_EQ(calls_, 1);
  EXPECT_TRUE(recorder_.delays().empty());
}

TEST_F(RetryExecutorTest, ServerErrorsExhaustRetries) {
  auto executor = makeExecutor(2);
  try {
    executor.execute("GET x", script({reply(503)}));
    FAIL() << "expected RetriesExhaustedError";
  } catch (const haul::RetriesExhaustedError& e) {
    EXPECT_STREQ(e.what(),
                 "GET x: retries exhausted after 3 attempts: 503 Server Error");
  }
  EXPECT_EQ(calls_, 3);
  auto delays = recorder_.delays();
  ASSERT_EQ(delays.size(), 2u);
  EXPECT_GE(delays[0].count(), 900);
  EXPECT_LE(delays[0].count(), 1100);
  EXPECT_GE(delays[1].count(), 1800);
  EXPECT_LE(delays[1].count(), 2200);
}

TEST_F(RetryExecutorTest, PersistentRateLimitRaisesRateLimited) {
  auto executor = makeExecutor(1);
  try {
    executor.execute("GET x", script({reply(429, "", "5")}));
    FAIL() << "expected RateLimitedError";
  } catch (const haul::RateLimitedError& e) {
    ASSERT_TRUE(e.retryAfter().has_value());
    EXPECT_EQ(*e.retryAfter(), 5);
  }
  EXPECT_EQ(calls_, 2);
}

TEST_F(RetryExecutorTest, NetworkErrorsAreRetried) {
  auto executor = makeExecutor();
  int calls = 0;
  auto response = executor.execute("GET x", [&calls]() {
    if (++calls < 3) throw haul::NetworkError("connection reset");
    return reply(200, "late");
  });
  EXPECT_EQ(response.body, "late");
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(recorder_.delays().size(), 2u);
}

TEST_F(RetryExecutorTest, MaxDelayCapsBackoff) {
  RetryConfig config;
  config.maxRetries = 5;
  config.maxDelay = std::chrono::seconds(1);
  RetryExecutor executor(config, nullptr, recorder_.sleeper());
  EXPECT_THROW(executor.execute("GET x", script({reply(500)})),
               haul::RetriesExhaustedError);
  for (auto d : recorder_.delays()) EXPECT_LE(d.count(), 1000);
}

TEST_F(RetryExecutorTest, OtherExceptionsPropagate) {
  auto executor = makeExecutor();
  int calls = 0;
  EXPECT_THROW(executor.execute("GET x",
                                [&calls]() -> HttpResponse {
                                  ++calls;
                                  throw std::logic_error("bug");
                                }),
               std::logic_error);
  EXPECT_EQ(calls, 1);
}

TEST(RetryAfterTest, ParsesDeltaSecondsAndDates) {
  EXPECT_EQ(RetryExecutor::parseRetryAfter(" 7 "), std::chrono::seconds(7));
  EXPECT_EQ(RetryExecutor::parseRetryAfter("0"), std::chrono::seconds(0));
  EXPECT_FALSE(RetryExecutor::parseRetryAfter("").has_value());
  EXPECT_FALSE(RetryExecutor::parseRetryAfter("soon").has_value());
  // 过去的日期不需要等待
  EXPECT_EQ(RetryExecutor::parseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT"),
            std::chrono::seconds(0));
}
