// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryPolicy and CancellableSleeper
 */

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "retry_policy.hpp"
#include "test_helpers.hpp"

using namespace vidup::uploader;
using namespace vidup::uploader::test;

class RetryPolicyTest : public ::testing::Test {
protected:
  void SetUp() override {
    RetryConfig config;
    config.max_retries = 3;
    config.initial_delay = std::chrono::milliseconds(1000);
    config.max_delay = std::chrono::milliseconds(60000);
    config.exponential_base = 2.0;
    config.jitter = false;
    policy_ = std::make_unique<RetryPolicy>(config, sleeper_);
  }

  FakeSleeper sleeper_;
  std::unique_ptr<RetryPolicy> policy_;
};

TEST_F(RetryPolicyTest, ExponentialBackoff) {
  EXPECT_EQ(policy_->getDelay(0).count(), 1000);
  EXPECT_EQ(policy_->getDelay(1).count(), 2000);
  EXPECT_EQ(policy_->getDelay(2).count(), 4000);
  EXPECT_EQ(policy_->getDelay(3).count(), 8000);
}

TEST_F(RetryPolicyTest, MaxDelayCap) {
  EXPECT_EQ(policy_->getDelay(10).count(), 60000);
}

TEST_F(RetryPolicyTest, ShouldRetry) {
  EXPECT_TRUE(policy_->shouldRetry(0));
  EXPECT_TRUE(policy_->shouldRetry(2));
  EXPECT_FALSE(policy_->shouldRetry(3));
  EXPECT_EQ(policy_->maxRetries(), 3);
}

TEST_F(RetryPolicyTest, JitterStaysInRange) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter = true;
  config.jitter_factor = 0.5;
  RetryPolicy jittered(config, sleeper_);

  std::set<int64_t> delays;
  for (int i = 0; i < 100; ++i) {
    delays.insert(jittered.getDelay(0).count());
  }

  EXPECT_GT(delays.size(), 1u);
  for (auto d : delays) {
    EXPECT_GE(d, 500);
    EXPECT_LE(d, 1500);
  }
}

TEST_F(RetryPolicyTest, SucceedsFirstTimeWithoutSleeping) {
  int calls = 0;
  int result = policy_->execute([&]() {
    ++calls;
    return 42;
  });

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryPolicyTest, SucceedsAfterTransientFailures) {
  int calls = 0;
  std::vector<int> reported_attempts;

  auto result = policy_->execute(
    [&]() {
      if (++calls <= 2) {
        throw UploadError(ErrorKind::kChunkUpload, "transient", 503);
      }
      return std::string("ok");
    },
    [&](int attempt, const std::exception&) {
      reported_attempts.push_back(attempt);
    }
  );

  EXPECT_EQ(result, "ok");
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(reported_attempts, (std::vector<int>{1, 2}));

  auto delays = sleeper_.delays();
  ASSERT_EQ(delays.size(), 2u);
  EXPECT_EQ(delays[0].count(), 1000);
  EXPECT_EQ(delays[1].count(), 2000);
}

TEST_F(RetryPolicyTest, ExhaustionRethrowsLastErrorAfterMaxRetriesPlusOne) {
  int calls = 0;

  try {
    policy_->execute([&]() {
      ++calls;
      throw UploadError(ErrorKind::kChunkUpload, "attempt " + std::to_string(calls), 500);
    });
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kChunkUpload);
    EXPECT_STREQ(e.what(), "attempt 4");
    EXPECT_EQ(e.httpStatus(), 500);
  }

  EXPECT_EQ(calls, 4);
  auto delays = sleeper_.delays();
  ASSERT_EQ(delays.size(), 3u);
  EXPECT_EQ(delays[2].count(), 4000);
}

TEST_F(RetryPolicyTest, RetriesNonUploadErrors) {
  int calls = 0;
  EXPECT_THROW(
    policy_->execute([&]() -> void {
      ++calls;
      throw std::runtime_error("socket closed");
    }),
    std::runtime_error
  );
  EXPECT_EQ(calls, 4);
}

TEST_F(RetryPolicyTest, CancelledErrorIsNotRetried) {
  int calls = 0;
  try {
    policy_->execute([&]() -> void {
      ++calls;
      throw UploadError(ErrorKind::kCancelled, "stop");
    });
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kCancelled);
  }
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(RetryPolicyTest, CancellationStopsFurtherAttempts) {
  int calls = 0;
  try {
    policy_->execute([&]() -> void {
      ++calls;
      sleeper_.cancel();
      throw UploadError(ErrorKind::kChunkUpload, "failed");
    });
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kCancelled);
  }
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, DoesNotStartWhenAlreadyCancelled) {
  sleeper_.cancel();
  int calls = 0;
  EXPECT_THROW(policy_->execute([&]() { return ++calls; }), UploadError);
  EXPECT_EQ(calls, 0);
}

TEST(CancellableSleeperTest, SleepsFullDuration) {
  CancellableSleeper sleeper;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(sleeper.sleepFor(std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(CancellableSleeperTest, CancelWakesSleepingThread) {
  CancellableSleeper sleeper;
  bool completed = true;
  auto start = std::chrono::steady_clock::now();

  std::thread sleeper_thread([&]() {
    completed = sleeper.sleepFor(std::chrono::seconds(30));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  sleeper.cancel();
  sleeper_thread.join();

  EXPECT_FALSE(completed);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_TRUE(sleeper.cancelled());
}

TEST(CancellableSleeperTest, ResetClearsCancellation) {
  CancellableSleeper sleeper;
  sleeper.cancel();
  EXPECT_FALSE(sleeper.sleepFor(std::chrono::milliseconds(1)));

  sleeper.reset();
  EXPECT_FALSE(sleeper.cancelled());
  EXPECT_TRUE(sleeper.sleepFor(std::chrono::milliseconds(1)));
}
