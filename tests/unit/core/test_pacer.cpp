/**
 * @file test_pacer.cpp
 * @brief Unit tests for the pacer and paced body streams
 */

#include <gtest/gtest.h>

#include <kcenon/blob_upload/core/pacer.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::blob_upload::test {

class PacerTest : public ::testing::Test {
protected:
    static constexpr uint64_t MB = 1024 * 1024;
    static constexpr uint64_t KB = 1024;
};

// Construction

TEST_F(PacerTest, Construction_WithLimit) {
    pacer limiter(10 * MB);
    EXPECT_EQ(limiter.get_limit(), 10 * MB);
    EXPECT_TRUE(limiter.is_enabled());
    EXPECT_EQ(limiter.bucket_capacity(), 10 * MB);
}

TEST_F(PacerTest, Construction_ZeroMeansUnlimited) {
    pacer limiter(0);
    EXPECT_FALSE(limiter.is_enabled());

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter.acquire(100 * MB));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
}

// Acquisition

TEST_F(PacerTest, TryAcquire_ConsumesBurst) {
    pacer limiter(10 * KB);
    EXPECT_TRUE(limiter.try_acquire(10 * KB));
    EXPECT_FALSE(limiter.try_acquire(10 * KB));
}

TEST_F(PacerTest, Acquire_WaitsForRefill) {
    pacer limiter(100 * KB);
    ASSERT_TRUE(limiter.acquire(100 * KB));

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(limiter.acquire(20 * KB));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 20KB at 100KB/s needs about 200ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
}

TEST_F(PacerTest, Acquire_LargerThanBucketIsSplit) {
    pacer limiter(1 * MB);
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(limiter.acquire(1 * MB + 256 * KB));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(PacerTest, Acquire_StopsWhenCancelled) {
    pacer limiter(1 * KB);
    ASSERT_TRUE(limiter.acquire(1 * KB));

    cancellation_source source;
    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto granted = limiter.acquire(1 * KB, source.token());
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(granted);
    EXPECT_EQ(granted.error().code, error_code::transfer_cancelled);
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
}

// Dynamic limit

TEST_F(PacerTest, SetLimit_ZeroDisables) {
    pacer limiter(1 * KB);
    limiter.set_limit(0);
    EXPECT_FALSE(limiter.is_enabled());
    EXPECT_TRUE(limiter.try_acquire(10 * MB));
}

TEST_F(PacerTest, SetLimit_EnablesUnlimitedPacer) {
    pacer limiter(0);
    limiter.set_limit(2 * MB);
    EXPECT_TRUE(limiter.is_enabled());
    EXPECT_EQ(limiter.bucket_capacity(), 2 * MB);
}

TEST_F(PacerTest, SetLimit_WakesWaiters) {
    pacer limiter(1 * KB);
    ASSERT_TRUE(limiter.acquire(1 * KB));

    std::thread waiter([&limiter] { EXPECT_TRUE(limiter.acquire(100 * KB)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    limiter.set_limit(0);
    waiter.join();
}

TEST_F(PacerTest, SetLimit_ShrinkingBucketDoesNotStrandWaiter) {
    pacer limiter(400 * KB);
    ASSERT_TRUE(limiter.acquire(400 * KB));

    cancellation_source source;
    result<void> granted;
    auto start = std::chrono::steady_clock::now();
    std::thread waiter([&] { granted = limiter.acquire(400 * KB, source.token()); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    limiter.set_limit(300 * KB);

    // Backstop only; the waiter should finish in about 1.3s.
    std::atomic<bool> finished{false};
    std::thread canceller([&] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(6);
        while (!finished.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        source.cancel();
    });
    waiter.join();
    auto elapsed = std::chrono::steady_clock::now() - start;
    finished.store(true);
    canceller.join();

    EXPECT_TRUE(granted.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

// Paced bodies

class PacedBodyTest : public ::testing::Test {
protected:
    std::vector<std::byte> data_ = std::vector<std::byte>(200 * 1024, std::byte{7});
};

TEST_F(PacedBodyTest, NullPacerGivesPlainStream) {
    auto body = make_paced_body(data_, nullptr, {});
    EXPECT_EQ(body->size(), data_.size());
    EXPECT_EQ(dynamic_cast<paced_body_stream*>(body.get()), nullptr);
}

TEST_F(PacedBodyTest, ReadsWholeBody) {
    auto body = make_paced_body(data_, std::make_shared<pacer>(10 * 1024 * 1024), {});
    auto all = read_all(*body);
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), data_.size());
    EXPECT_EQ(all.value().front(), 7);
}

TEST_F(PacedBodyTest, ReadsAreLimitedToBlock) {
    paced_body_stream body(std::make_unique<memory_body_stream>(data_),
                           std::make_shared<pacer>(0));
    std::vector<std::byte> buffer(data_.size());
    auto got = body.read(buffer);
    ASSERT_TRUE(got);
    EXPECT_EQ(got.value(), paced_body_stream::read_block);
}

TEST_F(PacedBodyTest, RewindRestartsBody) {
    auto body = make_paced_body(data_, std::make_shared<pacer>(0), {});
    ASSERT_TRUE(read_all(*body));
    EXPECT_EQ(body->position(), data_.size());
    body->rewind();
    EXPECT_EQ(body->position(), 0u);
}

TEST_F(PacedBodyTest, CancelledTokenFailsRead) {
    auto limiter = std::make_shared<pacer>(1024);
    ASSERT_TRUE(limiter->acquire(1024));

    cancellation_source source;
    source.cancel();
    auto body = make_paced_body(data_, limiter, source.token());
    auto all = read_all(*body);
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error().code, error_code::transfer_cancelled);
}

}  // namespace kcenon::blob_upload::test
