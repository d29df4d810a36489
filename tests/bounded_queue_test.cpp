#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

#include "infra/thread_pool/bounded_queue.hpp"
#include "infra/thread_pool/worker_pool.hpp"

using shootsync::infra::BoundedQueue;
using shootsync::infra::WorkerPool;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, ZeroCapacityRejected)
{
    EXPECT_THROW(BoundedQueue<int>{0}, std::invalid_argument);
}

TEST(BoundedQueueTest, FifoOrder)
{
    BoundedQueue<int> queue{3};
    std::stop_source ss;
    ASSERT_TRUE(queue.push(1, ss.get_token()));
    ASSERT_TRUE(queue.push(2, ss.get_token()));
    ASSERT_TRUE(queue.push(3, ss.get_token()));
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.pop(ss.get_token()), 1);
    EXPECT_EQ(queue.pop(ss.get_token()), 2);
    EXPECT_EQ(queue.pop(ss.get_token()), 3);
}

TEST(BoundedQueueTest, PushBlocksWhileFull)
{
    BoundedQueue<int> queue{1};
    std::stop_source ss;
    ASSERT_TRUE(queue.push(1, ss.get_token()));

    std::atomic<bool> pushed{false};
    std::jthread producer([&] {
        EXPECT_TRUE(queue.push(2, ss.get_token()));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.size(), 1u);

    EXPECT_EQ(queue.pop(ss.get_token()), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(ss.get_token()), 2);
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems)
{
    BoundedQueue<int> queue{2};
    std::stop_source ss;
    ASSERT_TRUE(queue.push(7, ss.get_token()));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(8, ss.get_token()));
    EXPECT_EQ(queue.pop(ss.get_token()), 7);
    EXPECT_EQ(queue.pop(ss.get_token()), std::nullopt);
}

TEST(BoundedQueueTest, StopUnblocksWaitingPush)
{
    BoundedQueue<int> queue{1};
    std::stop_source ss;
    ASSERT_TRUE(queue.push(1, ss.get_token()));

    std::atomic<bool> result{true};
    std::jthread producer([&] { result = queue.push(2, ss.get_token()); });

    std::this_thread::sleep_for(20ms);
    ss.request_stop();
    producer.join();
    EXPECT_FALSE(result.load());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(BoundedQueueTest, StopUnblocksWaitingPop)
{
    BoundedQueue<int> queue{1};
    std::stop_source ss;

    std::optional<int> result{42};
    std::jthread consumer([&] { result = queue.pop(ss.get_token()); });

    std::this_thread::sleep_for(20ms);
    ss.request_stop();
    consumer.join();
    EXPECT_EQ(result, std::nullopt);
}

TEST(BoundedQueueTest, PopAfterStopIgnoresQueuedItems)
{
    BoundedQueue<int> queue{2};
    std::stop_source ss;
    ASSERT_TRUE(queue.push(1, ss.get_token()));
    ss.request_stop();
    EXPECT_EQ(queue.pop(ss.get_token()), std::nullopt);
}

TEST(WorkerPoolTest, ConsumesEveryItemExactlyOnce)
{
    constexpr int kItems = 200;
    BoundedQueue<int> queue{4};
    std::stop_source ss;
    std::atomic<int> sum{0};
    std::atomic<int> count{0};

    {
        WorkerPool pool{3, [&](std::size_t) {
            while (auto item = queue.pop(ss.get_token())) {
                sum += *item;
                ++count;
            }
        }};
        EXPECT_EQ(pool.size(), 3u);

        for (int i = 1; i <= kItems; ++i) {
            ASSERT_TRUE(queue.push(i, ss.get_token()));
        }
        queue.close();
        pool.join();
        EXPECT_EQ(pool.active(), 0u);
    }

    EXPECT_EQ(count.load(), kItems);
    EXPECT_EQ(sum.load(), kItems * (kItems + 1) / 2);
}

TEST(WorkerPoolTest, ExceptionStopsOnlyThatWorker)
{
    BoundedQueue<int> queue{8};
    std::stop_source ss;
    std::atomic<int> processed{0};

    WorkerPool pool{2, [&](std::size_t) {
        while (auto item = queue.pop(ss.get_token())) {
            if (*item == 0) throw std::runtime_error("bad item");
            ++processed;
        }
    }};

    ASSERT_TRUE(queue.push(0, ss.get_token()));
    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(queue.push(i, ss.get_token()));
    }
    queue.close();
    pool.join();

    EXPECT_EQ(processed.load(), 5);
}

TEST(WorkerPoolTest, LosingAllWorkersUnblocksProducer)
{
    BoundedQueue<int> queue{1};
    std::stop_source ss;
    std::atomic<int> lost_calls{0};

    WorkerPool pool{2,
        [&](std::size_t) {
            if (auto item = queue.pop(ss.get_token())) throw std::runtime_error("broken worker");
        },
        [&] {
            ++lost_calls;
            queue.close();
        }};

    // Без закрытия очереди производитель ждал бы здесь бесконечно
    int accepted = 0;
    for (int i = 0; i < 10; ++i) {
        if (!queue.push(i, ss.get_token())) break;
        ++accepted;
    }
    pool.join();

    EXPECT_LT(accepted, 10);
    EXPECT_EQ(lost_calls.load(), 1);
    EXPECT_TRUE(queue.closed());
}

TEST(WorkerPoolTest, NormalExitDoesNotReportLoss)
{
    BoundedQueue<int> queue{1};
    std::stop_source ss;
    std::atomic<int> lost_calls{0};

    {
        WorkerPool pool{2,
            [&](std::size_t) { while (queue.pop(ss.get_token())) {} },
            [&] { ++lost_calls; }};
        queue.close();
    }
    EXPECT_EQ(lost_calls.load(), 0);
}
