#include <hotview/platform/event_loop.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace hotview::platform;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// 1. Posted tasks run in FIFO order on run_pending
// ---------------------------------------------------------------------------
TEST(EventLoopTest, PostedTasksRunInOrder) {
    EventLoop loop;
    std::vector<int> order;

    for (int i = 0; i < 10; ++i) {
        loop.post_task([i, &order]() { order.push_back(i); });
    }
    EXPECT_EQ(loop.pending_count(), 10u);

    loop.run_pending();

    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
    EXPECT_EQ(loop.pending_count(), 0u);
}

// ---------------------------------------------------------------------------
// 2. Delayed tasks fire in due order, not post order
// ---------------------------------------------------------------------------
TEST(EventLoopTest, DelayedTasksFireInDueOrder) {
    EventLoop loop;
    std::vector<int> order;

    loop.post_delayed_task([&order]() { order.push_back(3); }, 90ms);
    loop.post_delayed_task([&order]() { order.push_back(1); }, 30ms);
    loop.post_delayed_task([&order]() { order.push_back(2); }, 60ms);

    loop.run_pending();
    EXPECT_TRUE(order.empty());

    std::this_thread::sleep_for(150ms);
    loop.run_pending();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

// ---------------------------------------------------------------------------
// 3. A task posted from a task runs in the next batch
// ---------------------------------------------------------------------------
TEST(EventLoopTest, TaskPostedFromTaskRunsNextBatch) {
    EventLoop loop;
    bool inner = false;

    loop.post_task([&loop, &inner]() {
        loop.post_task([&inner]() { inner = true; });
    });

    loop.run_pending();
    EXPECT_FALSE(inner);
    EXPECT_EQ(loop.pending_count(), 1u);

    loop.run_pending();
    EXPECT_TRUE(inner);
}

// ---------------------------------------------------------------------------
// 4. quit() from a task stops run()
// ---------------------------------------------------------------------------
TEST(EventLoopTest, QuitFromTaskStopsRun) {
    EventLoop loop;
    loop.post_task([&loop]() { loop.quit(); });

    loop.run();
    EXPECT_FALSE(loop.is_running());
}

// ---------------------------------------------------------------------------
// 5. quit() before run() makes run() return at once
// ---------------------------------------------------------------------------
TEST(EventLoopTest, QuitBeforeRunReturnsImmediately) {
    EventLoop loop;
    loop.quit();

    auto start = std::chrono::steady_clock::now();
    loop.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);

    // The request is consumed; the loop can run again
    loop.post_delayed_task([&loop]() { loop.quit(); }, 10ms);
    EXPECT_TRUE(loop.run_for(2s));
}

// ---------------------------------------------------------------------------
// 6. A post from another thread wakes a blocked run()
// ---------------------------------------------------------------------------
TEST(EventLoopTest, PostFromOtherThreadWakesRun) {
    EventLoop loop;
    std::atomic<bool> executed{false};

    std::thread runner([&loop]() { loop.run(); });

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(loop.is_running());

    loop.post_task([&executed, &loop]() {
        executed.store(true);
        loop.quit();
    });
    runner.join();

    EXPECT_TRUE(executed.load());
    EXPECT_FALSE(loop.is_running());
}

// ---------------------------------------------------------------------------
// 7. run_for returns false on timeout and runs due tasks meanwhile
// ---------------------------------------------------------------------------
TEST(EventLoopTest, RunForTimesOut) {
    EventLoop loop;
    bool fired = false;
    loop.post_delayed_task([&fired]() { fired = true; }, 20ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.run_for(80ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(fired);
    EXPECT_GE(elapsed, 75ms);
    EXPECT_FALSE(loop.is_running());
}

// ---------------------------------------------------------------------------
// 8. Far-future delayed task stays pending
// ---------------------------------------------------------------------------
TEST(EventLoopTest, FarFutureDelayedTaskStaysPending) {
    EventLoop loop;
    bool immediate = false;
    bool delayed = false;

    loop.post_task([&immediate]() { immediate = true; });
    loop.post_delayed_task([&delayed]() { delayed = true; }, 10s);
    EXPECT_EQ(loop.pending_count(), 2u);

    loop.run_pending();
    EXPECT_TRUE(immediate);
    EXPECT_FALSE(delayed);
    EXPECT_EQ(loop.pending_count(), 1u);
}

// ---------------------------------------------------------------------------
// 9. Concurrent posts from several threads all run
// ---------------------------------------------------------------------------
TEST(EventLoopTest, ConcurrentPostsAllRun) {
    EventLoop loop;
    std::atomic<int> counter{0};
    constexpr int kThreads = 4;
    constexpr int kTasksPerThread = 25;

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&loop, &counter]() {
                for (int i = 0; i < kTasksPerThread; ++i) {
                    loop.post_task([&counter]() { counter.fetch_add(1); });
                }
            });
        }
    }

    loop.run_pending();
    EXPECT_EQ(counter.load(), kThreads * kTasksPerThread);
}
