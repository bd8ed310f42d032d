#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, main_loop_alarm_order) {
    su::main_loop loop;
    std::vector<std::string> calls;
    su::time_point now = su::clock::now();

    loop.set_alarm_at(now, [&]{ calls.push_back("a"); });
    loop.set_alarm_at(now, [&]{ calls.push_back("b"); });
    loop.set_alarm_at(now - std::chrono::milliseconds(10), [&]{ calls.push_back("c"); });
    loop.set_alarm_in(std::chrono::hours(1), [&]{ calls.push_back("later"); });
    EXPECT_EQ(4u, loop.alarms());

    EXPECT_TRUE(loop.iterate(false));

    // earliest first, equal times in registration order
    ASSERT_EQ(3u, calls.size());
    EXPECT_EQ(std::string("c"), calls[0]);
    EXPECT_EQ(std::string("a"), calls[1]);
    EXPECT_EQ(std::string("b"), calls[2]);
    EXPECT_EQ(1u, loop.alarms());
}

TEST(simple_uikit, main_loop_remove_alarm) {
    su::main_loop loop;
    int calls = 0;

    std::size_t token = loop.set_alarm_in(su::duration::zero(), [&]{ ++calls; });
    std::size_t other = loop.set_alarm_in(su::duration::zero(), [&]{ calls += 10; });
    EXPECT_NE(0u, token);
    EXPECT_NE(token, other);

    EXPECT_TRUE(loop.remove_alarm(token));
    EXPECT_FALSE(loop.remove_alarm(token));
    EXPECT_FALSE(loop.remove_alarm(0));

    loop.iterate(false);
    EXPECT_EQ(10, calls);

    // already fired
    EXPECT_FALSE(loop.remove_alarm(other));
    EXPECT_EQ(0u, loop.alarms());
}

TEST(simple_uikit, main_loop_alarms_set_during_dispatch_wait_for_next_iteration) {
    su::main_loop loop;
    std::vector<int> calls;

    loop.set_alarm_in(su::duration::zero(), [&]{
        calls.push_back(1);
        loop.set_alarm_in(su::duration::zero(), [&]{ calls.push_back(2); });
    });

    loop.iterate(false);
    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ(1u, loop.alarms());

    loop.iterate(false);
    ASSERT_EQ(2u, calls.size());
    EXPECT_EQ(2, calls[1]);
}

TEST(simple_uikit, main_loop_idle_callbacks) {
    su::main_loop loop;
    std::vector<std::string> calls;

    std::size_t first = loop.enter_idle([&]{ calls.push_back("idle1"); });
    loop.enter_idle([&]{ calls.push_back("idle2"); });
    loop.set_alarm_in(su::duration::zero(), [&]{ calls.push_back("alarm"); });

    loop.iterate(false);
    ASSERT_EQ(3u, calls.size());
    EXPECT_EQ(std::string("idle1"), calls[0]);
    EXPECT_EQ(std::string("idle2"), calls[1]);
    EXPECT_EQ(std::string("alarm"), calls[2]);

    EXPECT_TRUE(loop.remove_enter_idle(first));
    EXPECT_FALSE(loop.remove_enter_idle(first));

    calls.clear();

    // nothing but idle callbacks to run
    EXPECT_FALSE(loop.iterate(false));
    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ(std::string("idle2"), calls[0]);
}

TEST(simple_uikit, main_loop_watch_file) {
    su::main_loop loop;
    su::notifier n;
    int calls = 0;

    std::size_t watch = loop.watch_file(n.fd(), [&]{
        ++calls;
        n.drain();
    });

    EXPECT_FALSE(loop.iterate(false));
    EXPECT_EQ(0, calls);

    EXPECT_EQ(su::state::success, n.notify());
    EXPECT_TRUE(loop.iterate(false));
    EXPECT_EQ(1, calls);

    // drained
    EXPECT_FALSE(loop.iterate(false));
    EXPECT_EQ(1, calls);

    EXPECT_TRUE(loop.remove_watch_file(watch));
    EXPECT_FALSE(loop.remove_watch_file(watch));
    n.notify();
    EXPECT_FALSE(loop.iterate(false));
    EXPECT_EQ(1, calls);
}

TEST(simple_uikit, main_loop_blocking_iteration_waits_for_alarm) {
    su::main_loop loop;
    bool called = false;
    auto start = std::chrono::steady_clock::now();

    loop.set_alarm_in(std::chrono::milliseconds(30), [&]{ called = true; });

    while(!called) {
        loop.iterate(true);
    }

    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
}

TEST(simple_uikit, main_loop_blocking_iteration_wakes_on_file) {
    su::main_loop loop;
    su::notifier n;
    bool called = false;

    loop.watch_file(n.fd(), [&]{
        called = true;
        n.drain();
    });

    std::thread th([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        n.notify();
    });

    // blocks in poll() without a timeout until the other thread writes
    EXPECT_TRUE(loop.iterate(true));
    EXPECT_TRUE(called);
    th.join();
}

TEST(simple_uikit, main_loop_run_and_quit) {
    su::main_loop loop;
    EXPECT_FALSE(loop.running());

    int nested = 0;
    bool was_running = false;

    loop.set_alarm_in(std::chrono::milliseconds(5), [&]{
        was_running = loop.running();
        nested = loop.run();
        loop.quit(7);
    });

    EXPECT_EQ(7, loop.run());
    EXPECT_TRUE(was_running);
    EXPECT_EQ(-1, nested);
    EXPECT_FALSE(loop.running());
}

TEST(simple_uikit, main_loop_quit_stops_dispatch) {
    su::main_loop loop;
    std::vector<int> calls;

    loop.set_alarm_in(su::duration::zero(), [&]{
        calls.push_back(1);
        loop.quit(3);
    });

    loop.set_alarm_in(su::duration::zero(), [&]{ calls.push_back(2); });

    EXPECT_EQ(3, loop.run());
    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ(1u, loop.alarms());

    // the loop can run again
    loop.set_alarm_in(std::chrono::milliseconds(1), [&]{ loop.quit(); });
    EXPECT_EQ(0, loop.run());
    EXPECT_EQ(2u, calls.size());
}

TEST(simple_uikit, main_loop_exception_propagates) {
    su::main_loop loop;

    loop.set_alarm_in(su::duration::zero(), []{
        throw std::runtime_error("alarm failed");
    });

    EXPECT_THROW(loop.run(), std::runtime_error);
    EXPECT_FALSE(loop.running());
}

TEST(simple_uikit, main_loop_threadsafe_alarm_registration) {
    su::main_loop loop;
    std::atomic<int> calls(0);
    std::vector<std::thread> threads;

    for(int t = 0; t < 4; ++t) {
        threads.emplace_back([&]{
            for(int i = 0; i < 100; ++i) {
                loop.set_alarm_in(su::duration::zero(), [&]{ ++calls; });
            }
        });
    }

    for(auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(400u, loop.alarms());
    loop.iterate(false);
    EXPECT_EQ(400, calls.load());
}
