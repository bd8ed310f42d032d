#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, cancellable_thread_lifecycle) {
    std::atomic<int> iterations(0);

    auto th = su::cancellable_thread::make([&]{
        while(!su::this_thread::is_stop_requested()) {
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    EXPECT_EQ(su::cancellable_thread::status::created, th.state());
    EXPECT_FALSE(th.joinable());
    EXPECT_FALSE(th.join());

    EXPECT_TRUE(th.start());
    EXPECT_FALSE(th.start());
    EXPECT_TRUE(th.joinable());
    EXPECT_EQ(su::cancellable_thread::status::running, th.state());
    ASSERT_TRUE(sut::wait_until([&]{ return iterations.load() > 0; }));

    th.request_stop();
    EXPECT_TRUE(th.is_stop_requested());
    th.request_stop();

    EXPECT_TRUE(th.join());
    EXPECT_EQ(su::cancellable_thread::status::terminated, th.state());
    EXPECT_FALSE(th.joinable());
}

TEST(simple_uikit, cancellable_thread_arguments) {
    std::atomic<int> sum(0);

    auto th = su::cancellable_thread::make([&](int a, int b){ sum = a + b; }, 2, 3);
    th.start();
    th.join();
    EXPECT_EQ(5, sum.load());
}

TEST(simple_uikit, cancellable_thread_stop_hook_runs_once) {
    std::atomic<int> hook_calls(0);
    auto ch = su::channel<int>::make();

    auto th = su::cancellable_thread::make([ch]() mutable {
        int i;
        while(!su::this_thread::is_stop_requested() && ch.recv(i)) { }
    });

    th.on_stop_requested([&hook_calls, ch]() mutable {
        ++hook_calls;
        ch.send(0);
    });

    th.start();
    ASSERT_TRUE(sut::wait_until([&]{ return ch.blocked_receivers() == 1; }));

    th.request_stop();
    th.request_stop();
    EXPECT_TRUE(th.join());
    EXPECT_EQ(1, hook_calls.load());
}

TEST(simple_uikit, cancellable_thread_stop_before_start) {
    std::atomic<bool> saw_stop(false);

    auto th = su::cancellable_thread::make([&]{
        saw_stop = su::this_thread::is_stop_requested();
    });

    th.request_stop();
    EXPECT_EQ(su::cancellable_thread::status::stop_requested, th.state());
    th.start();
    th.join();
    EXPECT_TRUE(saw_stop.load());
    EXPECT_EQ(su::cancellable_thread::status::terminated, th.state());
}

TEST(simple_uikit, cancellable_thread_joined_on_destruction) {
    std::atomic<bool> finished(false);

    {
        auto th = su::cancellable_thread::make([&]{
            while(!su::this_thread::is_stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            finished = true;
        });

        th.start();
    }

    // the last handle asked the thread to stop and joined it
    EXPECT_TRUE(finished.load());
}

TEST(simple_uikit, cancellable_thread_daemon) {
    auto th = su::cancellable_thread::make([]{ });
    EXPECT_FALSE(th.daemon());
    th.daemon(true);
    EXPECT_TRUE(th.daemon());

    EXPECT_FALSE(su::this_thread::is_stop_requested());
}

TEST(simple_uikit, cancellable_thread_body_exceptions_are_contained) {
    auto std_th = su::cancellable_thread::make([]{
        throw std::runtime_error("body failed");
    });

    auto int_th = su::cancellable_thread::make([]{
        throw 42;
    });

    std_th.start();
    int_th.start();

    // the process survives and both threads terminate normally
    EXPECT_TRUE(std_th.join());
    EXPECT_TRUE(int_th.join());
    EXPECT_EQ(su::cancellable_thread::status::terminated, std_th.state());
    EXPECT_EQ(su::cancellable_thread::status::terminated, int_th.state());
}
