#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, atomic_counter_value) {
    su::atomic_counter c;
    EXPECT_EQ(0, c.value());

    c.increase();
    c.increase(4);
    EXPECT_EQ(5, c.value());

    c.decrease(2);
    EXPECT_EQ(3, c.value());

    c.value(-7);
    EXPECT_EQ(-7, c.value());
}

TEST(simple_uikit, atomic_counter_wait_timeout_returns_current_value) {
    su::atomic_counter c;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(0, c.wait(std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));

    EXPECT_EQ(0, c.wait_and_reset(std::chrono::milliseconds(1)));

    c.increase(2);
    EXPECT_EQ(2, c.wait(std::chrono::milliseconds(1)));
    EXPECT_EQ(2, c.value());
}

TEST(simple_uikit, atomic_counter_wait_and_reset) {
    su::atomic_counter c;

    std::thread th([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        c.increase(3);
    });

    EXPECT_EQ(3, c.wait_and_reset());
    EXPECT_EQ(0, c.value());
    th.join();
}

TEST(simple_uikit, atomic_counter_wait_does_not_reset) {
    su::atomic_counter c;

    std::thread th([&]{
        c.increase();
    });

    EXPECT_EQ(1, c.wait());
    th.join();
    EXPECT_EQ(1, c.value());
}
