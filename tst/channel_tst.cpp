#include <gtest/gtest.h>
#include <string>
#include <chrono>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, channel_unallocated) {
    su::channel<int> ch;
    int i = 0;

    EXPECT_TRUE(ch.closed());
    EXPECT_EQ(su::state::closed, ch.send(1));
    EXPECT_EQ(su::state::closed, ch.try_recv(i));
    EXPECT_FALSE(ch.recv(i));
    EXPECT_EQ(0u, ch.queued());
}

TEST(simple_uikit, channel_fifo) {
    auto ch = su::channel<std::string>::make();
    EXPECT_EQ(0u, ch.capacity());

    EXPECT_EQ(su::state::success, ch.send("one"));
    EXPECT_EQ(su::state::success, ch.send("two"));
    EXPECT_EQ(su::state::success, ch.try_send("three"));
    EXPECT_EQ(3u, ch.queued());

    std::string s;
    EXPECT_TRUE(ch.recv(s));
    EXPECT_EQ(std::string("one"), s);
    EXPECT_EQ(su::state::success, ch.try_recv(s));
    EXPECT_EQ(std::string("two"), s);
    EXPECT_TRUE(ch.recv(s));
    EXPECT_EQ(std::string("three"), s);
    EXPECT_EQ(su::state::failure, ch.try_recv(s));
}

TEST(simple_uikit, channel_bounded_capacity) {
    auto ch = su::channel<int>::make(2);

    EXPECT_EQ(su::state::success, ch.try_send(1));
    EXPECT_EQ(su::state::success, ch.try_send(2));
    EXPECT_EQ(su::state::failure, ch.try_send(3));
    EXPECT_EQ(su::state::failure, ch.send(3, false));

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(su::state::failure, ch.send_for(3, std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
    EXPECT_EQ(2u, ch.queued());

    // a blocked sender proceeds once a receiver makes room
    std::thread th([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        int i;
        ch.recv(i);
    });

    EXPECT_EQ(su::state::success, ch.send(3));
    th.join();

    int i;
    EXPECT_TRUE(ch.recv(i));
    EXPECT_EQ(2, i);
    EXPECT_TRUE(ch.recv(i));
    EXPECT_EQ(3, i);
}

TEST(simple_uikit, channel_blocked_receivers_served_in_order) {
    auto ch = su::channel<int>::make(1);
    int first = 0;
    int second = 0;

    std::thread t1([&]{ ch.recv(first); });
    ASSERT_TRUE(sut::wait_until([&]{ return ch.blocked_receivers() == 1; }));

    std::thread t2([&]{ ch.recv(second); });
    ASSERT_TRUE(sut::wait_until([&]{ return ch.blocked_receivers() == 2; }));

    // hand offs do not occupy capacity
    EXPECT_EQ(su::state::success, ch.try_send(1));
    EXPECT_EQ(su::state::success, ch.try_send(2));

    t1.join();
    t2.join();
    EXPECT_EQ(1, first);
    EXPECT_EQ(2, second);
    EXPECT_EQ(0u, ch.queued());
}

TEST(simple_uikit, channel_close_wakes_everyone) {
    auto ch = su::channel<int>::make(1);
    EXPECT_EQ(su::state::success, ch.send(1));

    su::state sender_result = su::state::success;
    std::thread sender([&]{ sender_result = ch.send(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    sender.join();
    EXPECT_EQ(su::state::closed, sender_result);

    // a soft close leaves queued items receivable
    int i = 0;
    EXPECT_TRUE(ch.recv(i));
    EXPECT_EQ(1, i);
    EXPECT_FALSE(ch.recv(i));
    EXPECT_EQ(su::state::closed, ch.try_recv(i));

    auto ch2 = su::channel<int>::make();
    bool received = true;
    std::thread receiver([&]{ received = ch2.recv(i); });
    ASSERT_TRUE(sut::wait_until([&]{ return ch2.blocked_receivers() == 1; }));
    ch2.close();
    receiver.join();
    EXPECT_FALSE(received);
    EXPECT_EQ(0u, ch2.blocked_receivers());
}

TEST(simple_uikit, channel_hard_close_discards) {
    auto ch = su::channel<int>::make();
    ch.send(1);
    ch.send(2);
    ch.close(false);

    int i;
    EXPECT_EQ(0u, ch.queued());
    EXPECT_EQ(su::state::closed, ch.try_recv(i));
    EXPECT_EQ(su::state::closed, ch.send(3));
}

TEST(simple_uikit, channel_many_producers) {
    const int producers = 4;
    const int per_producer = 250;
    auto ch = su::channel<int>::make(8);
    std::vector<std::thread> threads;

    for(int p = 0; p < producers; ++p) {
        threads.emplace_back([=]() mutable {
            for(int i = 0; i < per_producer; ++i) {
                ch.send(p * per_producer + i);
            }
        });
    }

    std::vector<int> last(producers, -1);
    for(int n = 0; n < producers * per_producer; ++n) {
        int v;
        ASSERT_TRUE(ch.recv(v));
        int p = v / per_producer;

        // per producer order is preserved
        EXPECT_LT(last[p], v);
        last[p] = v;
    }

    for(auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(0u, ch.queued());
}
