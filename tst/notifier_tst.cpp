#include <gtest/gtest.h>
#include <thread>
#include <poll.h>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

namespace sut {

bool readable(int fd) {
    struct pollfd p;
    p.fd = fd;
    p.events = POLLIN;
    p.revents = 0;
    return ::poll(&p, 1, 0) == 1 && (p.revents & POLLIN);
}

}

TEST(simple_uikit, notifier_notify_and_drain) {
    su::notifier n;
    ASSERT_FALSE(n.closed());
    ASSERT_GE(n.fd(), 0);
    EXPECT_FALSE(sut::readable(n.fd()));

    EXPECT_EQ(su::state::success, n.notify());
    EXPECT_TRUE(sut::readable(n.fd()));

    // several notifications are drained at once
    EXPECT_EQ(su::state::success, n.notify());
    EXPECT_EQ(su::state::success, n.notify());
    n.drain();
    EXPECT_FALSE(sut::readable(n.fd()));

    // draining an idle notifier does not block
    n.drain();
    EXPECT_FALSE(sut::readable(n.fd()));
}

TEST(simple_uikit, notifier_full_pipe_is_success) {
    su::notifier n;

    for(int i = 0; i < 200000; ++i) {
        ASSERT_EQ(su::state::success, n.notify());
    }

    EXPECT_TRUE(sut::readable(n.fd()));
    n.drain();
    EXPECT_FALSE(sut::readable(n.fd()));
}

TEST(simple_uikit, notifier_stable_fd_and_close) {
    su::notifier n;
    int fd = n.fd();
    n.notify();
    n.drain();
    EXPECT_EQ(fd, n.fd());

    n.close();
    EXPECT_TRUE(n.closed());
    EXPECT_EQ(-1, n.fd());
    EXPECT_EQ(su::state::closed, n.notify());

    // idempotent
    n.close();
    n.drain();
    EXPECT_TRUE(n.closed());
}

TEST(simple_uikit, notifier_wakes_poll_from_other_thread) {
    su::notifier n;

    std::thread th([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        n.notify();
    });

    struct pollfd p;
    p.fd = n.fd();
    p.events = POLLIN;
    p.revents = 0;
    EXPECT_EQ(1, ::poll(&p, 1, 2000));
    th.join();
}
