#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <vector>
#include <poll.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

namespace sut {
namespace selectable_queue {

bool readable(int fd, int timeout_ms=0) {
    struct pollfd p;
    p.fd = fd;
    p.events = POLLIN;
    p.revents = 0;
    return ::poll(&p, 1, timeout_ms) == 1 && (p.revents & POLLIN);
}

}
}

TEST(simple_uikit, selectable_queue_get_all) {
    su::selectable_queue<int> q;
    EXPECT_FALSE(sut::selectable_queue::readable(q.fd()));
    EXPECT_TRUE(q.get_all().empty());

    EXPECT_EQ(su::state::success, q.put(1));
    EXPECT_EQ(su::state::success, q.put(2));
    EXPECT_EQ(su::state::success, q.put_nowait(3));
    EXPECT_TRUE(sut::selectable_queue::readable(q.fd()));

    std::vector<int> items = q.get_all();
    EXPECT_EQ((std::vector<int>{ 1, 2, 3 }), items);
    EXPECT_FALSE(sut::selectable_queue::readable(q.fd()));
    EXPECT_TRUE(q.get_all().empty());
}

TEST(simple_uikit, selectable_queue_capacity) {
    su::selectable_queue<int> q(1);

    EXPECT_EQ(su::state::success, q.put_nowait(1));
    EXPECT_EQ(su::state::failure, q.put_nowait(2));
    EXPECT_EQ(su::state::failure, q.put(2, false));
    EXPECT_EQ(su::state::failure, q.put(2, std::chrono::milliseconds(10)));
    EXPECT_EQ((std::vector<int>{ 1 }), q.get_all());
    EXPECT_EQ(su::state::success, q.put(2, std::chrono::milliseconds(10)));
}

TEST(simple_uikit, selectable_queue_close) {
    su::selectable_queue<int> q;
    q.put(1);
    q.close();

    EXPECT_TRUE(q.closed());
    EXPECT_EQ(-1, q.fd());
    EXPECT_EQ(su::state::closed, q.put(2));
    EXPECT_TRUE(q.get_all().empty());
    q.close();
}

TEST(simple_uikit, selectable_queue_concurrent_producers) {
    const int producers = 4;
    const int per_producer = 500;
    su::selectable_queue<std::pair<int,int>> q;
    std::vector<std::thread> threads;

    for(int p = 0; p < producers; ++p) {
        threads.emplace_back([&q, p]{
            for(int i = 0; i < per_producer; ++i) {
                q.put(std::make_pair(p, i));
            }
        });
    }

    std::map<int,int> next;
    int received = 0;

    // consume the way a main loop does: wait for readability, then drain
    while(received < producers * per_producer) {
        ASSERT_TRUE(sut::selectable_queue::readable(q.fd(), 2000));

        for(auto& item : q.get_all()) {
            // no loss, no duplication, producer order preserved
            EXPECT_EQ(next[item.first], item.second);
            next[item.first] = item.second + 1;
            ++received;
        }
    }

    for(auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(producers * per_producer, received);
    EXPECT_TRUE(q.get_all().empty());
}

TEST(simple_uikit, selectable_queue_put_succeeds_when_wake_up_write_fails) {
    su::selectable_queue<int> q;

    // the write end of the pipe is allocated right after the read end
    int write_fd = q.fd() + 1;
    struct stat st;

    if(::fstat(write_fd, &st) != 0 ||
       !S_ISFIFO(st.st_mode) ||
       (::fcntl(write_fd, F_GETFL) & O_ACCMODE) != O_WRONLY) {
        GTEST_SKIP() << "pipe write end is not adjacent to its read end";
    }

    // replace the write end with a descriptor that rejects writes
    int ro = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(ro, 0);
    ASSERT_EQ(write_fd, ::dup2(ro, write_fd));
    ::close(ro);

    sut::log_capture cap(su::log::level::none);

    // the item is queued, so reporting anything else would invite a duplicate retry
    EXPECT_EQ(su::state::success, q.put(7));
    EXPECT_EQ(su::state::success, q.put_nowait(8));
    EXPECT_EQ(2u, q.queued());
    EXPECT_EQ((std::vector<int>{ 7, 8 }), q.get_all());
}
