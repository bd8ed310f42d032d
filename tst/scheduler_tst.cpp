#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

namespace {

// quit the loop of a scheduler once the delay elapsed
void quit_after(su::scheduler& sched, su::duration after, int code=0) {
    su::main_loop& loop = sched.loop();
    loop.set_alarm_in(after, [&loop, code]{ loop.quit(code); });
}

}

TEST(simple_uikit, scheduler_reschedule_replaces_pending_call) {
    auto sched = su::scheduler::make();
    int calls = 0;

    auto h = sched.call_later(std::chrono::milliseconds(10), [&]{ ++calls; });
    EXPECT_TRUE(h.pending());
    EXPECT_EQ(su::duration::zero(), h.interval());

    EXPECT_TRUE(h.reschedule(std::chrono::milliseconds(20)));
    EXPECT_TRUE(h.reschedule(std::chrono::milliseconds(5)));
    EXPECT_EQ(1u, sched.loop().alarms());

    quit_after(sched, std::chrono::milliseconds(100), 4);
    EXPECT_EQ(4, sut::run_loop(sched));

    EXPECT_EQ(1u, h.num_called());
    EXPECT_TRUE(h.called());
    EXPECT_FALSE(h.pending());
}

TEST(simple_uikit, scheduler_reschedule_now_fires_once) {
    auto sched = su::scheduler::make();
    int calls = 0;

    auto h = sched.call_later(std::chrono::hours(1), [&]{ ++calls; });

    for(int i = 0; i < 10; ++i) {
        EXPECT_TRUE(h.reschedule_now());
    }

    EXPECT_EQ(1u, sched.loop().alarms());
    quit_after(sched, std::chrono::milliseconds(50));
    EXPECT_EQ(0, sut::run_loop(sched));
    EXPECT_EQ(1, calls);
}

TEST(simple_uikit, scheduler_recurring_callback) {
    auto sched = su::scheduler::make();
    const su::duration interval = std::chrono::milliseconds(20);
    std::vector<su::time_point> calls;
    su::callback_handle h;

    h = sched.call_every(interval, [&]{
        calls.push_back(su::clock::now());

        if(calls.size() == 3) {
            h.cancel();
            sched.loop().quit(1);
        }
    });

    EXPECT_EQ(interval, h.interval());
    EXPECT_EQ(1, sut::run_loop(sched));

    ASSERT_EQ(3u, calls.size());
    EXPECT_EQ(3u, h.num_called());
    EXPECT_FALSE(h.pending());

    for(std::size_t i = 1; i < calls.size(); ++i) {
        EXPECT_GE(calls[i] - calls[i - 1], std::chrono::milliseconds(15));
    }
}

TEST(simple_uikit, scheduler_cancel_inside_recurring_callback) {
    auto sched = su::scheduler::make();
    su::callback_handle h;

    h = sched.call_every(std::chrono::milliseconds(1), [&]{
        h.cancel();
    });

    quit_after(sched, std::chrono::milliseconds(50));
    sut::run_loop(sched);

    EXPECT_EQ(1u, h.num_called());
    EXPECT_FALSE(h.pending());
}

TEST(simple_uikit, scheduler_reschedule_inside_recurring_callback) {
    auto sched = su::scheduler::make();
    su::callback_handle h;

    h = sched.call_every(std::chrono::milliseconds(1), [&]{
        if(h.num_called() == 1) {
            // replaces the automatic requeue
            h.reschedule(std::chrono::hours(1));
        }
    });

    quit_after(sched, std::chrono::milliseconds(50));
    sut::run_loop(sched);

    EXPECT_EQ(1u, h.num_called());
    EXPECT_TRUE(h.pending());
    EXPECT_GT(h.seconds_left(), 3000.0);
    h.cancel();
    EXPECT_FALSE(h.pending());
    EXPECT_EQ(0.0, h.seconds_left());
}

TEST(simple_uikit, scheduler_delay_next_call) {
    auto sched = su::scheduler::make();
    int calls = 0;

    auto h = sched.call_later(std::chrono::seconds(10), [&]{ ++calls; });
    double before = h.seconds_left();
    EXPECT_GT(before, 9.0);
    EXPECT_LE(before, 10.0);

    EXPECT_TRUE(h.delay_next_call(std::chrono::seconds(5)));
    EXPECT_GT(h.seconds_left(), 14.0);

    h.cancel();
    EXPECT_FALSE(h.delay_next_call(std::chrono::seconds(1)));

    // a one-shot callback which already ran cannot be delayed
    auto once = sched.call_later(su::duration::zero(), [&]{ ++calls; });
    quit_after(sched, std::chrono::milliseconds(20));
    sut::run_loop(sched);
    EXPECT_EQ(1, calls);
    EXPECT_FALSE(once.delay_next_call(std::chrono::seconds(1)));

    su::callback_handle unallocated;
    EXPECT_FALSE(unallocated.delay_next_call(std::chrono::seconds(1)));
    EXPECT_FALSE(unallocated.reschedule_now());
    EXPECT_FALSE(unallocated.pending());
}

TEST(simple_uikit, scheduler_call_at_other_clock) {
    auto sched = su::scheduler::make();
    std::string received;

    sched.call_at(
        std::chrono::system_clock::now() + std::chrono::milliseconds(10),
        [&](const std::string& s){
            received = s;
            sched.loop().quit(2);
        },
        std::string("hello"));

    EXPECT_EQ(2, sut::run_loop(sched));
    EXPECT_EQ(std::string("hello"), received);
}

TEST(simple_uikit, scheduler_calls_from_worker_run_on_ui_thread) {
    auto sched = su::scheduler::make();
    std::vector<std::string> calls;
    std::thread worker;
    std::atomic<bool> on_ui_thread(false);

    // start the worker once the loop runs so a UI thread is registered
    sched.call_on_ui_thread([&]{
        worker = std::thread([&]{
            EXPECT_FALSE(sched.is_ui_thread());

            sched.call_later(std::chrono::seconds(1), [&]{
                calls.push_back("late");
            });

            sched.call_on_ui_thread([&]{
                on_ui_thread = sched.is_ui_thread();
                calls.push_back("soon");
                sched.loop().quit(5);
            });
        });
    });

    EXPECT_EQ(5, sut::run_loop(sched));
    worker.join();

    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ(std::string("soon"), calls[0]);
    EXPECT_TRUE(on_ui_thread.load());
    EXPECT_FALSE(sched.is_ui_thread());
}

TEST(simple_uikit, scheduler_exception_in_recurring_callback) {
    auto sched = su::scheduler::make();

    auto h = sched.call_every(std::chrono::milliseconds(1), []{
        throw std::runtime_error("callback failed");
    });

    EXPECT_THROW(sched.loop().run(), std::runtime_error);

    // requeued despite the exception
    EXPECT_EQ(1u, h.num_called());
    EXPECT_TRUE(h.pending());
    h.cancel();
    EXPECT_EQ(0u, sched.loop().alarms());
}

TEST(simple_uikit, scheduler_wake_up_markers) {
    auto sched = su::scheduler::make();

    // no UI thread registered
    sched.wake_up();
    EXPECT_EQ(0u, sched.queue().queued());

    sched.register_ui_thread();
    EXPECT_TRUE(sched.is_ui_thread());

    // caller is the UI thread
    sched.wake_up();
    sched.call_later(std::chrono::hours(1), []{ }).cancel();
    EXPECT_EQ(0u, sched.queue().queued());

    std::thread th([&]{
        EXPECT_FALSE(sched.is_ui_thread());
        sched.wake_up();
    });
    th.join();

    auto events = sched.queue().get_all();
    ASSERT_EQ(1u, events.size());
    EXPECT_TRUE(events[0].is_wake_up());
    EXPECT_FALSE(events[0].is_user());

    sched.unregister_ui_thread();
    EXPECT_FALSE(sched.is_ui_thread());
}

TEST(simple_uikit, scheduler_inject_event_and_refresh) {
    auto sched = su::scheduler::make();

    EXPECT_EQ(su::state::success, sched.inject_event(su::event::make(3, std::string("payload"))));
    EXPECT_EQ(su::state::success, sched.refresh());

    auto events = sched.queue().get_all();
    ASSERT_EQ(2u, events.size());
    EXPECT_TRUE(events[0].is_user());
    EXPECT_EQ(3u, events[0].id());
    EXPECT_TRUE(events[0].data().is<std::string>());
    EXPECT_TRUE(events[1].is_refresh());

    sched.queue().close();
    EXPECT_EQ(su::state::closed, sched.inject_event(su::event::make(4)));
}

TEST(simple_uikit, scheduler_handle_outlives_scheduler) {
    su::callback_handle h;
    int calls = 0;

    {
        auto sched = su::scheduler::make();
        h = sched.call_later(std::chrono::hours(1), [&]{ ++calls; });
    }

    EXPECT_FALSE(h.reschedule_now());
    EXPECT_FALSE(h.delay_next_call(std::chrono::seconds(1)));
    h.cancel();
    EXPECT_EQ(0, calls);
}
