#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

namespace {

struct test_app : public su::application {
    test_app(su::config cfg=su::config()) :
        su::application(std::move(cfg)),
        m_redraws(0),
        m_configured(0),
        m_cleaned(0),
        m_quit_on(0)
    { }

    std::vector<std::size_t> m_events;
    std::vector<std::string> m_payloads;
    std::atomic<int> m_redraws;
    int m_configured;
    int m_cleaned;
    std::size_t m_quit_on;

protected:
    void process_event(su::event& e) {
        EXPECT_TRUE(is_ui_thread());
        EXPECT_TRUE(e.is_user());
        m_events.push_back(e.id());

        std::string s;
        if(e.data().copy_to(s)) {
            m_payloads.push_back(s);
        }

        if(m_quit_on && e.id() == m_quit_on) {
            quit(static_cast<int>(e.id()));
        }
    }

    void redraw() {
        ++m_redraws;
    }

    void configure_main_loop() {
        EXPECT_TRUE(is_ui_thread());
        ++m_configured;
    }

    void cleanup_main_loop() {
        ++m_cleaned;
    }
};

}

TEST(simple_uikit, application_events_in_injection_order) {
    test_app app;

    app.inject_event(su::event::make(1, std::string("one")));
    app.inject_event(su::event::make(2));
    app.refresh();
    app.inject_event(su::event::make(3, std::string("three")));
    app.call_later(std::chrono::milliseconds(20), [&]{ app.quit(9); });

    EXPECT_EQ(9, app.run());

    ASSERT_EQ(3u, app.m_events.size());
    EXPECT_EQ(1u, app.m_events[0]);
    EXPECT_EQ(2u, app.m_events[1]);
    EXPECT_EQ(3u, app.m_events[2]);

    ASSERT_EQ(2u, app.m_payloads.size());
    EXPECT_EQ(std::string("one"), app.m_payloads[0]);
    EXPECT_EQ(std::string("three"), app.m_payloads[1]);

    EXPECT_GE(app.m_redraws.load(), 1);
    EXPECT_EQ(1, app.m_configured);
    EXPECT_EQ(1, app.m_cleaned);
    EXPECT_FALSE(app.is_ui_thread());
}

TEST(simple_uikit, application_quit_from_event_handler) {
    test_app app;
    app.m_quit_on = 11;

    app.inject_event(su::event::make(10));
    app.inject_event(su::event::make(11));
    app.inject_event(su::event::make(12));

    EXPECT_EQ(11, app.run());

    // the quit takes effect once the current batch of events is handled
    ASSERT_GE(app.m_events.size(), 2u);
    EXPECT_EQ(10u, app.m_events[0]);
    EXPECT_EQ(11u, app.m_events[1]);
}

TEST(simple_uikit, application_markers_never_reach_process_event) {
    test_app app;

    auto th = app.create_worker([&]{
        app.refresh();
        app.wake_up();
        app.inject_event(su::event::make(42));
        app.refresh();
        app.quit(1);
    });

    app.call_on_ui_thread([th]() mutable { th.start(); });

    EXPECT_EQ(1, app.run());
    th.join();

    ASSERT_EQ(1u, app.m_events.size());
    EXPECT_EQ(42u, app.m_events[0]);
}

TEST(simple_uikit, application_worker_context) {
    test_app app;
    std::atomic<bool> saw_stop(false);
    std::vector<int> results;

    auto th = app.create_worker([&](su::worker_context& ctx, int base){
        for(int i = 0; i < 3; ++i) {
            ctx.call([&results, base, i]{ results.push_back(base + i); });
        }

        ctx.inject_event(su::event::make(7));
        ctx.call_later(std::chrono::milliseconds(10), [&app]{ app.quit(2); });

        while(!ctx.is_stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        saw_stop = true;
    }, 100);

    th.start();
    EXPECT_EQ(2, app.run());

    th.request_stop();
    th.join();
    EXPECT_TRUE(saw_stop.load());

    ASSERT_EQ(3u, results.size());
    EXPECT_EQ(100, results[0]);
    EXPECT_EQ(101, results[1]);
    EXPECT_EQ(102, results[2]);

    ASSERT_EQ(1u, app.m_events.size());
    EXPECT_EQ(7u, app.m_events[0]);
}

TEST(simple_uikit, application_create_daemon) {
    test_app app;
    std::atomic<int> value(0);

    auto th = app.create_daemon([&](int v){ value = v; }, 3);
    EXPECT_TRUE(th.daemon());
    th.start();
    EXPECT_TRUE(th.join());
    EXPECT_EQ(3, value.load());
}

TEST(simple_uikit, application_thread_pool_results_on_ui_thread) {
    su::config cfg;
    cfg.thread_pool_size = 3;
    test_app app(cfg);
    EXPECT_EQ(3u, app.configuration().thread_pool_size);

    auto pool = app.create_thread_pool();
    EXPECT_EQ(3u, pool.size());

    int result = 0;
    bool on_ui_thread = false;

    auto job = pool.submit([]{
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return 6 * 7;
    });

    job.then([&](int& v){
        int copy = v;
        app.call_on_ui_thread([&, copy]{
            on_ui_thread = app.is_ui_thread();
            result = copy;
            app.quit();
        });
    });

    EXPECT_EQ(0, app.run());
    EXPECT_EQ(42, result);
    EXPECT_TRUE(on_ui_thread);
    pool.wait_for_completion();
}

TEST(simple_uikit, application_auto_refresh) {
    su::config cfg;
    cfg.auto_refresh_interval = std::chrono::milliseconds(5);
    test_app app(cfg);

    EXPECT_EQ(su::duration::zero(), app.auto_refresh());
    app.auto_refresh(true);
    EXPECT_EQ(su::duration(std::chrono::milliseconds(5)), app.auto_refresh());
    app.auto_refresh(false);
    EXPECT_EQ(su::duration::zero(), app.auto_refresh());
    app.auto_refresh(su::duration(-std::chrono::milliseconds(1)));
    EXPECT_EQ(su::duration::zero(), app.auto_refresh());

    app.auto_refresh(std::chrono::milliseconds(10));
    app.call_later(std::chrono::milliseconds(100), [&]{ app.quit(); });
    app.run();

    // about ten refresh requests, each followed by a redraw
    EXPECT_GE(app.m_redraws.load(), 5);
    EXPECT_TRUE(app.m_events.empty());

    app.auto_refresh(false);
    EXPECT_EQ(su::duration::zero(), app.auto_refresh());
}

TEST(simple_uikit, application_cleanup_on_exception) {
    test_app app;

    app.call_later(su::duration::zero(), []{
        throw std::runtime_error("callback failed");
    });

    EXPECT_THROW(app.run(), std::runtime_error);
    EXPECT_EQ(1, app.m_configured);
    EXPECT_EQ(1, app.m_cleaned);
    EXPECT_FALSE(app.is_ui_thread());

    // the application can run again
    app.inject_event(su::event::make(5));
    app.call_later(std::chrono::milliseconds(10), [&]{ app.quit(6); });
    EXPECT_EQ(6, app.run());
    EXPECT_EQ(2, app.m_cleaned);
    ASSERT_EQ(1u, app.m_events.size());
    EXPECT_EQ(5u, app.m_events[0]);
}

TEST(simple_uikit, application_recurring_callback) {
    test_app app;
    su::callback_handle h;

    h = app.call_every(std::chrono::milliseconds(1), [&]{
        if(h.num_called() == 3) {
            h.cancel();
            app.quit(static_cast<int>(h.num_called()));
        }
    });

    EXPECT_EQ(3, app.run());
    EXPECT_FALSE(h.pending());

    auto once = app.schedule(su::duration::zero(), su::duration::zero(), [&]{ app.quit(4); });
    EXPECT_EQ(4, app.run());
    EXPECT_TRUE(once.called());
}

TEST(simple_uikit, application_released_with_pending_quit) {
    std::weak_ptr<su::detail::scheduler::context> weak_sched;

    {
        test_app app;
        weak_sched = app.scheduler().ctx();

        std::thread th([&]{ app.quit(3); });
        th.join();

        // the quit request is still pending on the UI thread
        EXPECT_EQ(1u, app.scheduler().loop().alarms());
    }

    // the scheduler, its loop and its event queue were released
    EXPECT_TRUE(weak_sched.expired());
}

TEST(simple_uikit, application_installs_its_configuration) {
    su::log::level old = su::log::threshold();

    {
        su::config cfg;
        cfg.log_level = su::log::level::error;
        test_app app(cfg);

        // installed by construction, before run()
        EXPECT_EQ(su::log::level::error, su::log::threshold());
        EXPECT_EQ(su::log::level::error, app.configuration().log_level);
    }

    su::log::threshold(old);
}
