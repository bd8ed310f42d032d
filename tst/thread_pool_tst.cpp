#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, thread_pool_result_handler) {
    auto pool = su::thread_pool::make(2);
    EXPECT_EQ(2u, pool.size());

    std::atomic<int> calls(0);
    std::atomic<int> value(0);

    auto job = pool.submit([]{
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return 42;
    });

    ASSERT_TRUE(job);
    EXPECT_TRUE(job.then([&](int& i){
        value = i;
        ++calls;
    }));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(sut::wait_until([&]{ return calls.load() > 0; }));
    EXPECT_EQ(1, calls.load());
    EXPECT_EQ(42, value.load());
    EXPECT_TRUE(job.succeeded());
    EXPECT_EQ(42, job.result());
}

TEST(simple_uikit, thread_pool_handlers_after_resolution_run_immediately) {
    auto pool = su::thread_pool::make(1);
    auto job = pool.submit([](int a, int b){ return a * b; }, 6, 7);
    pool.wait_for_completion();
    ASSERT_TRUE(job.resolved());

    std::thread::id caller = std::this_thread::get_id();
    std::thread::id handler_thread;
    int value = 0;
    bool terminated = false;

    EXPECT_TRUE(job.then([&](int& i){
        handler_thread = std::this_thread::get_id();
        value = i;
    }));

    // synchronous, in the registering thread
    EXPECT_EQ(42, value);
    EXPECT_EQ(caller, handler_thread);

    EXPECT_TRUE(job.finally_([&](std::exception_ptr e){ terminated = !e; }));
    EXPECT_TRUE(terminated);

    // the error handler is registered but never called for a success
    bool error_called = false;
    EXPECT_TRUE(job.catch_([&](std::exception_ptr){ error_called = true; }));
    EXPECT_FALSE(error_called);
}

TEST(simple_uikit, thread_pool_duplicate_handlers_rejected) {
    auto pool = su::thread_pool::make(1);
    auto job = pool.submit([]{ });

    int first = 0;
    int second = 0;

    EXPECT_TRUE(job.then([&]{ ++first; }));
    EXPECT_FALSE(job.then([&]{ ++second; }));
    EXPECT_TRUE(job.catch_([](std::exception_ptr){ }));
    EXPECT_FALSE(job.catch_([](std::exception_ptr){ }));
    EXPECT_TRUE(job.finally_([](std::exception_ptr){ }));
    EXPECT_FALSE(job.finally_([](std::exception_ptr){ }));

    pool.wait_for_completion();
    ASSERT_TRUE(sut::wait_until([&]{ return first == 1; }));
    EXPECT_EQ(0, second);

    su::job<int> unallocated;
    EXPECT_FALSE(unallocated.then([](int&){ }));
    EXPECT_FALSE(unallocated.resolved());
}

TEST(simple_uikit, thread_pool_paired_handlers_register_all_or_nothing) {
    auto pool = su::thread_pool::make(1);
    auto job = pool.submit([]() -> int {
        throw std::runtime_error("job failed");
    });
    pool.wait_for_completion();
    ASSERT_TRUE(job.failed());

    int first_errors = 0;
    int results = 0;
    int second_errors = 0;

    EXPECT_TRUE(job.catch_([&](std::exception_ptr){ ++first_errors; }));
    EXPECT_EQ(1, first_errors);

    // the error slot is taken, so the result handler must not be taken either
    EXPECT_FALSE(job.then(
        [&](int&){ ++results; },
        [&](std::exception_ptr){ ++second_errors; }));
    EXPECT_EQ(0, second_errors);

    auto job2 = pool.submit([]{ return 5; });
    pool.wait_for_completion();

    EXPECT_TRUE(job2.catch_([](std::exception_ptr){ }));
    EXPECT_FALSE(job2.then([&](int&){ ++results; }, [](std::exception_ptr){ }));
    EXPECT_EQ(0, results);

    // the result slot is still free
    EXPECT_TRUE(job2.then([&](int& v){ results = v; }));
    EXPECT_EQ(5, results);
}

TEST(simple_uikit, thread_pool_job_errors_reach_error_handlers_only) {
    auto pool = su::thread_pool::make(2);
    std::mutex mtx;
    std::string message;
    bool result_called = false;
    std::atomic<bool> finally_called(false);

    auto job = pool.submit([]() -> int {
        throw std::runtime_error("job failed");
    });

    job.then(
        [&](int&){ result_called = true; },
        [&](std::exception_ptr e){
            try {
                std::rethrow_exception(e);
            } catch(const std::runtime_error& ex) {
                std::lock_guard<std::mutex> lk(mtx);
                message = ex.what();
            }
        });

    job.finally_([&](std::exception_ptr e){ finally_called = (bool)e; });

    pool.wait_for_completion();
    ASSERT_TRUE(sut::wait_until([&]{ return finally_called.load(); }));
    EXPECT_TRUE(job.failed());
    EXPECT_TRUE((bool)job.error());
    EXPECT_FALSE(result_called);

    {
        std::lock_guard<std::mutex> lk(mtx);
        EXPECT_EQ(std::string("job failed"), message);
    }

    // the worker survived the failure
    auto job2 = pool.submit([]{ return std::string("still alive"); });
    pool.wait_for_completion();
    EXPECT_TRUE(job2.succeeded());
    EXPECT_EQ(std::string("still alive"), job2.result());
}

TEST(simple_uikit, thread_pool_handler_exceptions_do_not_kill_workers) {
    auto pool = su::thread_pool::make(1);
    std::atomic<bool> gate(false);

    auto job = pool.submit([&]{
        while(!gate) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    job.then([]{ throw std::runtime_error("handler failed"); });
    gate = true;
    pool.wait_for_completion();

    auto job2 = pool.submit([]{ return 1; });
    pool.wait_for_completion();
    EXPECT_TRUE(job2.succeeded());
}

TEST(simple_uikit, thread_pool_try_submit_capacity) {
    auto pool = su::thread_pool::make(2);
    std::atomic<bool> gate(false);
    std::atomic<int> started(0);

    auto blocker = [&]{
        ++started;
        while(!gate) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    };

    // occupy both workers
    EXPECT_TRUE(pool.try_submit(blocker));
    EXPECT_TRUE(pool.try_submit(blocker));
    ASSERT_TRUE(sut::wait_until([&]{ return started.load() == 2; }));

    // then fill the queue, whose capacity is the worker count
    EXPECT_TRUE(pool.try_submit(blocker));
    EXPECT_TRUE(pool.try_submit(blocker));

    // the next one is refused instead of silently dropped
    auto refused = pool.try_submit(blocker);
    EXPECT_FALSE(refused);

    gate = true;
    pool.wait_for_completion();
    EXPECT_EQ(4, started.load());
}

TEST(simple_uikit, thread_pool_every_job_runs_exactly_once) {
    auto pool = su::thread_pool::make(4);
    std::atomic<int> runs(0);
    std::vector<su::job<int>> jobs;

    for(int i = 0; i < 100; ++i) {
        jobs.push_back(pool.submit([&runs](int n){ ++runs; return n; }, i));
    }

    pool.wait_for_completion();
    EXPECT_EQ(100, runs.load());

    for(int i = 0; i < 100; ++i) {
        ASSERT_TRUE(jobs[i].succeeded());
        EXPECT_EQ(i, jobs[i].result());
    }
}

TEST(simple_uikit, thread_pool_stop) {
    auto pool = su::thread_pool::make(2);
    auto job = pool.submit([]{ return 1; });
    pool.wait_for_completion();

    pool.stop();
    pool.stop();

    EXPECT_FALSE(pool.submit([]{ return 2; }));
    EXPECT_FALSE(pool.try_submit([]{ return 2; }));
    EXPECT_TRUE(job.succeeded());

    // returns immediately, nothing is outstanding
    pool.wait_for_completion();
}

TEST(simple_uikit, thread_pool_concurrent_waiters_all_return) {
    auto pool = su::thread_pool::make(2);
    std::atomic<int> runs(0);

    for(int i = 0; i < 20; ++i) {
        pool.submit([&runs]{
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++runs;
            return 0;
        });
    }

    std::atomic<int> returned(0);
    std::vector<std::thread> waiters;

    for(int i = 0; i < 4; ++i) {
        waiters.emplace_back([&]{
            pool.wait_for_completion();
            EXPECT_EQ(20, runs.load());
            ++returned;
        });
    }

    for(auto& th : waiters) {
        th.join();
    }

    EXPECT_EQ(4, returned.load());
}
