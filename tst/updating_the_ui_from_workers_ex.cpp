#include <gtest/gtest.h>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include "simple_uikit.hpp"

enum op {
    progress,
    done
};

struct downloader : public su::application {
    int m_progress = 0;
    std::string m_status;

protected:
    void process_event(su::event& e) {
        switch(e.id()) {
            case op::progress:
                e.data().copy_to(m_progress);
                std::cout << "progress: " << m_progress << "%" << std::endl;
                break;
            case op::done:
                e.data().copy_to(m_status);
                quit();
                break;
        }
    }

    void redraw() {
        // a real application would repaint its widgets here
    }
};

static void download(su::worker_context& ctx, int chunks) {
    for(int i = 1; i <= chunks && !ctx.is_stop_requested(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ctx.inject_event(su::event::make(op::progress, i * 100 / chunks));
    }

    ctx.inject_event(su::event::make(op::done, std::string("download complete")));
}

TEST(example, updating_the_ui_from_workers) {
    downloader app;

    // the worker receives a su::worker_context because download() asks for one
    auto worker = app.create_worker(download, 4);
    worker.start();

    EXPECT_EQ(0, app.run());
    worker.join();

    EXPECT_EQ(100, app.m_progress);
    EXPECT_EQ(std::string("download complete"), app.m_status);
}

TEST(example, offloading_work_to_a_thread_pool) {
    su::application app;
    auto pool = app.create_thread_pool();
    std::string answer;

    auto job = pool.submit([](int a, int b) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::to_string(a * b);
    }, 6, 7);

    // handlers run on a worker thread, hop back to the UI thread to use the result
    job.then(
        [&](std::string& s) {
            std::string copy = s;
            app.call_on_ui_thread([&app, &answer, copy]{
                answer = copy;
                app.quit();
            });
        },
        [&](std::exception_ptr) {
            app.quit(1);
        });

    EXPECT_EQ(0, app.run());
    EXPECT_EQ(std::string("42"), answer);
}
