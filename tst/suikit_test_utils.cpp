#include <mutex>
#include "suikit_test_utils.hpp"

std::unique_lock<std::mutex> sut::detail::log_lock() {
    static std::mutex mtx;
    return std::unique_lock<std::mutex>(mtx);
}

bool sut::wait_until(std::function<bool()> cond, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while(!cond()) {
        if(std::chrono::steady_clock::now() >= deadline) {
            return cond();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return true;
}

int sut::run_loop(su::scheduler sched, std::chrono::milliseconds limit) {
    su::main_loop& loop = sched.loop();
    sched.register_ui_thread();

    su::selectable_queue<su::event>& queue = sched.queue();
    std::size_t watch = loop.watch_file(queue.fd(), [&queue]{
        queue.get_all();
    });

    std::size_t safety = loop.set_alarm_in(limit, [&loop]{
        sut::log("run_loop", "time limit reached");
        loop.quit(-1);
    });

    int code = loop.run();

    loop.remove_alarm(safety);
    loop.remove_watch_file(watch);
    sched.unregister_ui_thread();
    return code;
}
