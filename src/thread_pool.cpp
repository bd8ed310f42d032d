#include <thread>

#include "log.hpp"
#include "thread_pool.hpp"

namespace {

// handler exceptions must never escape into a worker thread
template <typename F>
void guarded_call(const char* tag, F&& f) {
    try {
        f();
    } catch(const std::exception& e) {
        su::log::error(tag, "job handler raised: ", e.what());
    } catch(...) {
        su::log::error(tag, "job handler raised a non standard exception");
    }
}

}

void su::detail::job::context::execute() {
    su::data result;
    std::exception_ptr error;

    try {
        result = m_body();
    } catch(...) {
        // delivered to the error and termination handlers
        error = std::current_exception();
    }

    if(error) {
        su::log::debug(__func__, "job failed");
    }

    resolve(std::move(result), error);
}

bool su::detail::job::context::resolve(su::data result, std::exception_ptr error) {
    result_handler on_result;
    error_handler on_error;
    error_handler on_terminated;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_resolved) {
            su::log::error(__func__, "job cannot be resolved twice");
            return false;
        }

        m_resolved = true;
        m_result = std::move(result);
        m_error = error;
        on_result = m_on_result;
        on_error = m_on_error;
        on_terminated = m_on_terminated;
    }

    // the outcome is immutable from here on, call handlers outside of lock
    if(!m_error && on_result) {
        guarded_call("job::then", [&]{ on_result(m_result); });
    }

    if(m_error && on_error) {
        guarded_call("job::catch_", [&]{ on_error(m_error); });
    }

    if(on_terminated) {
        guarded_call("job::finally_", [&]{ on_terminated(m_error); });
    }

    return true;
}

bool su::detail::job::context::then(result_handler on_result) {
    bool call_now = false;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_on_result || !on_result) {
            return false;
        }

        m_on_result = on_result;
        call_now = m_resolved && !m_error;
    }

    if(call_now) {
        on_result(m_result);
    }

    return true;
}

bool su::detail::job::context::then(result_handler on_result, error_handler on_error) {
    bool call_result = false;
    bool call_error = false;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        // all or nothing
        if(m_on_result || m_on_error || !on_result || !on_error) {
            return false;
        }

        m_on_result = on_result;
        m_on_error = on_error;
        call_result = m_resolved && !m_error;
        call_error = m_resolved && m_error;
    }

    if(call_result) {
        on_result(m_result);
    } else if(call_error) {
        on_error(m_error);
    }

    return true;
}

bool su::detail::job::context::catch_(error_handler on_error) {
    bool call_now = false;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_on_error || !on_error) {
            return false;
        }

        m_on_error = on_error;
        call_now = m_resolved && m_error;
    }

    if(call_now) {
        on_error(m_error);
    }

    return true;
}

bool su::detail::job::context::finally_(error_handler on_terminated) {
    bool call_now = false;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_on_terminated || !on_terminated) {
            return false;
        }

        m_on_terminated = on_terminated;
        call_now = m_resolved;
    }

    if(call_now) {
        on_terminated(m_error);
    }

    return true;
}

bool su::detail::job::context::resolved() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_resolved;
}

bool su::detail::job::context::succeeded() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_resolved && !m_error;
}

bool su::detail::job::context::failed() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_resolved && m_error;
}

std::exception_ptr su::detail::job::context::error() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_error;
}

void su::detail::thread_pool::backlog::started(std::size_t count) {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_outstanding += count;
}

void su::detail::thread_pool::backlog::finished(std::size_t count) {
    bool idle = false;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_outstanding -= count;
        idle = m_outstanding == 0;
    }

    if(idle) {
        m_idle_cv.notify_all();
    }
}

std::size_t su::detail::thread_pool::backlog::outstanding() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_outstanding;
}

void su::detail::thread_pool::backlog::wait_idle() {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_idle_cv.wait(lk, [&]{ return m_outstanding == 0; });
}

su::detail::thread_pool::context::context(std::size_t count) :
    m_stopped(false)
{
    if(!count) {
        count = std::thread::hardware_concurrency() ?
            std::thread::hardware_concurrency() :
            1;
    }

    m_backlog = std::make_shared<backlog>(count);

    for(std::size_t i = 0; i < count; ++i) {
        auto worker = su::cancellable_thread::make(&context::worker_loop, m_backlog);

        // wake the worker if it is blocked waiting for a job
        su::channel<std::shared_ptr<job::context>> ch = m_backlog->m_ch;
        worker.on_stop_requested([ch]() mutable {
            ch.try_send(nullptr);
        });

        worker.daemon(true);
        worker.start();
        m_workers.push_back(worker);
    }

    su::log::debug(__func__, "launched ", count, " workers");
}

su::detail::thread_pool::context::~context() {
    stop();

    for(auto& worker : m_workers) {
        worker.join();
    }
}

su::state su::detail::thread_pool::context::submit(std::shared_ptr<job::context> j, bool block) {
    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_stopped) {
            return su::state::closed;
        }
    }

    // count before sending, a worker may finish the job before send() returns
    m_backlog->started(1);
    su::state st = m_backlog->m_ch.send(std::move(j), block);

    if(st != su::state::success) {
        m_backlog->finished(1);
    }

    return st;
}

void su::detail::thread_pool::context::stop() {
    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(m_stopped) {
            return;
        }

        m_stopped = true;
    }

    for(auto& worker : m_workers) {
        worker.request_stop();
    }

    // blocked submitters and idle workers are woken by the close
    m_backlog->m_ch.close(true);

    std::size_t discarded = 0;
    std::shared_ptr<job::context> j;

    while(m_backlog->m_ch.try_recv(j) == su::state::success) {
        if(j) {
            ++discarded;
        }
    }

    if(discarded) {
        su::log::debug(__func__, "discarded ", discarded, " queued jobs");
        m_backlog->finished(discarded);
    }
}

void su::detail::thread_pool::context::wait_for_completion() {
    m_backlog->wait_idle();
}

void su::detail::thread_pool::context::worker_loop(std::shared_ptr<backlog> b) {
    std::shared_ptr<job::context> j;

    while(!su::this_thread::is_stop_requested()) {
        if(!b->m_ch.recv(j)) {
            break; // closed
        }

        if(!j) {
            continue; // sentinel
        }

        j->execute();
        j.reset();
        b->finished(1);
    }
}
