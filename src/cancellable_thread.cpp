#include <exception>

#include "log.hpp"
#include "cancellable_thread.hpp"

bool su::detail::cancellable_thread::shared_state::request_stop() {
    if(m_stop.exchange(true)) {
        return false;
    }

    // a terminated thread stays terminated
    int expected = status::running;
    if(!m_status.compare_exchange_strong(expected, status::stop_requested)) {
        expected = status::created;
        m_status.compare_exchange_strong(expected, status::stop_requested);
    }

    return true;
}

std::weak_ptr<su::detail::cancellable_thread::shared_state>&
su::detail::cancellable_thread::context::tl_state() {
    thread_local std::weak_ptr<shared_state> wp;
    return wp;
}

su::detail::cancellable_thread::context::~context() {
    request_stop();

    if(m_thread.joinable()) {
        if(m_daemon || m_thread.get_id() == std::this_thread::get_id()) {
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
}

bool su::detail::cancellable_thread::context::start() {
    std::lock_guard<std::mutex> lk(m_mtx);

    if(m_thread.joinable() || !m_f) {
        return false;
    }

    // the running thread only ever touches the shared state, never this context
    std::shared_ptr<shared_state> st = m_state;
    std::function<void()> f = std::move(m_f);
    m_f = nullptr;

    int expected = status::created;
    st->m_status.compare_exchange_strong(expected, status::running);

    m_thread = std::thread([st, f]{
        tl_state() = st;

        try {
            f();
        } catch(const std::exception& e) {
            su::log::error("cancellable_thread", "thread body raised: ", e.what());
        } catch(...) {
            su::log::error("cancellable_thread", "thread body raised a non standard exception");
        }

        st->m_status.store(status::terminated);
        tl_state().reset();
    });

    return true;
}

void su::detail::cancellable_thread::context::request_stop() {
    if(m_state->request_stop()) {
        std::function<void()> hook;

        {
            std::lock_guard<std::mutex> lk(m_state->m_mtx);
            hook = m_state->m_stop_hook;
        }

        // call outside of lock
        if(hook) {
            hook();
        }
    }
}

bool su::detail::cancellable_thread::context::join() {
    std::thread th;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(!m_thread.joinable() || m_thread.get_id() == std::this_thread::get_id()) {
            return false;
        }

        th = std::move(m_thread);
    }

    // join outside of lock
    th.join();
    return true;
}

bool su::detail::cancellable_thread::context::joinable() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_thread.joinable();
}

bool su::this_thread::is_stop_requested() {
    auto st = su::detail::cancellable_thread::context::tl_state().lock();
    return st ? st->m_stop.load() : false;
}
