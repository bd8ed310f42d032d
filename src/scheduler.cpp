#include "log.hpp"
#include "scheduler.hpp"

bool su::detail::scheduler::context::is_ui_thread() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_ui_thread == std::this_thread::get_id();
}

void su::detail::scheduler::context::register_ui_thread() {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_ui_thread = std::this_thread::get_id();
}

void su::detail::scheduler::context::unregister_ui_thread() {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_ui_thread = std::thread::id();
}

su::state su::detail::scheduler::context::inject_event(su::event e) {
    return m_queue.put(std::move(e));
}

void su::detail::scheduler::context::wake_up() {
    {
        std::lock_guard<std::mutex> lk(m_mtx);

        // no loop to wake, or the caller is the loop itself
        if(m_ui_thread == std::thread::id() ||
           m_ui_thread == std::this_thread::get_id()) {
            return;
        }
    }

    if(inject_event(su::event::wake_up_marker()) != su::state::success) {
        su::log::debug(__func__, "event queue is closed");
    }
}

su::callback_handle su::scheduler::schedule(
        su::duration after,
        su::duration every,
        std::function<void()> f) {
    callback_handle h;

    if(!ctx()) {
        return h;
    }

    if(every < su::duration::zero()) {
        every = su::duration::zero();
    }

    auto hctx = std::make_shared<detail::callback_handle::context>(
        ctx(),
        std::move(f),
        every);
    hctx->m_self = hctx;
    h.ctx(hctx);
    h.reschedule(after);
    return h;
}
