#include "log.hpp"
#include "scheduler.hpp"
#include "callback_handle.hpp"

bool su::detail::callback_handle::context::reschedule_locked(
        su::time_point at,
        std::shared_ptr<scheduler::context>& sched) {
    cancel_locked(sched);

    su::time_point now = su::clock::now();

    if(at < now) {
        at = now;
    }

    // the main loop keeps the handle alive until the alarm fires or is removed
    std::shared_ptr<context> self = m_self.lock();
    std::size_t generation = ++m_generation;

    m_next_call_at = at;
    m_token = sched->m_loop.set_alarm_at(at, [self, generation]{
        self->fire(generation);
    });

    return true;
}

bool su::detail::callback_handle::context::cancel_locked(std::shared_ptr<scheduler::context>& sched) {
    if(m_in_call) {
        m_cancelled_in_call = true;
    }

    if(!m_token) {
        return false;
    }

    sched->m_loop.remove_alarm(m_token);
    m_token = 0;
    ++m_generation;
    return true;
}

bool su::detail::callback_handle::context::reschedule(su::time_point at) {
    auto sched = m_sched.lock();

    if(!sched) {
        su::log::warning(__func__, "scheduler no longer exists");
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        reschedule_locked(at, sched);
        m_cancelled_in_call = false;
    }

    sched->wake_up();
    return true;
}

void su::detail::callback_handle::context::cancel() {
    auto sched = m_sched.lock();

    if(!sched) {
        return;
    }

    bool removed;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        removed = cancel_locked(sched);
    }

    if(removed) {
        sched->wake_up();
    }
}

bool su::detail::callback_handle::context::delay_next_call(su::duration by) {
    auto sched = m_sched.lock();

    if(!sched) {
        su::log::warning(__func__, "scheduler no longer exists");
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(!m_token) {
            return false;
        } else if(m_interval == su::duration::zero() && m_num_called) {
            return false;
        }

        reschedule_locked(m_next_call_at + by, sched);
    }

    sched->wake_up();
    return true;
}

void su::detail::callback_handle::context::fire(std::size_t generation) {
    su::time_point started;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        // cancelled or rescheduled after the main loop popped the alarm
        if(generation != m_generation || !m_token) {
            return;
        }

        ++m_num_called;
        m_token = 0;
        m_in_call = true;
        m_cancelled_in_call = false;
        started = su::clock::now();
    }

    // requeue a recurring callback unless it was cancelled or rescheduled meanwhile
    auto requeue = [&]{
        auto sched = m_sched.lock();
        std::lock_guard<std::mutex> lk(m_mtx);
        m_in_call = false;

        if(sched &&
           m_interval > su::duration::zero() &&
           !m_cancelled_in_call &&
           !m_token) {
            reschedule_locked(started + m_interval, sched);
        }
    };

    try {
        m_f();
    } catch(...) {
        requeue();
        throw;
    }

    requeue();
}

bool su::detail::callback_handle::context::called() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_num_called > 0;
}

std::size_t su::detail::callback_handle::context::num_called() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_num_called;
}

bool su::detail::callback_handle::context::pending() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_token != 0;
}

su::duration su::detail::callback_handle::context::time_left() const {
    std::lock_guard<std::mutex> lk(m_mtx);

    if(!m_token) {
        return su::duration::zero();
    }

    su::duration left = m_next_call_at - su::clock::now();
    return left > su::duration::zero() ? left : su::duration::zero();
}
