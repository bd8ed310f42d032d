//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_CALLBACK_HANDLE__
#define __SIMPLE_UIKIT_CALLBACK_HANDLE__

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include "utility.hpp"
#include "context.hpp"

namespace su { // simple uikit
namespace detail {
namespace scheduler {

struct context;

}

namespace callback_handle {

struct context {
    context(std::weak_ptr<scheduler::context> sched,
            std::function<void()> f,
            su::duration interval) :
        m_sched(std::move(sched)),
        m_f(std::move(f)),
        m_interval(interval)
    { }

    bool reschedule(su::time_point at);
    void cancel();
    bool delay_next_call(su::duration by);

    // invoked by the main loop alarm
    void fire(std::size_t generation);

    bool called() const;
    std::size_t num_called() const;
    bool pending() const;
    su::duration time_left() const;

    // requires lock
    bool reschedule_locked(su::time_point at, std::shared_ptr<scheduler::context>& sched);
    bool cancel_locked(std::shared_ptr<scheduler::context>& sched);

    std::weak_ptr<context> m_self;
    std::weak_ptr<scheduler::context> m_sched;
    std::function<void()> m_f;
    const su::duration m_interval;

    mutable std::mutex m_mtx;
    std::size_t m_num_called = 0;
    std::size_t m_token = 0; // main loop alarm, 0 when nothing is pending
    std::size_t m_generation = 0; // bumped whenever the pending alarm changes
    su::time_point m_next_call_at;
    bool m_in_call = false;
    bool m_cancelled_in_call = false;
};

}
}

struct scheduler;

/**
 * @brief handle to a callback scheduled on the UI thread
 *
 * Returned by the scheduling operations of `su::scheduler` and
 * `su::application`. A handle has at most one pending call at any time:
 * rescheduling always cancels the previous pending call first.
 *
 * A recurring callback (nonzero `interval()`) is rescheduled automatically to
 * the time its call started plus the interval, even if the callback throws.
 * Calling `cancel()` from inside the callback prevents that.
 *
 * Callbacks are always called on the UI thread by the main loop, never
 * synchronously by the scheduling call. All methods are threadsafe.
 */
struct callback_handle : public su::shared_context<callback_handle, detail::callback_handle::context> {
    inline virtual ~callback_handle() { }

    /**
     * @brief schedule the next call after a delay, replacing any pending call
     *
     * @param after delay from now, negative values are treated as zero
     * @return `true` on success, `false` if unallocated or the scheduler is gone
     */
    inline bool reschedule(su::duration after) {
        if(after < su::duration::zero()) {
            after = su::duration::zero();
        }

        return ctx() ? ctx()->reschedule(su::clock::now() + after) : false;
    }

    /**
     * @brief schedule the next call at an absolute time, replacing any pending call
     *
     * @param to point in time on any clock, times in the past are treated as now
     * @return `true` on success, `false` if unallocated or the scheduler is gone
     */
    template <typename CLOCK, typename DURATION>
    bool reschedule(const std::chrono::time_point<CLOCK,DURATION>& to) {
        return ctx() ? ctx()->reschedule(detail::to_library_time(to)) : false;
    }

    /**
     * @brief schedule the next call for the next main loop iteration
     * @return `true` on success, else `false`
     */
    inline bool reschedule_now() {
        return reschedule(su::duration::zero());
    }

    /**
     * @brief unschedule any pending call
     *
     * No-op if nothing is pending.
     */
    inline void cancel() {
        if(ctx()) {
            ctx()->cancel();
        }
    }

    /**
     * @brief postpone the pending call
     *
     * @param by amount to add to the pending call time
     * @return `true` if the call was postponed, `false` if nothing is pending or a one-shot callback already ran
     */
    inline bool delay_next_call(su::duration by) {
        return ctx() ? ctx()->delay_next_call(by) : false;
    }

    /**
     * @return `true` if the callback ran at least once, else `false`
     */
    inline bool called() const {
        return ctx() ? ctx()->called() : false;
    }

    /**
     * @return how many times the callback ran so far
     */
    inline std::size_t num_called() const {
        return ctx() ? ctx()->num_called() : 0;
    }

    /**
     * @return the delay between calls of a recurring callback, zero for one-shot callbacks
     */
    inline su::duration interval() const {
        return ctx() ? ctx()->m_interval : su::duration::zero();
    }

    /**
     * @return `true` if a call is scheduled, else `false`
     */
    inline bool pending() const {
        return ctx() ? ctx()->pending() : false;
    }

    /**
     * @return seconds left until the pending call, `0.0` if nothing is pending
     */
    inline double seconds_left() const {
        return ctx() ?
            std::chrono::duration<double>(ctx()->time_left()).count() :
            0.0;
    }

private:
    friend struct su::scheduler;
};

}

#endif
