//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_SCHEDULER__
#define __SIMPLE_UIKIT_SCHEDULER__

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "utility.hpp"
#include "context.hpp"
#include "event.hpp"
#include "main_loop.hpp"
#include "selectable_queue.hpp"
#include "callback_handle.hpp"

// test fixture reading the scheduler context (tst/application_tst.cpp)
class simple_uikit_application_released_with_pending_quit_Test;

namespace su { // simple uikit
namespace detail {
namespace scheduler {

struct context {
    context() { }

    bool is_ui_thread() const;
    void register_ui_thread();
    void unregister_ui_thread();
    su::state inject_event(su::event e);
    void wake_up();

    std::weak_ptr<context> m_self;
    su::main_loop m_loop;
    su::selectable_queue<su::event> m_queue;

    mutable std::mutex m_mtx;
    std::thread::id m_ui_thread; // default constructed when no loop runs
};

}
}

/**
 * @brief cross thread entry point to a main loop
 *
 * Owns an `su::main_loop` and the `su::selectable_queue` of events consumed
 * by it, and knows which system thread runs that loop (the UI thread).
 *
 * Every scheduling operation may be called from any thread. Callbacks always
 * run later on the UI thread. When the caller is not the UI thread a wake up
 * marker is injected into the event queue so that a main loop blocked in
 * `poll()` notices the new alarm.
 *
 * Scheduling operations bind optional arguments by copy, in the manner of
 * `std::bind`.
 */
struct scheduler : public su::shared_context<scheduler, detail::scheduler::context> {
    inline virtual ~scheduler() { }

    /**
     * @return an allocated scheduler with an empty main loop and event queue
     */
    static inline scheduler make() {
        scheduler s;
        s.ctx(std::make_shared<detail::scheduler::context>());
        s.ctx()->m_self = s.ctx();
        return s;
    }

    /**
     * @brief schedule a one-shot or recurring callback
     *
     * @param after delay before the first call, negative values are treated as zero
     * @param every delay between calls, zero for a one-shot callback
     * @param f Callable taking no arguments
     * @return the handle of the scheduled callback
     */
    callback_handle schedule(su::duration after, su::duration every, std::function<void()> f);

    /**
     * @brief call a Callable once on the UI thread after a delay
     *
     * @param after delay before the call
     * @param f any Callable
     * @param as optional arguments for f
     * @return the handle of the scheduled callback
     */
    template <typename F, typename... As>
    callback_handle call_later(su::duration after, F&& f, As&&... as) {
        return schedule(
            after,
            su::duration::zero(),
            std::bind(std::forward<F>(f), std::forward<As>(as)...));
    }

    /**
     * @brief call a Callable once on the UI thread at an absolute time
     *
     * @param at point in time on any clock
     * @param f any Callable
     * @param as optional arguments for f
     * @return the handle of the scheduled callback
     */
    template <typename CLOCK, typename DURATION, typename F, typename... As>
    callback_handle call_at(const std::chrono::time_point<CLOCK,DURATION>& at, F&& f, As&&... as) {
        return schedule(
            detail::to_library_time(at) - su::clock::now(),
            su::duration::zero(),
            std::bind(std::forward<F>(f), std::forward<As>(as)...));
    }

    /**
     * @brief call a Callable on the UI thread now and then every interval until cancelled
     *
     * @param every delay between calls
     * @param f any Callable
     * @param as optional arguments for f
     * @return the handle of the scheduled callback
     */
    template <typename F, typename... As>
    callback_handle call_every(su::duration every, F&& f, As&&... as) {
        return schedule(
            su::duration::zero(),
            every,
            std::bind(std::forward<F>(f), std::forward<As>(as)...));
    }

    /**
     * @brief call a Callable on the UI thread as soon as possible
     *
     * The call is always deferred to the next main loop iteration, even when
     * made from the UI thread.
     *
     * @return the handle of the scheduled callback
     */
    template <typename F, typename... As>
    callback_handle call_on_ui_thread(F&& f, As&&... as) {
        return call_later(su::duration::zero(), std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief push an event to the UI thread
     * @return `su::state::success`, or `su::state::closed` if the event queue was closed
     */
    inline su::state inject_event(su::event e) {
        return ctx() ? ctx()->inject_event(std::move(e)) : su::state::closed;
    }

    /**
     * @brief ask the UI thread to redraw
     * @return the result of injecting the refresh marker
     */
    inline su::state refresh() {
        return inject_event(su::event::refresh_marker());
    }

    /**
     * @brief interrupt a main loop waiting in `poll()`
     *
     * Injects a wake up marker only when a UI thread is registered and the
     * caller is another thread.
     */
    inline void wake_up() {
        if(ctx()) {
            ctx()->wake_up();
        }
    }

    /**
     * @return `true` if the calling thread is the registered UI thread, else `false`
     */
    inline bool is_ui_thread() const {
        return ctx() ? ctx()->is_ui_thread() : false;
    }

    /**
     * @brief record the calling thread as the UI thread
     */
    inline void register_ui_thread() {
        if(ctx()) {
            ctx()->register_ui_thread();
        }
    }

    /**
     * @brief forget the UI thread, wake ups are not injected anymore
     */
    inline void unregister_ui_thread() {
        if(ctx()) {
            ctx()->unregister_ui_thread();
        }
    }

    /**
     * @return the owned main loop
     */
    inline su::main_loop& loop() {
        return ctx()->m_loop;
    }

    /**
     * @return the owned event queue
     */
    inline su::selectable_queue<su::event>& queue() {
        return ctx()->m_queue;
    }

    friend struct application;
    friend class ::simple_uikit_application_released_with_pending_quit_Test;
};

}

#endif
