//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_CANCELLABLE_THREAD__
#define __SIMPLE_UIKIT_CANCELLABLE_THREAD__

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "utility.hpp"
#include "context.hpp"

namespace su { // simple uikit
namespace detail {
namespace cancellable_thread {

enum status {
    created = 0,
    running,
    stop_requested,
    terminated
};

// state shared between the owning handles and the running system thread
struct shared_state {
    shared_state() : m_status(status::created), m_stop(false) { }

    // returns true the first time it is called
    bool request_stop();

    std::atomic<int> m_status;
    std::atomic<bool> m_stop;
    std::mutex m_mtx;
    std::function<void()> m_stop_hook;
};

struct context {
    context(std::function<void()> f) :
        m_state(std::make_shared<shared_state>()),
        m_daemon(false),
        m_f(std::move(f))
    { }

    ~context();

    bool start();
    void request_stop();
    bool join();
    bool joinable() const;

    inline std::thread::id get_id() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_thread.get_id();
    }

    // the calling thread's stop state, if it was launched by this library
    static std::weak_ptr<shared_state>& tl_state();

    std::shared_ptr<shared_state> m_state;
    bool m_daemon;
    std::function<void()> m_f;
    mutable std::mutex m_mtx;
    std::thread m_thread;
};

}
}

/**
 * @brief system thread which can be asked to stop
 *
 * Cancellation is cooperative: `request_stop()` only raises a flag. The body
 * of the thread is expected to check `su::this_thread::is_stop_requested()`
 * at safe points and return when it becomes `true`. Blocking work in progress
 * is never interrupted.
 *
 * Lifecycle:
 * created -> running -> stop_requested -> terminated
 *
 * When the last copy of an allocated `su::cancellable_thread` goes out of
 * scope the thread is asked to stop and then joined, or detached if it was
 * marked as a daemon.
 */
struct cancellable_thread : public su::shared_context<cancellable_thread, detail::cancellable_thread::context> {
    typedef detail::cancellable_thread::status status;

    inline virtual ~cancellable_thread() { }

    /**
     * @brief construct an unstarted thread
     *
     * @param f any Callable
     * @param as optional arguments for f, copied into the thread
     * @return the allocated thread in state `created`
     */
    template <typename F, typename... As>
    static cancellable_thread make(F&& f, As&&... as) {
        cancellable_thread th;
        th.ctx(std::make_shared<detail::cancellable_thread::context>(
            std::bind(std::forward<F>(f), std::forward<As>(as)...)));
        return th;
    }

    /**
     * @brief launch the system thread
     * @return `true` if the thread was launched, `false` if unallocated or already started
     */
    inline bool start() {
        return ctx() ? ctx()->start() : false;
    }

    /**
     * @brief ask the thread to stop as soon as possible
     *
     * Idempotent. The first call runs the stop hook, if any.
     */
    inline void request_stop() {
        if(ctx()) {
            ctx()->request_stop();
        }
    }

    /**
     * @return `true` if `request_stop()` was called, else `false`
     */
    inline bool is_stop_requested() const {
        return ctx() ? ctx()->m_state->m_stop.load() : false;
    }

    /**
     * @return the current lifecycle state
     */
    inline status state() const {
        return ctx() ?
            static_cast<status>(ctx()->m_state->m_status.load()) :
            status::terminated;
    }

    /**
     * @brief install a Callable to run when a stop is first requested
     *
     * Owners use this to unblock a thread which may be waiting on a resource,
     * for example by sending it a sentinel value. Must be called before
     * `start()`. The hook runs in the thread calling `request_stop()`.
     *
     * @param f any Callable taking no arguments
     */
    inline void on_stop_requested(std::function<void()> f) {
        if(ctx()) {
            std::lock_guard<std::mutex> lk(ctx()->m_state->m_mtx);
            ctx()->m_state->m_stop_hook = std::move(f);
        }
    }

    /**
     * @brief mark whether the thread should be detached instead of joined on destruction
     */
    inline void daemon(bool value) {
        if(ctx()) {
            std::lock_guard<std::mutex> lk(ctx()->m_mtx);
            ctx()->m_daemon = value;
        }
    }

    /**
     * @return `true` if the thread is detached on destruction, else `false`
     */
    inline bool daemon() const {
        if(ctx()) {
            std::lock_guard<std::mutex> lk(ctx()->m_mtx);
            return ctx()->m_daemon;
        } else {
            return false;
        }
    }

    /**
     * @brief block until the thread terminates
     * @return `true` if the thread was joined, else `false` (never started, already joined, or called from the thread itself)
     */
    inline bool join() {
        return ctx() ? ctx()->join() : false;
    }

    /**
     * @return `true` if `join()` would block on a started thread, else `false`
     */
    inline bool joinable() const {
        return ctx() ? ctx()->joinable() : false;
    }

    /**
     * @return the system thread id, default constructed if not running
     */
    inline std::thread::id get_id() const {
        return ctx() ? ctx()->get_id() : std::thread::id();
    }
};

namespace this_thread {

/**
 * @brief check the stop flag of the calling thread
 *
 * @return `true` if the calling thread is an `su::cancellable_thread` and a stop was requested, else `false`
 */
bool is_stop_requested();

}

}

#endif
