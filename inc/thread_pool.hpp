//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_THREAD_POOL__
#define __SIMPLE_UIKIT_THREAD_POOL__

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <type_traits>
#include <utility>
#include <vector>

#include "utility.hpp"
#include "context.hpp"
#include "data.hpp"
#include "channel.hpp"
#include "cancellable_thread.hpp"

namespace su { // simple uikit
namespace detail {
namespace job {

typedef std::function<void(su::data&)> result_handler;
typedef std::function<void(std::exception_ptr)> error_handler;

struct context {
    template <typename F, typename... As>
    context(F&& f, As&&... as) {
        using isv = typename std::is_void<detail::function_return_type<F,As...>>;
        m_body = create_function(
                std::integral_constant<bool,isv::value>(),
                std::forward<F>(f),
                std::forward<As>(as)...);
    }

    // handle case where Callable returns void
    template <typename F, typename... As>
    std::function<su::data()>
    create_function(std::true_type, F&& f, As&&... as) {
        auto bound = std::bind(std::forward<F>(f), std::forward<As>(as)...);
        return [=]() mutable -> su::data {
            bound();
            return su::data();
        };
    }

    // handle case where Callable returns some value
    template <typename F, typename... As>
    std::function<su::data()>
    create_function(std::false_type, F&& f, As&&... as) {
        typedef detail::base<detail::function_return_type<F,As...>> R;
        auto bound = std::bind(std::forward<F>(f), std::forward<As>(as)...);
        return [=]() mutable -> su::data {
            return su::data::make<R>(bound());
        };
    }

    // run the job body in the calling thread and resolve with its outcome
    void execute();

    // set the outcome, returns false if already resolved
    bool resolve(su::data result, std::exception_ptr error);

    bool then(result_handler on_result);
    bool then(result_handler on_result, error_handler on_error);
    bool catch_(error_handler on_error);
    bool finally_(error_handler on_terminated);

    bool resolved() const;
    bool succeeded() const;
    bool failed() const;
    std::exception_ptr error() const;

    std::function<su::data()> m_body;

    mutable std::mutex m_mtx;
    bool m_resolved = false;
    su::data m_result;
    std::exception_ptr m_error;

    result_handler m_on_result;
    error_handler m_on_error;
    error_handler m_on_terminated;
};

}

namespace thread_pool {

// the job queue and completion bookkeeping shared with worker threads
struct backlog {
    backlog(std::size_t capacity) :
        m_ch(su::channel<std::shared_ptr<job::context>>::make(capacity)),
        m_outstanding(0)
    { }

    void started(std::size_t count);
    void finished(std::size_t count);
    std::size_t outstanding() const;

    // block until no job is queued or running
    void wait_idle();

    su::channel<std::shared_ptr<job::context>> m_ch;
    mutable std::mutex m_mtx;
    std::condition_variable m_idle_cv;
    std::size_t m_outstanding;
};

struct context {
    context(std::size_t count);
    ~context();

    su::state submit(std::shared_ptr<job::context> j, bool block);
    void stop();
    void wait_for_completion();

    inline std::size_t size() const {
        return m_workers.size();
    }

    static void worker_loop(std::shared_ptr<backlog> b);

    std::shared_ptr<backlog> m_backlog;
    std::mutex m_mtx;
    bool m_stopped;
    std::vector<su::cancellable_thread> m_workers;
};

}
}

struct thread_pool;

/**
 * @brief handle to a unit of work submitted to an `su::thread_pool`
 *
 * A job is resolved exactly once, either with the value returned by its
 * function or with the exception it threw. Handlers can be registered before
 * or after resolution:
 * - registered before: called by the worker thread that executed the job
 * - registered after: called immediately and synchronously in the registering thread
 *
 * Each handler slot accepts a single handler. Exceptions thrown by a handler
 * running on a worker thread are logged and never reach the worker.
 *
 * R: the return type of the job's function, which may be `void`
 */
template <typename R>
struct job : public su::shared_context<job<R>, detail::job::context> {
    inline virtual ~job() { }

    /**
     * @brief register handlers for the outcome of the job
     *
     * @param on_result Callable invoked with an `R&` (or no argument if `R` is `void`) on success
     * @return `true` if the handler was registered, `false` if unallocated or a result handler already exists
     */
    template <typename F>
    bool then(F&& on_result) {
        return this->ctx() ?
            this->ctx()->then(wrap(std::is_void<R>(), std::forward<F>(on_result))) :
            false;
    }

    /**
     * @brief register handlers for the outcome of the job
     *
     * @param on_result Callable invoked with an `R&` (or no argument if `R` is `void`) on success
     * @param on_error Callable invoked with a `std::exception_ptr` on failure
     * @return `true` if both handlers were registered, `false` if unallocated or either handler already exists, in which case neither is registered
     */
    template <typename F, typename E>
    bool then(F&& on_result, E&& on_error) {
        return this->ctx() ?
            this->ctx()->then(
                wrap(std::is_void<R>(), std::forward<F>(on_result)),
                detail::job::error_handler(std::forward<E>(on_error))) :
            false;
    }

    /**
     * @brief register a handler for a failed job
     *
     * @param on_error Callable invoked with a `std::exception_ptr` on failure
     * @return `true` if the handler was registered, `false` if unallocated or an error handler already exists
     */
    template <typename E>
    bool catch_(E&& on_error) {
        return this->ctx() ?
            this->ctx()->catch_(detail::job::error_handler(std::forward<E>(on_error))) :
            false;
    }

    /**
     * @brief register a handler called whatever the outcome
     *
     * @param on_terminated Callable invoked with a `std::exception_ptr`, null on success
     * @return `true` if the handler was registered, `false` if unallocated or a termination handler already exists
     */
    template <typename E>
    bool finally_(E&& on_terminated) {
        return this->ctx() ?
            this->ctx()->finally_(detail::job::error_handler(std::forward<E>(on_terminated))) :
            false;
    }

    /**
     * @return `true` if the job has an outcome, else `false`
     */
    inline bool resolved() const {
        return this->ctx() ? this->ctx()->resolved() : false;
    }

    /**
     * @return `true` if the job returned normally, else `false`
     */
    inline bool succeeded() const {
        return this->ctx() ? this->ctx()->succeeded() : false;
    }

    /**
     * @return `true` if the job threw, else `false`
     */
    inline bool failed() const {
        return this->ctx() ? this->ctx()->failed() : false;
    }

    /**
     * @brief access the value returned by the job
     *
     * Only valid when `succeeded()` is `true`.
     */
    template <typename T=R>
    typename std::enable_if<!std::is_void<T>::value, T&>::type
    result() {
        return this->ctx()->m_result.template cast_to<T>();
    }

    /**
     * @return the exception thrown by the job, null if none
     */
    inline std::exception_ptr error() const {
        return this->ctx() ? this->ctx()->error() : std::exception_ptr();
    }

private:
    // handle case where the job returns void
    template <typename F>
    static detail::job::result_handler wrap(std::true_type, F&& f) {
        return [=](su::data&) mutable { f(); };
    }

    // handle case where the job returns some value
    template <typename F>
    static detail::job::result_handler wrap(std::false_type, F&& f) {
        return [=](su::data& d) mutable { f(d.cast_to<R>()); };
    }

    friend struct su::thread_pool;
};

/**
 * @brief a fixed set of worker threads executing submitted jobs
 *
 * All workers share a single bounded job queue whose capacity equals the
 * worker count, so `submit()` blocks once every worker is busy and the queue
 * is full. Exactly one worker executes a given job.
 *
 * When the last copy of an allocated pool goes out of scope, the pool is
 * stopped and all workers are joined.
 */
struct thread_pool : public su::shared_context<thread_pool, detail::thread_pool::context> {
    inline virtual ~thread_pool() { }

    /**
     * @brief launch a pool of worker threads
     * @param count the number of worker threads. If this value is 0, the hardware concurrency is used. A minimum of 1 thread will be launched
     * @return the allocated pool
     */
    static inline thread_pool make(std::size_t count=5) {
        thread_pool p;
        p.ctx(std::make_shared<detail::thread_pool::context>(count));
        return p;
    }

    /**
     * @brief submit a Callable for execution on a worker thread
     *
     * Blocks while the job queue is full.
     *
     * @param f any Callable
     * @param as optional arguments for f, copied into the job
     * @return the submitted job, unallocated if the pool is stopped
     */
    template <typename F, typename... As>
    job<detail::function_return_type<F,As...>> submit(F&& f, As&&... as) {
        return enqueue(true, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief submit a Callable for execution on a worker thread without blocking
     *
     * @param f any Callable
     * @param as optional arguments for f, copied into the job
     * @return the submitted job, unallocated if the queue is full or the pool is stopped
     */
    template <typename F, typename... As>
    job<detail::function_return_type<F,As...>> try_submit(F&& f, As&&... as) {
        return enqueue(false, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief ask all workers to stop
     *
     * Workers finish the job they are executing. Jobs still queued are
     * discarded unresolved. Idempotent.
     */
    inline void stop() {
        if(ctx()) {
            ctx()->stop();
        }
    }

    /**
     * @brief block until every submitted job has executed or was discarded by `stop()`
     */
    inline void wait_for_completion() {
        if(ctx()) {
            ctx()->wait_for_completion();
        }
    }

    /**
     * @return count of worker threads
     */
    inline std::size_t size() const {
        return ctx() ? ctx()->size() : 0;
    }

private:
    template <typename F, typename... As>
    job<detail::function_return_type<F,As...>> enqueue(bool block, F&& f, As&&... as) {
        job<detail::function_return_type<F,As...>> j;

        if(ctx()) {
            auto jctx = std::make_shared<detail::job::context>(
                std::forward<F>(f),
                std::forward<As>(as)...);

            if(ctx()->submit(jctx, block) == su::state::success) {
                j.ctx(std::move(jctx));
            }
        }

        return j;
    }
};

}

#endif
