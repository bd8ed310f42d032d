//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_APPLICATION__
#define __SIMPLE_UIKIT_APPLICATION__

#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>

#include "utility.hpp"
#include "config.hpp"
#include "event.hpp"
#include "scheduler.hpp"
#include "callback_handle.hpp"
#include "cancellable_thread.hpp"
#include "thread_pool.hpp"

namespace su { // simple uikit

/**
 * @brief the view a worker thread has of its application
 *
 * Functions passed to `su::application::create_worker()` or
 * `su::application::create_daemon()` which can be invoked with a leading
 * `su::worker_context&` argument receive one. It only exposes operations which
 * are safe to call from any thread.
 */
struct worker_context {
    worker_context(su::scheduler sched) : m_sched(std::move(sched)) { }

    /**
     * @brief call a Callable on the UI thread as soon as possible
     * @return the handle of the scheduled callback
     */
    template <typename F, typename... As>
    callback_handle call(F&& f, As&&... as) {
        return m_sched.call_on_ui_thread(std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief call a Callable once on the UI thread after a delay
     * @return the handle of the scheduled callback
     */
    template <typename F, typename... As>
    callback_handle call_later(su::duration after, F&& f, As&&... as) {
        return m_sched.call_later(after, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief push an event to the UI thread
     */
    inline su::state inject_event(su::event e) {
        return m_sched.inject_event(std::move(e));
    }

    /**
     * @brief ask the UI thread to redraw
     */
    inline su::state refresh() {
        return m_sched.refresh();
    }

    /**
     * @return `true` if the worker thread calling this was asked to stop, else `false`
     */
    inline bool is_stop_requested() const {
        return su::this_thread::is_stop_requested();
    }

private:
    su::scheduler m_sched;
};

/**
 * @brief base class of an application running a single threaded main loop
 *
 * The thread calling `run()` becomes the UI thread. All hooks and all
 * scheduled callbacks run on it. Other threads interact with the application
 * only through the scheduling operations, `inject_event()`, `refresh()` and
 * `quit()`, which are threadsafe.
 *
 * Subclasses customize behavior by overriding the hooks:
 * - `process_event()`: handle an injected event
 * - `redraw()`: called at the start of every main loop iteration
 * - `configure_main_loop()`: called by `run()` before the loop starts
 * - `cleanup_main_loop()`: called by `run()` after the loop exits, even when it exits with an exception
 */
struct application {
    /**
     * @param cfg configuration, installed with `config::apply()` before the constructor returns
     */
    application(su::config cfg=su::config());
    virtual ~application();

    application(const application&) = delete;
    application& operator=(const application&) = delete;

    /**
     * @brief run the main loop on the calling thread until `quit()`
     * @return the code passed to `quit()`
     */
    int run();

    /**
     * @brief make `run()` return
     *
     * From the UI thread `run()` returns after the current callback. From
     * another thread the request is scheduled on the UI thread.
     *
     * @param code the value `run()` will return
     */
    void quit(int code=0);

    /**
     * @brief schedule a one-shot or recurring callback
     *
     * @param after delay before the first call
     * @param every delay between calls, zero for a one-shot callback
     * @param f Callable taking no arguments
     */
    inline callback_handle schedule(su::duration after, su::duration every, std::function<void()> f) {
        return m_sched.schedule(after, every, std::move(f));
    }

    /**
     * @brief call a Callable once on the UI thread after a delay
     */
    template <typename F, typename... As>
    callback_handle call_later(su::duration after, F&& f, As&&... as) {
        return m_sched.call_later(after, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief call a Callable once on the UI thread at an absolute time
     */
    template <typename CLOCK, typename DURATION, typename F, typename... As>
    callback_handle call_at(const std::chrono::time_point<CLOCK,DURATION>& at, F&& f, As&&... as) {
        return m_sched.call_at(at, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief call a Callable on the UI thread now and then every interval until cancelled
     */
    template <typename F, typename... As>
    callback_handle call_every(su::duration every, F&& f, As&&... as) {
        return m_sched.call_every(every, std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief call a Callable on the UI thread as soon as possible
     */
    template <typename F, typename... As>
    callback_handle call_on_ui_thread(F&& f, As&&... as) {
        return m_sched.call_on_ui_thread(std::forward<F>(f), std::forward<As>(as)...);
    }

    /**
     * @brief push an event to be handed to `process_event()` on the UI thread
     *
     * Events are processed in injection order, before the next `redraw()`.
     */
    inline su::state inject_event(su::event e) {
        return m_sched.inject_event(std::move(e));
    }

    /**
     * @brief force a redraw, useful when another thread changed widget state
     */
    inline su::state refresh() {
        return m_sched.refresh();
    }

    /**
     * @brief interrupt a main loop waiting in `poll()` when called from another thread
     */
    inline void wake_up() {
        m_sched.wake_up();
    }

    /**
     * @return `true` if called from the thread executing `run()`, else `false`
     */
    inline bool is_ui_thread() const {
        return m_sched.is_ui_thread();
    }

    /**
     * @brief enable or disable periodic redraws
     * @param enabled if `true` redraw every `config::auto_refresh_interval`
     */
    void auto_refresh(bool enabled);

    /**
     * @brief set the period of automatic redraws
     * @param interval redraw period, zero or negative disables automatic redraws
     */
    void auto_refresh(su::duration interval);

    /**
     * @return the period of automatic redraws, zero when disabled
     */
    inline su::duration auto_refresh() const {
        return m_auto_refresh;
    }

    /**
     * @brief create an unstarted worker thread
     *
     * If f can be invoked with a leading `su::worker_context&` argument it is
     * passed one, followed by `as...`.
     *
     * @param f any Callable
     * @param as optional arguments for f
     * @return the thread, ready to be started
     */
    template <typename F, typename... As>
    su::cancellable_thread create_worker(F&& f, As&&... as) {
        using wants_context = detail::is_invocable<F, su::worker_context&, As...>;
        return make_worker(
            std::integral_constant<bool,wants_context::value>(),
            std::forward<F>(f),
            std::forward<As>(as)...);
    }

    /**
     * @brief create an unstarted worker thread which is detached instead of joined on destruction
     *
     * Accepts the same arguments as `create_worker()`.
     */
    template <typename F, typename... As>
    su::cancellable_thread create_daemon(F&& f, As&&... as) {
        su::cancellable_thread th = create_worker(std::forward<F>(f), std::forward<As>(as)...);
        th.daemon(true);
        return th;
    }

    /**
     * @brief launch a thread pool sized by `config::thread_pool_size`
     * @return the allocated pool
     */
    inline su::thread_pool create_thread_pool() const {
        return su::thread_pool::make(m_config.thread_pool_size);
    }

    /**
     * @return the configuration the application was constructed with
     */
    inline const su::config& configuration() const {
        return m_config;
    }

    /**
     * @return the scheduler of this application
     */
    inline su::scheduler& scheduler() {
        return m_sched;
    }

protected:
    /**
     * @brief handle an event injected with `inject_event()`
     *
     * Never called with refresh or wake up markers.
     */
    virtual void process_event(su::event& e) { }

    /**
     * @brief draw the user interface
     *
     * Called at the start of every main loop iteration, so after every batch
     * of events, alarms and refresh requests.
     */
    virtual void redraw() { }

    virtual void configure_main_loop() { }
    virtual void cleanup_main_loop() { }

private:
    // handle case where f takes a worker context
    template <typename F, typename... As>
    su::cancellable_thread make_worker(std::true_type, F&& f, As&&... as) {
        return su::cancellable_thread::make(
            std::forward<F>(f),
            su::worker_context(m_sched),
            std::forward<As>(as)...);
    }

    // handle case where f does not
    template <typename F, typename... As>
    su::cancellable_thread make_worker(std::false_type, F&& f, As&&... as) {
        return su::cancellable_thread::make(std::forward<F>(f), std::forward<As>(as)...);
    }

    // drain the event queue on the UI thread
    void dispatch_events();

    su::config m_config;
    su::scheduler m_sched;
    su::duration m_auto_refresh;
    su::callback_handle m_auto_refresh_timer;
};

}

#endif
