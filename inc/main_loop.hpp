//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_MAIN_LOOP__
#define __SIMPLE_UIKIT_MAIN_LOOP__

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

#include "utility.hpp"

namespace su { // simple uikit
namespace detail {
namespace main_loop {

struct alarm {
    su::time_point m_at;
    std::size_t m_seq;
    std::function<void()> m_f;
};

// heap comparator, the earliest (time, sequence) pair is on top
struct later {
    inline bool operator()(const alarm& lhs, const alarm& rhs) const {
        return lhs.m_at != rhs.m_at ? lhs.m_at > rhs.m_at : lhs.m_seq > rhs.m_seq;
    }
};

struct watch {
    std::size_t m_token;
    int m_fd;
    std::function<void()> m_f;
};

struct idle {
    std::size_t m_token;
    std::function<void()> m_f;
};

}
}

/**
 * @brief single threaded event loop multiplexing file descriptors and alarms
 *
 * Each iteration:
 * - calls every idle callback, in registration order
 * - waits in `poll()` for a watched file descriptor to become readable or
 *   for the earliest alarm to become due
 * - calls the callbacks of readable file descriptors
 * - calls the callbacks of due alarms, earliest first, ties in registration
 *   order
 *
 * Alarms registered while alarms are being dispatched are not dispatched
 * before the next iteration.
 *
 * Alarm registration and removal are threadsafe. Setting an alarm from
 * another thread does not interrupt a `poll()` in progress: such callers are
 * expected to also make a watched descriptor readable (see `su::scheduler`).
 * Everything else must be called from the thread running the loop.
 *
 * Exceptions thrown by callbacks propagate out of `iterate()` and `run()`.
 */
struct main_loop {
    main_loop() :
        m_next_token(1),
        m_running(false),
        m_quit(false),
        m_exit_code(0)
    { }

    main_loop(const main_loop&) = delete;
    main_loop& operator=(const main_loop&) = delete;

    /**
     * @brief schedule a Callable at an absolute time
     * @param at when to call f
     * @param f Callable taking no arguments
     * @return a nonzero token for `remove_alarm()`
     */
    std::size_t set_alarm_at(su::time_point at, std::function<void()> f);

    /**
     * @brief schedule a Callable after a delay, negative delays count as zero
     * @return a nonzero token for `remove_alarm()`
     */
    std::size_t set_alarm_in(su::duration delay, std::function<void()> f);

    /**
     * @brief unschedule an alarm which has not fired yet
     * @return `true` if the alarm was removed, `false` if it already fired or was never set
     */
    bool remove_alarm(std::size_t token);

    /**
     * @return count of alarms which have not fired yet
     */
    std::size_t alarms() const;

    /**
     * @brief call f whenever fd is readable
     * @return a nonzero token for `remove_watch_file()`
     */
    std::size_t watch_file(int fd, std::function<void()> f);

    /**
     * @return `true` if the watch was removed, else `false`
     */
    bool remove_watch_file(std::size_t token);

    /**
     * @brief call f at the start of every iteration
     * @return a nonzero token for `remove_enter_idle()`
     */
    std::size_t enter_idle(std::function<void()> f);

    /**
     * @return `true` if the idle callback was removed, else `false`
     */
    bool remove_enter_idle(std::size_t token);

    /**
     * @brief run a single iteration of the loop
     * @param block if `false` do not wait in `poll()`
     * @return `true` if any file descriptor or alarm callback was called, else `false`
     */
    bool iterate(bool block=true);

    /**
     * @brief iterate until `quit()` is called
     * @return the exit code passed to `quit()`, `-1` if the loop was already running
     */
    int run();

    /**
     * @brief make `run()` return after the current callback
     * @param code the value `run()` will return
     */
    void quit(int code=0);

    /**
     * @return `true` while `run()` executes, else `false`
     */
    inline bool running() const {
        return m_running;
    }

private:
    int poll_timeout_ms(bool block);
    bool dispatch_files(int timeout_ms);
    bool dispatch_alarms();

    mutable std::mutex m_mtx;
    std::size_t m_next_token;
    std::vector<detail::main_loop::alarm> m_alarms;

    // only touched by the loop thread
    std::vector<detail::main_loop::watch> m_watches;
    std::vector<detail::main_loop::idle> m_idles;

    std::atomic<bool> m_running;
    std::atomic<bool> m_quit;
    std::atomic<int> m_exit_code;
};

}

#endif
