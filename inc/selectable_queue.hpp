//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_SELECTABLE_QUEUE__
#define __SIMPLE_UIKIT_SELECTABLE_QUEUE__

#include <vector>

#include "utility.hpp"
#include "channel.hpp"
#include "notifier.hpp"

namespace su { // simple uikit

/**
 * @brief FIFO queue whose pending items can be waited on with `poll()`
 *
 * Pairs an `su::channel<T>` with an `su::notifier`: every successful `put()`
 * makes `fd()` readable, so a single threaded event loop can multiplex "new
 * queued item" with its other readiness sources.
 *
 * `fd()` may be readable while the queue is empty (a spurious wake up). The
 * reverse never happens: if an item is queued `fd()` is readable.
 *
 * `put()` is safe for any number of producer threads. `get_all()` must only be
 * called by a single consumer thread.
 */
template <typename T>
struct selectable_queue {
    /**
     * @param capacity maximum count of queued items, `0` for unbounded
     */
    selectable_queue(std::size_t capacity=0) :
        m_ch(su::channel<T>::make(capacity))
    { }

    selectable_queue(const selectable_queue&) = delete;
    selectable_queue& operator=(const selectable_queue&) = delete;

    virtual ~selectable_queue() {
        close();
    }

    /**
     * @brief enqueue an item and make `fd()` readable
     *
     * @param t item to enqueue
     * @param block if `true` wait for room when the queue is full
     * @return `su::state::success`, `su::state::failure` if the queue is full, or `su::state::closed`
     */
    inline su::state put(T t, bool block=true) {
        return notify_on_success(m_ch.send(std::move(t), block));
    }

    /**
     * @brief enqueue an item, waiting at most `timeout` for room
     * @return `su::state::success`, `su::state::failure` on timeout, or `su::state::closed`
     */
    inline su::state put(T t, su::duration timeout) {
        return notify_on_success(m_ch.send_for(std::move(t), timeout));
    }

    /**
     * @brief enqueue an item only if there is room
     * @return the result state of the operation
     */
    inline su::state put_nowait(T t) {
        return put(std::move(t), false);
    }

    /**
     * @brief take every queued item without blocking
     *
     * The notifier is drained *before* the queue is emptied. A producer racing
     * with this call therefore either has its item returned now or leaves
     * `fd()` readable for the next call.
     *
     * @return queued items in insertion order, possibly empty
     */
    inline std::vector<T> get_all() {
        m_notifier.drain();

        std::vector<T> items;
        T t;

        while(m_ch.try_recv(t) == su::state::success) {
            items.push_back(std::move(t));
        }

        return items;
    }

    /**
     * @return the readable file descriptor to poll, `-1` if closed
     */
    inline int fd() const {
        return m_notifier.fd();
    }

    /**
     * @return count of currently queued items
     */
    inline std::size_t queued() const {
        return m_ch.queued();
    }

    /**
     * @return `true` if `close()` has been called, else `false`
     */
    inline bool closed() const {
        return m_ch.closed();
    }

    /**
     * @brief close the queue and release the notifier
     *
     * Queued items are discarded and further `put()` calls return
     * `su::state::closed`. Idempotent.
     */
    inline void close() {
        m_ch.close(false);
        m_notifier.close();
    }

private:
    // the item is queued once st is success, a notifier error is only logged
    inline su::state notify_on_success(su::state st) {
        if(st == su::state::success) {
            m_notifier.notify();
        }

        return st;
    }

    su::channel<T> m_ch;
    su::notifier m_notifier;
};

}

#endif
