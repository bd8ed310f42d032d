//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_CHANNEL__
#define __SIMPLE_UIKIT_CHANNEL__

#include <memory>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <utility>
#include <chrono>

#include "utility.hpp"
#include "context.hpp"

namespace su { // simple uikit
namespace detail {
namespace channel {

// stack condition data of a receiver blocked in `recv()`
template <typename T>
struct blocker {
    blocker(T* t) : item(t) { }

    inline void wait(std::unique_lock<std::mutex>& lk) {
        do {
            cv.wait(lk);
        } while(!flag);
    }

    // only signal once, caller holds the channel lock
    inline void signal() {
        if(!flag) {
            flag = true;
            cv.notify_one();
        }
    }

    inline void send(T& t) {
        *item = std::move(t);
        received = true;
        signal();
    }

    bool flag = false;
    bool received = false;
    std::condition_variable cv;
    T* item;
};

template <typename T>
struct context {
    context(std::size_t capacity) : m_closed(false), m_capacity(capacity) { }

    ~context() {
        close(true);
    }

    inline bool closed() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_closed;
    }

    inline void close(bool soft) {
        std::lock_guard<std::mutex> lk(m_mtx);

        if(!m_closed) {
            m_closed = true;

            if(!soft) {
                m_q.clear();
            }

            // blockers only exist while the queue is empty
            for(auto b : m_blockers) {
                b->signal();
            }

            m_blockers.clear(); // allow receivers to terminate
            m_space_cv.notify_all(); // allow blocked senders to terminate
        }
    }

    inline std::size_t queued() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_q.size();
    }

    inline std::size_t blocked_receivers() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_blockers.size();
    }

    inline std::size_t capacity() const {
        return m_capacity;
    }

    inline bool full() const {
        return m_capacity && m_q.size() >= m_capacity;
    }

    // hand queued items to blocked receivers in the order they blocked
    inline void handle_queued_items() {
        while(m_q.size() && m_blockers.size()) {
            blocker<T>* b = m_blockers.front();
            m_blockers.pop_front();
            b->send(m_q.front());
            m_q.pop_front();
        }
    }

    inline su::state send(T&& t, bool block, const su::time_point* deadline) {
        std::unique_lock<std::mutex> lk(m_mtx);

        while(!m_closed && full()) {
            if(!block) {
                return su::state::failure;
            } else if(deadline) {
                if(m_space_cv.wait_until(lk, *deadline) == std::cv_status::timeout &&
                   !m_closed &&
                   full()) {
                    return su::state::failure;
                }
            } else {
                m_space_cv.wait(lk);
            }
        }

        if(m_closed) {
            return su::state::closed;
        }

        m_q.push_back(std::move(t));
        handle_queued_items();
        return su::state::success;
    }

    inline su::state recv(T& t, bool block) {
        std::unique_lock<std::mutex> lk(m_mtx);

        if(!m_q.empty()) {
            t = std::move(m_q.front());
            m_q.pop_front();
            m_space_cv.notify_one();
            return su::state::success;
        } else if(m_closed) {
            return su::state::closed;
        } else if(!block) {
            return su::state::failure;
        }

        // block until an item is handed over or the channel closes
        blocker<T> b(&t);
        m_blockers.push_back(&b);
        b.wait(lk);
        return b.received ? su::state::success : su::state::closed;
    }

    bool m_closed;
    const std::size_t m_capacity;
    mutable std::mutex m_mtx;
    std::condition_variable m_space_cv;
    std::deque<T> m_q;
    std::deque<blocker<T>*> m_blockers;
};

}
}

/**
 * @brief interthread FIFO queue
 *
 * The internal mechanism used by this library to pass items between system
 * threads. A channel may be bounded: once `capacity` items are queued,
 * blocking senders wait for a receiver to make room and non-blocking senders
 * fail.
 *
 * An item sent while a receiver is blocked in `recv()` is handed directly to
 * the receiver and never occupies queue capacity. Multiple simultaneous
 * `recv()` calls are served in the order they were called.
 *
 * All methods in this object are threadsafe.
 */
template <typename T>
struct channel : public su::shared_context<channel<T>, detail::channel::context<T>> {
    inline virtual ~channel() { }

    /**
     * @brief construct an allocated channel
     * @param capacity maximum count of queued items, `0` for unbounded
     * @return the allocated channel
     */
    static inline channel make(std::size_t capacity=0) {
        channel ch;
        ch.ctx(std::make_shared<detail::channel::context<T>>(capacity));
        return ch;
    }

    /**
     * @return `true` if `close()` has been called or if `make()` was never called, else `false`
     */
    inline bool closed() const {
        return this->ctx() ? this->ctx()->closed() : true;
    }

    /**
     * @brief set the channel to the closed state
     *
     * All blocked senders and receivers are woken.
     *
     * @param soft if `false` discard all queued items, otherwise leave them to be received
     */
    inline void close(bool soft=true) {
        if(this->ctx()) {
            this->ctx()->close(soft);
        }
    }

    /**
     * @return count of currently queued items
     */
    inline std::size_t queued() const {
        return this->ctx() ? this->ctx()->queued() : 0;
    }

    /**
     * @return count of system threads blocked on `recv()`
     */
    inline std::size_t blocked_receivers() const {
        return this->ctx() ? this->ctx()->blocked_receivers() : 0;
    }

    /**
     * @return maximum count of queued items, `0` if unbounded
     */
    inline std::size_t capacity() const {
        return this->ctx() ? this->ctx()->capacity() : 0;
    }

    /**
     * @brief enqueue an item
     *
     * @param t item to enqueue
     * @param block if `true` wait for room when the channel is full, otherwise fail immediately
     * @return `su::state::success`, `su::state::failure` if full and not blocking, or `su::state::closed`
     */
    inline su::state send(T t, bool block=true) {
        return this->ctx() ?
            this->ctx()->send(std::move(t), block, nullptr) :
            su::state::closed;
    }

    /**
     * @brief enqueue an item if there is room, without blocking
     * @return the result state of the operation
     */
    inline su::state try_send(T t) {
        return send(std::move(t), false);
    }

    /**
     * @brief enqueue an item, waiting at most `timeout` for room
     * @return `su::state::success`, `su::state::failure` on timeout, or `su::state::closed`
     */
    inline su::state send_for(T t, su::duration timeout) {
        su::time_point deadline = su::clock::now() + timeout;
        return this->ctx() ?
            this->ctx()->send(std::move(t), true, &deadline) :
            su::state::closed;
    }

    /**
     * @brief receive an item over the channel
     *
     * This is a blocking operation that will not complete until there is an
     * item available or the channel is closed. After `close(true)` queued
     * items can still be received until the queue is empty.
     *
     * @param t reference to overwrite with the received item
     * @return `true` on success, `false` if the channel is closed
     */
    inline bool recv(T& t) {
        return this->ctx() ?
            this->ctx()->recv(t, true) == su::state::success :
            false;
    }

    /**
     * @brief non-blocking receive
     * @param t reference to overwrite with the received item
     * @return the result state of the operation
     */
    inline su::state try_recv(T& t) {
        return this->ctx() ? this->ctx()->recv(t, false) : su::state::closed;
    }
};

}

#endif
