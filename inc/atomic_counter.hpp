//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_ATOMIC_COUNTER__
#define __SIMPLE_UIKIT_ATOMIC_COUNTER__

#include <mutex>
#include <condition_variable>

#include "utility.hpp"

namespace su { // simple uikit

/**
 * @brief integer counter that can be changed atomically and waited upon
 *
 * Provides an atomic "wait until nonzero and then clear" operation.
 *
 * All methods in this object are threadsafe.
 */
struct atomic_counter {
    atomic_counter(long value=0) : m_value(value) { }

    atomic_counter(const atomic_counter&) = delete;
    atomic_counter& operator=(const atomic_counter&) = delete;

    /**
     * @brief increase the counter and wake all waiters
     * @param delta value to add
     */
    void increase(long delta=1);

    /**
     * @brief decrease the counter and wake all waiters
     * @param delta value to subtract
     */
    inline void decrease(long delta=1) {
        increase(-delta);
    }

    /**
     * @return the current value
     */
    long value() const;

    /**
     * @brief overwrite the counter and wake all waiters
     * @param new_value value to store
     */
    void value(long new_value);

    /**
     * @brief block until the counter is nonzero
     * @return the value of the counter
     */
    long wait();

    /**
     * @brief block until the counter is nonzero or timeout elapses
     * @param timeout maximum time to wait
     * @return the value of the counter, which is zero on timeout
     */
    long wait(su::duration timeout);

    /**
     * @brief block until the counter is nonzero, then reset it to zero
     * @return the value of the counter before the reset
     */
    long wait_and_reset();

    /**
     * @brief block until the counter is nonzero or timeout elapses, then reset it to zero
     * @param timeout maximum time to wait
     * @return the value of the counter before the reset, which is zero on timeout
     */
    long wait_and_reset(su::duration timeout);

private:
    long reset(std::unique_lock<std::mutex>& lk);

    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
    long m_value;
};

}

#endif
