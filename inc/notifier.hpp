//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_NOTIFIER__
#define __SIMPLE_UIKIT_NOTIFIER__

#include <mutex>

#include "utility.hpp"

namespace su { // simple uikit

/**
 * @brief file descriptor that becomes readable whenever `notify()` is called
 *
 * This is useful when one thread waits in a `poll()` call while another thread
 * needs it to return. The readable end returned by `fd()` is added to the
 * `poll()` call, and any thread calling `notify()` will make it return.
 *
 * This object implements the "self-pipe trick": `notify()` writes a byte to
 * the writable end of an anonymous non-blocking pipe. It is the responsibility
 * of the owner to call `drain()` when the readable end becomes readable.
 *
 * `notify()` is threadsafe. `drain()` should only be called by the thread
 * owning the notifier.
 */
struct notifier {
    /**
     * @brief open the internal pipe
     *
     * If the pipe cannot be created the notifier starts out closed.
     */
    notifier();

    notifier(const notifier&) = delete;
    notifier& operator=(const notifier&) = delete;

    virtual ~notifier();

    /**
     * @return the readable file descriptor to poll, `-1` if closed
     */
    int fd() const;

    /**
     * @return `true` if `close()` has been called or the pipe could not be opened, else `false`
     */
    bool closed() const;

    /**
     * @brief make `fd()` readable
     *
     * Never blocks. If the pipe is full it is already readable and the call
     * succeeds.
     *
     * @return `su::state::success`, `su::state::closed` if the notifier is closed, or `su::state::failure` on an unexpected I/O error
     */
    su::state notify();

    /**
     * @brief read everything currently pending on `fd()` without blocking
     *
     * After this call `fd()` is not readable unless another thread called
     * `notify()` concurrently or afterwards. No-op if closed.
     */
    void drain();

    /**
     * @brief close both ends of the pipe
     *
     * Idempotent.
     */
    void close();

private:
    mutable std::mutex m_mtx;
    int m_read_fd;
    int m_write_fd;
};

}

#endif
