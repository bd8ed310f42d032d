//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_UTILITY__
#define __SIMPLE_UIKIT_UTILITY__

#include <memory>
#include <chrono>
#include <typeinfo>
#include <functional>
#include <type_traits>
#include <utility>

namespace su { // simple uikit

/**
 * @brief operation result state
 *
 * This is typically handled internally, but is provided for the operations
 * which directly return it.
 *
 * closed == 0 so that a non-blocking operation used as a loop condition will
 * break out of the loop when the underlying resource is closed.
 */
enum state {
    closed = 0, /// operation failed because the resource was closed
    failure, /// non-blocking or timed operation could not complete
    success /// operation succeeded
};

/// monotonic clock used by every timer in this library
typedef std::chrono::steady_clock clock;

/// duration type accepted by scheduling operations
typedef clock::duration duration;

/// absolute time type used by scheduling operations
typedef clock::time_point time_point;

namespace detail {

// typedef representing the unqualified type of T
template <typename T>
using base = typename std::decay<T>::type;

// template typing assistance object
template <typename T> struct hint { };

// get a function's return type
template <typename F, typename... As>
using function_return_type = typename std::invoke_result<base<F>,As...>::type;

template <typename F, typename... As>
using is_invocable = std::is_invocable<base<F>,As...>;

/*
 * Execute a Callable when this object goes out of scope, including during
 * stack unwinding.
 */
struct on_scope_exit {
    on_scope_exit() = delete;
    on_scope_exit(const on_scope_exit&) = delete;
    on_scope_exit(on_scope_exit&&) = delete;
    inline on_scope_exit(std::function<void()> f) : m_f(std::move(f)) { }
    inline ~on_scope_exit() { m_f(); }

    std::function<void()> m_f;
};

// convert a point on any clock into a point on the library clock
template <typename CLOCK, typename DURATION>
su::time_point to_library_time(const std::chrono::time_point<CLOCK,DURATION>& tp) {
    return su::clock::now() +
        std::chrono::duration_cast<su::duration>(tp - CLOCK::now());
}

inline su::time_point to_library_time(const su::time_point& tp) {
    return tp;
}

}
}

#endif
