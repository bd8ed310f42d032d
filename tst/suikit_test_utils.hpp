#ifndef __SIMPLE_UIKIT_TEST_UTILS__
#define __SIMPLE_UIKIT_TEST_UTILS__

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>
#include <chrono>
#include <thread>
#include <functional>
#include "simple_uikit.hpp"

namespace sut { // simple uikit test
namespace detail {

std::unique_lock<std::mutex> log_lock();

inline void log() {
    std::cout << std::endl << std::flush;
}

template <typename T, typename... As>
inline void log(T&& t, As&&... as) {
    std::cout << t;
    log(std::forward<As>(as)...);
}

}

template <typename... As>
inline void log(const char* func, As&&... as) {
    auto lk = detail::log_lock();
    detail::log("[", func, "] ", std::forward<As>(as)...);
}

/*
 * Poll a condition until it holds or the timeout elapses.
 *
 * Returns the final value of the condition.
 */
bool wait_until(std::function<bool()> cond,
                std::chrono::milliseconds timeout=std::chrono::milliseconds(2000));

/*
 * Run the main loop of a scheduler on the calling thread the way an
 * application does: the calling thread becomes the UI thread and injected
 * events are drained. The loop exits when `quit()` is called on it, or after
 * `limit` as a safety net, in which case -1 is returned.
 */
int run_loop(su::scheduler sched,
             std::chrono::milliseconds limit=std::chrono::milliseconds(5000));

// redirect the library log for the duration of a test
struct log_capture {
    log_capture(su::log::level lvl) : m_old(su::log::threshold()) {
        su::log::sink(&m_ss);
        su::log::threshold(lvl);
    }

    ~log_capture() {
        su::log::sink(nullptr);
        su::log::threshold(m_old);
    }

    std::string str() const {
        return m_ss.str();
    }

    su::log::level m_old;
    std::stringstream m_ss;
};

template <typename CONTEXT_WRAPPER_T>
struct test_runner {
    test_runner(const char* test_name) :
        m_test_name(test_name),
        m_type_name(typeid(CONTEXT_WRAPPER_T).name())
    { }

    inline void run() {
        std::stringstream ss;
        ss << m_test_name << "<" << m_type_name << ">";
        std::string test_str = ss.str();

        sut::log(test_str.c_str(), "--- TEST BEGIN ---");
        test();
        sut::log(test_str.c_str(), "--- TEST END ---");
    }

protected:
    const char* m_test_name;
    const char* m_type_name;

    /*
     * @brief user test implementation
     */
    virtual void test() = 0;
};

}

#endif
