#include "atomic_counter.hpp"

void su::atomic_counter::increase(long delta) {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_value += delta;
    m_cv.notify_all();
}

long su::atomic_counter::value() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_value;
}

void su::atomic_counter::value(long new_value) {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_value = new_value;
    m_cv.notify_all();
}

long su::atomic_counter::wait() {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_cv.wait(lk, [&]{ return m_value != 0; });
    return m_value;
}

long su::atomic_counter::wait(su::duration timeout) {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_cv.wait_for(lk, timeout, [&]{ return m_value != 0; });
    return m_value;
}

long su::atomic_counter::wait_and_reset() {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_cv.wait(lk, [&]{ return m_value != 0; });
    return reset(lk);
}

long su::atomic_counter::wait_and_reset(su::duration timeout) {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_cv.wait_for(lk, timeout, [&]{ return m_value != 0; });
    return reset(lk);
}

long su::atomic_counter::reset(std::unique_lock<std::mutex>&) {
    long result = m_value;
    m_value = 0;

    if(result != 0) {
        m_cv.notify_all();
    }

    return result;
}
