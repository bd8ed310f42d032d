#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstring>

#include <poll.h>

#include "log.hpp"
#include "main_loop.hpp"

std::size_t su::main_loop::set_alarm_at(su::time_point at, std::function<void()> f) {
    std::lock_guard<std::mutex> lk(m_mtx);
    std::size_t token = m_next_token++;
    m_alarms.push_back(detail::main_loop::alarm{ at, token, std::move(f) });
    std::push_heap(m_alarms.begin(), m_alarms.end(), detail::main_loop::later());
    return token;
}

std::size_t su::main_loop::set_alarm_in(su::duration delay, std::function<void()> f) {
    if(delay < su::duration::zero()) {
        delay = su::duration::zero();
    }

    return set_alarm_at(su::clock::now() + delay, std::move(f));
}

bool su::main_loop::remove_alarm(std::size_t token) {
    std::function<void()> removed;

    {
        std::lock_guard<std::mutex> lk(m_mtx);

        auto it = std::find_if(m_alarms.begin(), m_alarms.end(),
            [&](const detail::main_loop::alarm& a) { return a.m_seq == token; });

        if(it == m_alarms.end()) {
            return false;
        }

        removed = std::move(it->m_f);
        m_alarms.erase(it);

        // erasing from the middle breaks the heap order
        std::make_heap(m_alarms.begin(), m_alarms.end(), detail::main_loop::later());
    }

    // destroy captured state outside of lock
    return true;
}

std::size_t su::main_loop::alarms() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_alarms.size();
}

std::size_t su::main_loop::watch_file(int fd, std::function<void()> f) {
    std::size_t token;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        token = m_next_token++;
    }

    m_watches.push_back(detail::main_loop::watch{ token, fd, std::move(f) });
    return token;
}

bool su::main_loop::remove_watch_file(std::size_t token) {
    auto it = std::find_if(m_watches.begin(), m_watches.end(),
        [&](const detail::main_loop::watch& w) { return w.m_token == token; });

    if(it == m_watches.end()) {
        return false;
    }

    m_watches.erase(it);
    return true;
}

std::size_t su::main_loop::enter_idle(std::function<void()> f) {
    std::size_t token;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        token = m_next_token++;
    }

    m_idles.push_back(detail::main_loop::idle{ token, std::move(f) });
    return token;
}

bool su::main_loop::remove_enter_idle(std::size_t token) {
    auto it = std::find_if(m_idles.begin(), m_idles.end(),
        [&](const detail::main_loop::idle& i) { return i.m_token == token; });

    if(it == m_idles.end()) {
        return false;
    }

    m_idles.erase(it);
    return true;
}

int su::main_loop::poll_timeout_ms(bool block) {
    if(!block) {
        return 0;
    }

    std::lock_guard<std::mutex> lk(m_mtx);

    if(m_alarms.empty()) {
        return -1;
    }

    su::duration left = m_alarms.front().m_at - su::clock::now();

    if(left <= su::duration::zero()) {
        return 0;
    }

    // round up so the alarm is due when poll() returns
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(left).count();
    return ms > INT_MAX ? INT_MAX : static_cast<int>(ms);
}

bool su::main_loop::dispatch_files(int timeout_ms) {
    std::vector<struct pollfd> fds;
    std::vector<std::size_t> tokens;

    for(auto& w : m_watches) {
        struct pollfd p;
        p.fd = w.m_fd;
        p.events = POLLIN;
        p.revents = 0;
        fds.push_back(p);
        tokens.push_back(w.m_token);
    }

    int ret = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(), timeout_ms);

    if(ret < 0) {
        if(errno != EINTR) {
            su::log::warning(__func__, "poll failed: ", std::strerror(errno));
        }

        return false;
    }

    bool dispatched = false;

    for(std::size_t i = 0; ret > 0 && i < fds.size() && !m_quit; ++i) {
        if(fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
            // an earlier callback may have removed this watch
            auto it = std::find_if(m_watches.begin(), m_watches.end(),
                [&](const detail::main_loop::watch& w) { return w.m_token == tokens[i]; });

            if(it != m_watches.end()) {
                std::function<void()> f = it->m_f;
                f();
                dispatched = true;
            }
        } else if(fds[i].revents & POLLNVAL) {
            su::log::warning(__func__, "watched descriptor ", fds[i].fd, " is invalid");
        }
    }

    return dispatched;
}

bool su::main_loop::dispatch_alarms() {
    bool dispatched = false;
    su::time_point now = su::clock::now();
    std::size_t watermark;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        watermark = m_next_token;
    }

    while(!m_quit) {
        std::function<void()> f;

        {
            std::lock_guard<std::mutex> lk(m_mtx);

            if(m_alarms.empty() ||
               m_alarms.front().m_at > now ||
               m_alarms.front().m_seq >= watermark) {
                break;
            }

            std::pop_heap(m_alarms.begin(), m_alarms.end(), detail::main_loop::later());
            f = std::move(m_alarms.back().m_f);
            m_alarms.pop_back();
        }

        // call outside of lock, the callback may set or remove alarms
        f();
        dispatched = true;
    }

    return dispatched;
}

bool su::main_loop::iterate(bool block) {
    // copy, an idle callback may register or remove idle callbacks
    std::vector<detail::main_loop::idle> idles = m_idles;

    for(auto& i : idles) {
        if(m_quit) {
            return false;
        }

        i.m_f();
    }

    if(m_quit) {
        return false;
    }

    bool dispatched = dispatch_files(poll_timeout_ms(block));

    if(m_quit) {
        return dispatched;
    }

    return dispatch_alarms() || dispatched;
}

int su::main_loop::run() {
    if(m_running.exchange(true)) {
        su::log::warning(__func__, "main loop is already running");
        return -1;
    }

    su::detail::on_scope_exit running_guard([&]{ m_running = false; });

    m_quit = false;
    m_exit_code = 0;
    su::log::debug(__func__, "entering main loop");

    while(!m_quit) {
        iterate(true);
    }

    su::log::debug(__func__, "main loop exited with code ", m_exit_code.load());
    return m_exit_code;
}

void su::main_loop::quit(int code) {
    m_exit_code = code;
    m_quit = true;
}
