#include <atomic>
#include <iostream>

#include "log.hpp"

namespace {

std::atomic<int>& current_threshold() {
    static std::atomic<int> lvl(static_cast<int>(su::log::level::warning));
    return lvl;
}

std::ostream*& current_sink() {
    static std::ostream* os = nullptr;
    return os;
}

}

su::log::level su::log::threshold() {
    return static_cast<su::log::level>(current_threshold().load());
}

void su::log::threshold(su::log::level lvl) {
    current_threshold().store(static_cast<int>(lvl));
}

void su::log::sink(std::ostream* os) {
    auto lk = detail::lock();
    current_sink() = os;
}

const char* su::log::name(su::log::level lvl) {
    switch(lvl) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
        default:
            return "none";
    }
}

bool su::log::parse(const std::string& s, su::log::level& lvl) {
    for(int i = static_cast<int>(level::debug); i <= static_cast<int>(level::none); ++i) {
        if(s == name(static_cast<level>(i))) {
            lvl = static_cast<level>(i);
            return true;
        }
    }

    return false;
}

std::unique_lock<std::mutex> su::log::detail::lock() {
    static std::mutex mtx;
    return std::unique_lock<std::mutex>(mtx);
}

// caller must hold the lock
std::ostream& su::log::detail::stream() {
    return current_sink() ? *current_sink() : std::cerr;
}
