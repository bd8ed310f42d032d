#include <cstdlib>
#include <string>

#include "config.hpp"

su::config su::config::from_env() {
    su::config cfg;

    const char* lvl_env = std::getenv("SUIKIT_LOG_LEVEL");
    if(lvl_env) {
        su::log::level lvl;

        if(su::log::parse(lvl_env, lvl)) {
            cfg.log_level = lvl;
        } else {
            su::log::warning(__func__, "ignoring invalid SUIKIT_LOG_LEVEL: ", lvl_env);
        }
    }

    const char* pool_env = std::getenv("SUIKIT_POOL_SIZE");
    if(pool_env) {
        char* end = nullptr;
        long n = std::strtol(pool_env, &end, 10);

        if(end != pool_env && *end == '\0' && n > 0) {
            cfg.thread_pool_size = (std::size_t)n;
        } else {
            su::log::warning(__func__, "ignoring invalid SUIKIT_POOL_SIZE: ", pool_env);
        }
    }

    return cfg;
}

void su::config::apply() const {
    su::log::threshold(log_level);
}
