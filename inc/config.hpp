//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_CONFIG__
#define __SIMPLE_UIKIT_CONFIG__

#include <chrono>
#include <cstddef>

#include "utility.hpp"
#include "log.hpp"

namespace su { // simple uikit

/**
 * @brief runtime settings shared by an application and its helpers
 *
 * All fields have usable defaults, so a default constructed `su::config` can
 * be passed anywhere one is expected.
 */
struct config {
    /// interval used when auto refresh is switched on with `true`
    su::duration auto_refresh_interval = std::chrono::milliseconds(100);

    /// worker count of thread pools created without an explicit size
    std::size_t thread_pool_size = 5;

    /// log threshold installed by `apply()`
    su::log::level log_level = su::log::level::warning;

    /**
     * @brief build a configuration from the process environment
     *
     * Recognized variables:
     * - SUIKIT_LOG_LEVEL: debug, info, warning, error or none
     * - SUIKIT_POOL_SIZE: positive integer worker count
     *
     * Unset or invalid variables leave the default in place.
     *
     * @return the resulting configuration
     */
    static config from_env();

    /**
     * @brief install process wide settings (currently the log threshold)
     */
    void apply() const;
};

}

#endif
