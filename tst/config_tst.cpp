#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, config_defaults) {
    su::config cfg;
    EXPECT_EQ(std::chrono::milliseconds(100), cfg.auto_refresh_interval);
    EXPECT_EQ(5u, cfg.thread_pool_size);
    EXPECT_EQ(su::log::level::warning, cfg.log_level);
}

TEST(simple_uikit, config_from_env) {
    su::log::level old = su::log::threshold();

    setenv("SUIKIT_LOG_LEVEL", "debug", 1);
    setenv("SUIKIT_POOL_SIZE", "3", 1);

    su::config cfg = su::config::from_env();
    EXPECT_EQ(su::log::level::debug, cfg.log_level);
    EXPECT_EQ(3u, cfg.thread_pool_size);

    cfg.apply();
    EXPECT_EQ(su::log::level::debug, su::log::threshold());

    // invalid values keep the defaults
    setenv("SUIKIT_LOG_LEVEL", "loud", 1);
    setenv("SUIKIT_POOL_SIZE", "-2", 1);

    su::config cfg2 = su::config::from_env();
    EXPECT_EQ(su::log::level::warning, cfg2.log_level);
    EXPECT_EQ(5u, cfg2.thread_pool_size);

    unsetenv("SUIKIT_LOG_LEVEL");
    unsetenv("SUIKIT_POOL_SIZE");
    su::log::threshold(old);
}
