#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, log_threshold) {
    sut::log_capture cap(su::log::level::warning);

    su::log::debug("tag", "hidden ", 1);
    su::log::info("tag", "hidden ", 2);
    su::log::warning("tag", "shown ", 3);
    su::log::error("tag", "shown ", 4);

    std::string out = cap.str();
    EXPECT_EQ(std::string::npos, out.find("hidden"));
    EXPECT_NE(std::string::npos, out.find("[warning][tag] shown 3\n"));
    EXPECT_NE(std::string::npos, out.find("[error][tag] shown 4\n"));
}

TEST(simple_uikit, log_none_silences_everything) {
    sut::log_capture cap(su::log::level::none);
    su::log::error("tag", "nothing");
    EXPECT_TRUE(cap.str().empty());
}

TEST(simple_uikit, log_lines_do_not_interleave) {
    sut::log_capture cap(su::log::level::debug);
    std::vector<std::thread> threads;

    for(int t = 0; t < 4; ++t) {
        threads.emplace_back([t]{
            for(int i = 0; i < 50; ++i) {
                su::log::info("writer", "thread ", t, " line ", i);
            }
        });
    }

    for(auto& th : threads) {
        th.join();
    }

    std::stringstream ss(cap.str());
    std::string line;
    std::size_t count = 0;

    while(std::getline(ss, line)) {
        EXPECT_EQ(0u, line.find("[info][writer] thread "));
        ++count;
    }

    EXPECT_EQ(200u, count);
}

TEST(simple_uikit, log_level_names) {
    su::log::level lvl = su::log::level::none;

    EXPECT_TRUE(su::log::parse("debug", lvl));
    EXPECT_EQ(su::log::level::debug, lvl);
    EXPECT_TRUE(su::log::parse("error", lvl));
    EXPECT_EQ(su::log::level::error, lvl);
    EXPECT_FALSE(su::log::parse("verbose", lvl));
    EXPECT_EQ(su::log::level::error, lvl);

    EXPECT_EQ(std::string("warning"), su::log::name(su::log::level::warning));
}
