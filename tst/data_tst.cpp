#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, data_default) {
    su::data d;
    EXPECT_FALSE(d);
    EXPECT_FALSE(d.is<int>());
    EXPECT_FALSE(d.is<std::string>());
    EXPECT_EQ(typeid(su::data::unset), d.type_info());
}

TEST(simple_uikit, data_int) {
    int i=14;
    su::data d = su::data::make<int>(i);

    EXPECT_TRUE(d);
    EXPECT_EQ(d.type_info(), typeid(int));
    EXPECT_TRUE(d.is<int>());
    EXPECT_TRUE(d.is<const int&>());
    EXPECT_FALSE(d.is<std::string>());

    {
        std::string s = "";
        EXPECT_FALSE(d.copy_to(s));
        EXPECT_FALSE(d.move_to(s));
    }

    {
        int i2 = 0;
        EXPECT_TRUE(d.copy_to(i2));
        EXPECT_EQ(i, i2);
    }

    // move_to swaps, so a 2nd move gets back what the 1st one left
    {
        int i2 = 0;
        EXPECT_TRUE(d.move_to(i2));
        EXPECT_EQ(i, i2);
        EXPECT_EQ(0, d.cast_to<int>());
    }
}

TEST(simple_uikit, data_string) {
    su::data d = su::data::make<std::string>("hello");
    ASSERT_TRUE(d.is<std::string>());
    EXPECT_EQ(std::string("hello"), d.cast_to<std::string>());

    std::string s;
    EXPECT_TRUE(d.move_to(s));
    EXPECT_EQ(std::string("hello"), s);
    EXPECT_TRUE(d.cast_to<std::string>().empty());
}

TEST(simple_uikit, data_move_resets_source) {
    su::data d = su::data::make<std::vector<int>>(3, 7);
    su::data d2(std::move(d));

    EXPECT_FALSE(d);
    EXPECT_EQ(typeid(su::data::unset), d.type_info());
    ASSERT_TRUE(d2.is<std::vector<int>>());
    EXPECT_EQ(3u, d2.cast_to<std::vector<int>>().size());

    su::data d3;
    d3 = std::move(d2);
    EXPECT_FALSE(d2);
    EXPECT_TRUE(d3.is<std::vector<int>>());
}
