#include <gtest/gtest.h>
#include <string>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

TEST(simple_uikit, event_payload) {
    enum op {
        unknown,
        integer,
        string
    };

    su::event e = su::event::make(op::integer, 14);
    EXPECT_TRUE(e.is_user());
    EXPECT_FALSE(e.is_refresh());
    EXPECT_FALSE(e.is_wake_up());
    EXPECT_EQ(op::integer, e.id());
    ASSERT_TRUE(e.data().is<int>());
    EXPECT_EQ(14, e.data().cast_to<int>());

    // copies share the payload
    su::event e2 = e;
    int i = 0;
    EXPECT_TRUE(e2.data().move_to(i));
    EXPECT_EQ(14, i);
    EXPECT_EQ(0, e.data().cast_to<int>());

    su::event e3 = su::event::make(op::string, std::string("codemonkey"));
    std::string s;
    EXPECT_TRUE(e3.data().copy_to(s));
    EXPECT_EQ(std::string("codemonkey"), s);

    su::event e4 = su::event::make(op::unknown);
    EXPECT_FALSE(e4.data());
}

TEST(simple_uikit, event_markers) {
    su::event r = su::event::refresh_marker();
    su::event w = su::event::wake_up_marker();

    EXPECT_TRUE(r.is_refresh());
    EXPECT_FALSE(r.is_user());
    EXPECT_FALSE(r.is_wake_up());

    EXPECT_TRUE(w.is_wake_up());
    EXPECT_FALSE(w.is_user());
    EXPECT_FALSE(w.is_refresh());

    su::event none;
    EXPECT_FALSE(none.is_user());
    EXPECT_FALSE(none.is_refresh());
    EXPECT_FALSE(none.is_wake_up());
}
