#include <gtest/gtest.h>
#include <type_traits>
#include <iostream>
#include "simple_uikit.hpp"
#include "suikit_test_utils.hpp"

namespace sut { // simple uikit test

template <typename SHARED_CONTEXT>
struct shared_context_test : public test_runner<SHARED_CONTEXT> {
    shared_context_test(
            const char* test_name,
            std::function<SHARED_CONTEXT()> make) :
        sut::test_runner<SHARED_CONTEXT>(test_name),
        m_make(make)
    { }

protected:
    virtual void test() {
        // construction and bool conversion
        SHARED_CONTEXT sctx; // default constructor
        SHARED_CONTEXT sctx2(m_make()); // rvalue constructor
        SHARED_CONTEXT sctx3(sctx2); // lvalue constructor

        // bool conversion
        EXPECT_FALSE(sctx);
        EXPECT_TRUE(sctx2);

        // assignment
        sctx = sctx2; // lvalue assignment

        // equality
        EXPECT_TRUE(sctx);
        EXPECT_TRUE(sctx == sctx2);
        EXPECT_TRUE(sctx == sctx3);

        // inequality
        sctx = m_make(); // rvalue assignment
        EXPECT_TRUE(sctx != sctx2);
        EXPECT_TRUE(sctx != sctx3);

        // greater and less
        SHARED_CONTEXT sctx4;
        EXPECT_TRUE(sctx4 < sctx);
        EXPECT_TRUE(sctx4 < sctx2);
        EXPECT_TRUE(sctx > sctx4);
        EXPECT_TRUE(sctx >= sctx4);
        EXPECT_TRUE(sctx2 >= sctx3);
        EXPECT_TRUE(sctx2 <= sctx3);

        // release
        sctx3.reset();
        EXPECT_FALSE(sctx3);
        EXPECT_TRUE(sctx2);
    };

    std::function<SHARED_CONTEXT()> m_make;
};

}

TEST(simple_uikit, shared_context) {
    sut::shared_context_test<su::event>(
            "shared_context_event_test",
            []{ return su::event::make(); }).run();
    sut::shared_context_test<su::channel<int>>(
            "shared_context_channel_test",
            []{ return su::channel<int>::make(); }).run();
    sut::shared_context_test<su::cancellable_thread>(
            "shared_context_cancellable_thread_test",
            []{ return su::cancellable_thread::make([]{}); }).run();
    sut::shared_context_test<su::thread_pool>(
            "shared_context_thread_pool_test",
            []{ return su::thread_pool::make(1); }).run();
    sut::shared_context_test<su::scheduler>(
            "shared_context_scheduler_test",
            []{ return su::scheduler::make(); }).run();
}
