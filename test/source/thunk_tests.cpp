#include <functional>
#include <stdexcept>
#include <utility>

#include <ast/type.hpp>
#include <backend/concrete.hpp>
#include <eval/error.hpp>
#include <eval/hole.hpp>
#include <eval/thunk.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
TEST(thunk, forcesOnlyOnce)
{
    int runs = 0;
    thunk<int> thk {[&runs]() { return ++runs * 10; }, "counter"};
    EXPECT_FALSE(thk.is_forced());
    EXPECT_EQ(thk.force(), 10);
    EXPECT_EQ(thk.force(), 10);
    EXPECT_TRUE(thk.is_forced());
    EXPECT_EQ(runs, 1);
}

TEST(thunk, readyValueNeedsNoComputation)
{
    thunk<int> thk {std::in_place, 42};
    EXPECT_TRUE(thk.is_forced());
    EXPECT_EQ(thk.force(), 42);
}

TEST(thunk, cachesFailure)
{
    int runs = 0;
    thunk<int> thk {[&runs]() -> int
                    {
                        ++runs;
                        throw eval_error(eval_error::kind::division_by_zero, "division by 0");
                    },
                    "failing"};
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto err = eval_error_of([&thk]() { thk.force(); });
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->k, eval_error::kind::division_by_zero);
    }
    EXPECT_TRUE(thk.is_failed());
    EXPECT_EQ(runs, 1);
}

TEST(thunk, reentryIsALoop)
{
    thunk<int>* self = nullptr;
    thunk<int> thk {[&self]() { return self->force() + 1; }, "<<loop>> in self"};
    self = &thk;
    auto err = eval_error_of([&thk]() { thk.force(); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::loop);
    EXPECT_STREQ(err->what(), "<<loop>> in self");
    EXPECT_TRUE(thk.is_failed());
}

TEST(hole, readsThroughToItsTarget)
{
    const concrete sym {};
    auto* hle = sym.declare_hole<int>("xs", nullptr, "<<loop>> while evaluating xs");
    int runs = 0;
    auto* target = sym.delay<int>([&runs]() { return ++runs + 6; });
    EXPECT_FALSE(hle->is_filled());
    EXPECT_TRUE(hle->fill(target));
    hle->seal();
    EXPECT_EQ(hle->read_handle()->force(), 7);
    EXPECT_EQ(hle->read(), 7);
    EXPECT_EQ(runs, 1);
}

TEST(hole, fillsOnlyOnce)
{
    const concrete sym {};
    auto* hle = sym.declare_hole<int>("xs", nullptr, "loop");
    EXPECT_TRUE(hle->fill(sym.ready(1)));
    EXPECT_FALSE(hle->fill(sym.ready(2)));
    EXPECT_EQ(hle->read(), 1);
}

TEST(hole, readBeforeFillIsALoop)
{
    const concrete sym {};
    auto* hle = sym.declare_hole<int>("xs", nullptr, "<<loop>> while evaluating xs");
    auto err = eval_error_of([hle]() { hle->read(); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::loop);
    EXPECT_STREQ(err->what(), "<<loop>> while evaluating xs");
}

TEST(hole, readHandleSuspendsUntilFilled)
{
    const concrete sym {};
    auto* hle = sym.declare_hole<int>("xs", nullptr, "<<loop>> while evaluating xs");
    auto err = eval_error_of([hle]() { hle->read_handle()->force(); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::loop);
    EXPECT_TRUE(hle->read_handle()->is_failed());

    EXPECT_TRUE(hle->fill(sym.ready(5)));
    EXPECT_EQ(hle->read_handle()->force(), 5);
    EXPECT_TRUE(hle->read_handle()->is_forced());
}

TEST(thunk, rearmRunsTheComputationAgain)
{
    int runs = 0;
    thunk<int> thk {[&runs]() -> int
                    {
                        if (++runs == 1) {
                            throw eval_error(eval_error::kind::loop, "first");
                        }
                        return runs;
                    },
                    "retry"};
    EXPECT_TRUE(eval_error_of([&thk]() { thk.force(); }).has_value());
    thk.rearm();
    EXPECT_EQ(thk.force(), 2);
    thk.rearm();
    EXPECT_EQ(thk.force(), 2);
    EXPECT_EQ(runs, 2);
}

TEST(hole, readOfAnIncompleteDefinitionPanics)
{
    const concrete sym {};
    auto* hle = sym.declare_hole<int>("xs", mono(t_integer()), "loop");
    hle->seal();
    EXPECT_THROW(hle->read(), panic);
}
// NOLINTEND(*-magic-numbers)
