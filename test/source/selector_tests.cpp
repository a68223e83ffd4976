#include <string>
#include <variant>
#include <vector>

#include <ast/builders.hpp>
#include <ast/selector.hpp>
#include <ast/type.hpp>
#include <backend/concrete.hpp>
#include <eval/error.hpp>
#include <eval/type_value.hpp>
#include <eval/value.hpp>
#include <eval/value_ops.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
TEST(selectors, tupleUpdate)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* triple_type = t_tuple({integer, integer, integer});
    const auto* triple = tuple({int_lit(1), int_lit(2), int_lit(3)});
    const auto* updated = update(triple_type, triple, selector::tuple_sel(1), int_lit(20));
    EXPECT_EQ(sess.show(updated), "(1, 20, 3)");
    EXPECT_EQ(sess.show(project(updated, selector::tuple_sel(1))), "20");
    EXPECT_EQ(sess.show(triple), "(1, 2, 3)");
}

TEST(selectors, recordUpdate)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* point_type = t_record({{"x", integer}, {"y", integer}});
    const auto* point = record({{"x", int_lit(1)}, {"y", int_lit(2)}});
    const auto* moved = update(point_type, point, selector::record_sel("y"), int_lit(5));
    EXPECT_EQ(sess.show(moved), "{x = 1, y = 5}");
    EXPECT_EQ(sess.show(project(moved, selector::record_sel("x"))), "1");
}

TEST(selectors, updateLeavesOtherComponentsSuspended)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pair_type = t_tuple({integer, integer});
    const auto* pair = tuple({error_expr(integer, "left"), int_lit(2)});
    EXPECT_EQ(sess.show(project(update(pair_type, pair, selector::tuple_sel(1), int_lit(7)), selector::tuple_sel(1))),
              "7");

    // the new value is not demanded by the update itself
    const auto* fixed = update(pair_type, pair, selector::tuple_sel(0), error_expr(integer, "unused"));
    EXPECT_EQ(sess.show(project(fixed, selector::tuple_sel(1))), "2");

    // neither is the container
    const auto* whole = update(pair_type, error_expr(pair_type, "whole"), selector::tuple_sel(0), int_lit(3));
    EXPECT_EQ(sess.show(project(whole, selector::tuple_sel(0))), "3");
    auto err = eval_error_of([&]() { (void)sess.show(project(whole, selector::tuple_sel(1))); });
    ASSERT_TRUE(err.has_value());
    EXPECT_STREQ(err->what(), "whole");
}

TEST(selectors, sequenceUpdate)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* xs = list({int_lit(1), int_lit(2), int_lit(3)}, integer);
    const auto* updated = update(t_seq(t_num(3), integer), xs, selector::list_sel(0), int_lit(10));
    EXPECT_EQ(sess.show(updated), "[10, 2, 3]");
    EXPECT_EQ(sess.show(project(updated, selector::list_sel(2))), "3");

    const auto* nats = app(tapp(var("infFrom"), {integer}), {int_lit(0)});
    const auto* patched = update(t_stream(integer), nats, selector::list_sel(2), int_lit(99));
    EXPECT_EQ(sess.show(patched), "[0, 1, 99, 3, 4, ...]");
}

TEST(selectors, bitsOfAWord)
{
    const session<concrete> sess;
    const auto* byte = num_lit(0b10010000, t_word(8));
    EXPECT_TRUE(std::holds_alternative<generic_value<concrete>::word>(sess.run(byte).data));
    EXPECT_EQ(sess.show(project(byte, selector::list_sel(0))), "True");
    EXPECT_EQ(sess.show(project(byte, selector::list_sel(1))), "False");
    EXPECT_EQ(sess.show(project(byte, selector::list_sel(3))), "True");

    const auto* flipped = update(t_word(8), byte, selector::list_sel(7), bit_lit(true));
    EXPECT_EQ(sess.show(project(flipped, selector::list_sel(7))), "True");
    EXPECT_EQ(sess.show(project(flipped, selector::list_sel(0))), "True");
}

TEST(selectors, selectReturnsTheStoredSuspension)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto val = sess.run(tuple({int_lit(1), error_expr(integer, "second")}));
    auto* second = sess.eval().eval_sel(val, selector::tuple_sel(1));
    EXPECT_FALSE(second->is_forced());
    EXPECT_EQ(second, from_tuple(val)[1]);
}

TEST(selectors, mismatchedSelectionsPanic)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pair = tuple({int_lit(1), int_lit(2)});
    EXPECT_THROW((void)sess.run(project(pair, selector::tuple_sel(2))), panic);
    EXPECT_THROW((void)sess.run(project(pair, selector::record_sel("x"))), panic);
    EXPECT_THROW((void)sess.run(project(list({int_lit(1)}, integer), selector::list_sel(1))), panic);
    EXPECT_THROW((void)sess.run(update(t_record({{"x", integer}}), pair, selector::record_sel("y"), int_lit(1))),
                 panic);
    EXPECT_THROW((void)sess.run(update(integer, int_lit(1), selector::tuple_sel(0), int_lit(1))), panic);
}

TEST(selectors, shapeAnnotationsMustMatchTheContainer)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pair = tuple({int_lit(1), int_lit(2)});
    const auto* point = record({{"x", int_lit(1)}, {"y", int_lit(2)}});
    const auto* xs = list({int_lit(1), int_lit(2), int_lit(3)}, integer);
    const std::vector<std::string> point_fields {"y", "x"};

    EXPECT_EQ(sess.show(project(pair, selector::tuple_sel(1, 2))), "2");
    EXPECT_EQ(sess.show(project(point, selector::record_sel("y", point_fields))), "2");
    EXPECT_EQ(sess.show(project(xs, selector::list_sel(2, 3))), "3");
    EXPECT_EQ(sess.show(project(num_lit(1, t_word(4)), selector::list_sel(3, 4))), "True");

    EXPECT_THROW((void)sess.run(project(pair, selector::tuple_sel(0, 3))), panic);
    EXPECT_THROW((void)sess.run(project(point, selector::record_sel("x", std::vector<std::string> {"x", "z"}))), panic);
    EXPECT_THROW((void)sess.run(project(xs, selector::list_sel(0, 5))), panic);
    EXPECT_THROW((void)sess.run(project(num_lit(1, t_word(4)), selector::list_sel(0, 8))), panic);
    EXPECT_THROW((void)sess.run(update(t_tuple({integer, integer}), pair, selector::tuple_sel(0, 3), int_lit(5))), panic);
}
// NOLINTEND(*-magic-numbers)
