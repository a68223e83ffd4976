#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

#include <ast/builders.hpp>
#include <ast/comprehension.hpp>
#include <ast/declaration.hpp>
#include <ast/type.hpp>
#include <backend/concrete.hpp>
#include <eval/error.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

namespace
{
auto ints(std::initializer_list<std::uint64_t> nums) -> const expression*
{
    std::vector<const expression*> elems;
    for (const auto num : nums) {
        elems.push_back(int_lit(num));
    }
    return list(std::move(elems), t_integer());
}

auto nats_from(std::uint64_t first) -> const expression*
{
    return app(tapp(var("infFrom"), {t_integer()}), {int_lit(first)});
}
}  // namespace

// NOLINTBEGIN(*-magic-numbers)
TEST(comprehensions, innermostBinderVariesFastest)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pairs = comprehension(t_num(6),
                                      t_tuple({integer, integer}),
                                      tuple({var("x"), var("y")}),
                                      {{from("x", t_num(3), integer, ints({1, 2, 3})),
                                        from("y", t_num(2), integer, ints({10, 20}))}});
    EXPECT_EQ(sess.show(pairs), "[(1, 10), (1, 20), (2, 10), (2, 20), (3, 10), (3, 20)]");
}

TEST(comprehensions, parallelBranchesZip)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* zipped = comprehension(t_num(3),
                                       t_tuple({integer, integer}),
                                       tuple({var("x"), var("y")}),
                                       {{from("x", t_num(3), integer, ints({1, 2, 3}))},
                                        {from("y", t_num(3), integer, ints({10, 20, 30}))}});
    EXPECT_EQ(sess.show(zipped), "[(1, 10), (2, 20), (3, 30)]");
}

TEST(comprehensions, sourcesSeeEarlierBinders)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(
        t_num(4),
        integer,
        var("y"),
        {{from("x", t_num(2), integer, ints({1, 2})),
          from("y", t_num(2), integer, list({var("x"), binop("*", integer, var("x"), int_lit(10))}, integer))}});
    EXPECT_EQ(sess.show(expr), "[1, 10, 2, 20]");
}

TEST(comprehensions, letMatches)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(
        t_num(3),
        integer,
        binop("+", integer, var("z"), var("x")),
        {{from("x", t_num(3), integer, ints({1, 2, 3})),
          let(make_decl("z", mono(integer), binop("*", integer, var("x"), int_lit(10))))}});
    EXPECT_EQ(sess.show(expr), "[11, 22, 33]");
}

TEST(comprehensions, infiniteSource)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* squares = comprehension(
        t_inf(), integer, binop("*", integer, var("x"), var("x")), {{from("x", t_inf(), integer, nats_from(1))}});
    EXPECT_EQ(sess.show(squares), "[1, 4, 9, 16, 25, ...]");
    EXPECT_EQ(sess.show(project(squares, selector::list_sel(99))), "10000");
}

TEST(comprehensions, finiteInnerBinderOverInfiniteOuter)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(t_inf(),
                                     integer,
                                     var("x"),
                                     {{from("x", t_inf(), integer, nats_from(1)),
                                       from("y", t_num(2), integer, ints({10, 20}))}});
    EXPECT_EQ(sess.show(expr), "[1, 1, 2, 2, 3, ...]");
}

TEST(comprehensions, infiniteInnerBinderFixesOuterOnes)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(t_inf(),
                                     t_tuple({integer, integer}),
                                     tuple({var("y"), var("x")}),
                                     {{from("y", t_num(2), integer, ints({10, 20})),
                                       from("x", t_inf(), integer, nats_from(1))}});
    EXPECT_EQ(sess.show(expr), "[(10, 1), (10, 2), (10, 3), (10, 4), (10, 5), ...]");
}

TEST(comprehensions, emptySource)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(
        t_num(0), integer, var("x"), {{from("x", t_num(0), integer, list({}, integer))}});
    EXPECT_EQ(sess.show(expr), "[]");
    EXPECT_THROW((void)sess.run(project(expr, selector::list_sel(0))), panic);
}

TEST(comprehensions, emptySourceFollowedByOtherSources)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pair_type = t_tuple({integer, integer});
    const auto* pair = tuple({var("x"), var("y")});
    const auto* empty = list({}, integer);

    const auto* then_infinite = comprehension(
        t_num(0), pair_type, pair, {{from("x", t_num(0), integer, empty), from("y", t_inf(), integer, nats_from(1))}});
    EXPECT_EQ(sess.show(then_infinite), "[]");

    const auto* then_finite = comprehension(
        t_num(0), pair_type, pair, {{from("x", t_num(0), integer, empty), from("y", t_num(2), integer, ints({10, 20}))}});
    EXPECT_EQ(sess.show(then_finite), "[]");
}

TEST(comprehensions, elementsAreEvaluatedOnDemand)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = comprehension(
        t_num(3),
        integer,
        cond(integer, binop("==", integer, var("x"), int_lit(2)), error_expr(integer, "two"), var("x")),
        {{from("x", t_num(3), integer, ints({1, 2, 3}))}});
    EXPECT_EQ(sess.show(project(expr, selector::list_sel(0))), "1");
    EXPECT_EQ(sess.show(project(expr, selector::list_sel(2))), "3");

    auto err = eval_error_of([&]() { (void)sess.show(expr); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::user);
    EXPECT_STREQ(err->what(), "two");
}
// NOLINTEND(*-magic-numbers)
