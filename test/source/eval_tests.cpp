#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

#include <ast/builders.hpp>
#include <ast/type.hpp>
#include <ast/type_abstraction.hpp>
#include <backend/concrete.hpp>
#include <eval/environment.hpp>
#include <eval/error.hpp>
#include <eval/nat.hpp>
#include <eval/type_value.hpp>
#include <eval/value.hpp>
#include <eval/value_ops.hpp>
#include <gc.hpp>
#include <gtest/gtest.h>

#include "testutils.hpp"

using value_type = generic_value<concrete>;

// NOLINTBEGIN(*-magic-numbers)
TEST(eval, integerArithmetic)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    struct arith_test
    {
        const expression* expr;
        std::string expected;
    };
    std::array tests {
        arith_test {int_lit(5), "5"},
        arith_test {binop("+", integer, int_lit(2), int_lit(3)), "5"},
        arith_test {binop("-", integer, int_lit(2), int_lit(3)), "-1"},
        arith_test {binop("*", integer, int_lit(6), binop("+", integer, int_lit(3), int_lit(4))), "42"},
        arith_test {binop("/", integer, int_lit(50), int_lit(7)), "7"},
        arith_test {binop("==", integer, int_lit(5), int_lit(5)), "True"},
        arith_test {binop("<", integer, int_lit(5), int_lit(5)), "False"},
    };
    for (const auto& [expr, expected] : tests) {
        EXPECT_EQ(sess.show(expr), expected) << expr->string();
    }
}

TEST(eval, divisionByZero)
{
    const session<concrete> sess;
    auto err = eval_error_of([&sess]()
                             { (void)sess.run(binop("/", t_integer(), int_lit(1), int_lit(0))); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::division_by_zero);
}

TEST(eval, integerOverflow)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto largest = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    const auto* smallest = binop("-", integer, binop("-", integer, int_lit(0), int_lit(largest)), int_lit(1));
    EXPECT_EQ(sess.show(smallest), "-9223372036854775808");

    const auto* minus_one = binop("-", integer, int_lit(0), int_lit(1));
    for (const auto* expr : {binop("+", integer, int_lit(largest), int_lit(1)),
                             binop("-", integer, smallest, int_lit(1)),
                             binop("*", integer, int_lit(1ULL << 32U), int_lit(1ULL << 32U)),
                             binop("/", integer, smallest, minus_one)})
    {
        auto err = eval_error_of([&sess, expr]() { (void)sess.show(expr); });
        ASSERT_TRUE(err.has_value()) << expr->string();
        EXPECT_EQ(err->k, eval_error::kind::overflow) << expr->string();
    }
}

TEST(eval, literalsOutOfRange)
{
    const session<concrete> sess;
    const auto huge = (1ULL << 63U) + 1;
    auto err = eval_error_of([&sess, huge]() { (void)sess.show(int_lit(huge)); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::unsupported);

    err = eval_error_of([&sess, huge]() { (void)sess.show(num_lit(huge, t_bit())); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::unsupported);

    EXPECT_EQ(sess.show(num_lit(~0ULL, t_word(64))), "0xffffffffffffffff");

    const auto largest = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(sess.show(tapp(var("fromTo"), {t_num(largest - 1), t_num(largest), t_integer()})),
              "[9223372036854775806, 9223372036854775807]");
}

TEST(eval, wordLiterals)
{
    const session<concrete> sess;
    EXPECT_TRUE(std::holds_alternative<value_type::word>(sess.run(num_lit(5, t_word(8))).data));
    EXPECT_EQ(sess.show(num_lit(5, t_word(8))), "0x5");
    EXPECT_EQ(sess.show(num_lit(0xff, t_word(4))), "0xf");
    EXPECT_EQ(sess.show(str_lit("hi")), "[0x68, 0x69]");
}

TEST(eval, bitListsOfEvaluatedBitsArePacked)
{
    const session<concrete> sess;
    const auto packed = sess.run(list({bit_lit(true), bit_lit(false), bit_lit(true), bit_lit(true)}, t_bit()));
    const auto& seq = std::get<value_type::seq>(packed.data);
    ASSERT_TRUE(seq.values.packed_word().has_value());
    EXPECT_EQ(seq.values.packed_word()->value, 0b1011U);
    EXPECT_EQ(inspect(sess.sym(), packed), "0xb");

    const auto lazy = sess.run(list({bit_lit(true), app(var("complement"), {bit_lit(true)})}, t_bit()));
    EXPECT_FALSE(std::get<value_type::seq>(lazy.data).values.packed_word().has_value());
    EXPECT_EQ(inspect(sess.sym(), lazy), "0x2");

    const auto* flipped = update(t_word(4), num_lit(0b1011, t_word(4)), selector::list_sel(3), bit_lit(false));
    EXPECT_EQ(sess.show(flipped), "0xa");
}

TEST(eval, aggregatesAreLazyInTheirComponents)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* pair = tuple({int_lit(1), error_expr(integer, "never")});
    EXPECT_EQ(sess.show(project(pair, selector::tuple_sel(0))), "1");

    const auto* rec = record({{"ok", int_lit(2)}, {"bad", error_expr(integer, "nope")}});
    EXPECT_EQ(sess.show(project(rec, selector::record_sel("ok"))), "2");

    auto err = eval_error_of([&]() { (void)sess.show(project(rec, selector::record_sel("bad"))); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::user);
    EXPECT_STREQ(err->what(), "nope");
}

TEST(eval, recordsRenderInCanonicalOrder)
{
    const session<concrete> sess;
    EXPECT_EQ(sess.show(record({{"y", int_lit(2)}, {"x", int_lit(1)}})), "{x = 1, y = 2}");
    EXPECT_EQ(sess.show(tuple({int_lit(1), bit_lit(false)})), "(1, False)");
}

TEST(eval, conditionals)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    EXPECT_EQ(sess.show(cond(integer, bit_lit(true), int_lit(1), error_expr(integer, "else"))), "1");
    EXPECT_EQ(sess.show(cond(integer, bit_lit(false), error_expr(integer, "then"), int_lit(2))), "2");

    auto err = eval_error_of(
        [&]() { (void)sess.run(cond(integer, error_expr(t_bit(), "cond"), int_lit(1), int_lit(2))); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::user);
}

TEST(eval, functionApplication)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* square = lam("n", integer, binop("*", integer, var("n"), var("n")));
    EXPECT_EQ(sess.show(app(square, {int_lit(7)})), "49");

    const auto* konst = lam("a", integer, lam("b", integer, var("a")));
    EXPECT_EQ(sess.show(app(konst, {int_lit(3), error_expr(integer, "unused")})), "3");
    EXPECT_EQ(sess.show(konst), "<function>");
}

TEST(eval, argumentsAreEvaluatedAtMostOnce)
{
    session<concrete> sess;
    int forced = 0;
    const auto& sym = sess.sym();
    sess.bind_lazy("probe",
                   delay_value(sym,
                               [&sym, &forced]()
                               {
                                   ++forced;
                                   return make_integer<concrete>(sym.integer_lit(21));
                               }));
    const auto* integer = t_integer();
    const auto* twice = lam("x", integer, binop("+", integer, var("x"), var("x")));
    EXPECT_EQ(sess.show(app(twice, {var("probe")})), "42");
    EXPECT_EQ(forced, 1);
}

TEST(eval, typeAbstraction)
{
    const session<concrete> sess;
    const auto* ident = tabs("a", type_kind::type, lam("x", t_var("a"), var("x")));
    EXPECT_EQ(sess.show(app(tapp(ident, {t_integer()}), {int_lit(3)})), "3");
    EXPECT_EQ(sess.show(ident), "<polymorphic value>");

    const auto* width = tabs("n", type_kind::num, tapp(var("number"), {t_var("n"), t_integer()}));
    EXPECT_EQ(sess.show(tapp(width, {t_num(12)})), "12");

    const auto* zeros = tabs("n", type_kind::num, num_lit(0, t_seq(t_var("n"), t_bit())));
    EXPECT_EQ(sess.show(tapp(zeros, {t_num(3)})), "0x0");
}

TEST(eval, proofsHaveNoRuntimeEffect)
{
    const session<concrete> sess;
    const auto* proof = make<proof_application>(make<proof_abstraction>(t_var("p"), int_lit(3)));
    EXPECT_EQ(sess.show(proof), "3");
}

TEST(eval, whereBindings)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto* expr = where(binop("+", integer, var("a"), var("b")),
                             {
                                 non_recursive(make_decl("a", mono(integer), int_lit(1))),
                                 non_recursive(make_decl("b", mono(integer), binop("*", integer, var("a"), int_lit(10)))),
                             });
    EXPECT_EQ(sess.show(expr), "11");
}

TEST(eval, sequencePrimitives)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    EXPECT_EQ(sess.show(app(tapp(var("infFrom"), {integer}), {int_lit(3)})), "[3, 4, 5, 6, 7, ...]");
    EXPECT_EQ(sess.show(tapp(var("fromTo"), {t_num(2), t_num(4), integer})), "[2, 3, 4]");
    EXPECT_EQ(sess.show(project(app(tapp(var("infFrom"), {integer}), {int_lit(3)}), selector::list_sel(1000))),
              "1003");
}

TEST(eval, errorPrimitiveYieldsAPlaceholder)
{
    const session<concrete> sess;
    const auto val = sess.run(error_expr(t_integer(), "boom"));
    ASSERT_TRUE(is_error(val));
    auto err = eval_error_of([&]() { (void)from_integer(val); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::user);
    EXPECT_STREQ(err->what(), "boom");
}

TEST(eval, shortCircuitOperators)
{
    const session<concrete> sess;
    const auto* bit = t_bit();
    EXPECT_EQ(sess.show(app(var("&&"), {bit_lit(false), error_expr(bit, "rhs")})), "False");
    EXPECT_EQ(sess.show(app(var("||"), {bit_lit(true), error_expr(bit, "rhs")})), "True");
    EXPECT_EQ(sess.show(app(var("||"), {bit_lit(false), bit_lit(true)})), "True");
}

TEST(eval, structuralEquality)
{
    const session<concrete> sess;
    const auto* pair_type = t_tuple({t_integer(), t_bit()});
    const auto* lhs = tuple({int_lit(1), bit_lit(true)});
    const auto* rhs = tuple({int_lit(1), bit_lit(false)});
    EXPECT_EQ(sess.show(binop("==", pair_type, lhs, lhs)), "True");
    EXPECT_EQ(sess.show(binop("==", pair_type, lhs, rhs)), "False");
    EXPECT_EQ(sess.show(binop("==", t_word(8), num_lit(7, t_word(8)), num_lit(7, t_word(8)))), "True");
}

TEST(eval, unsupportedInstances)
{
    const session<concrete> sess;
    auto err = eval_error_of([&]() { (void)sess.run(binop("+", t_bit(), bit_lit(true), bit_lit(true))); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->k, eval_error::kind::unsupported);
}

TEST(eval, brokenInvariantsPanic)
{
    const session<concrete> sess;
    EXPECT_THROW((void)sess.run(var("nowhere")), panic);
    EXPECT_THROW((void)sess.run(app(int_lit(1), {int_lit(2)})), panic);
    EXPECT_THROW((void)sess.run(tapp(int_lit(1), {t_integer()})), panic);
    EXPECT_THROW((void)sess.run(tabs("p", type_kind::prop, int_lit(1))), panic);
}

TEST(eval, forcingAValueCompletely)
{
    const session<concrete> sess;
    const auto* integer = t_integer();
    const auto fine = sess.run(tuple({int_lit(1), record({{"x", list({int_lit(2)}, integer)}})}));
    EXPECT_NO_THROW(force_value(sess.sym(), fine));

    const auto broken = sess.run(tuple({int_lit(1), list({int_lit(2), error_expr(integer, "deep")}, integer)}));
    auto err = eval_error_of([&]() { force_value(sess.sym(), broken); });
    ASSERT_TRUE(err.has_value());
    EXPECT_STREQ(err->what(), "deep");

    const auto stream = sess.run(app(tapp(var("infFrom"), {integer}), {int_lit(0)}));
    EXPECT_NO_THROW(force_value(sess.sym(), stream));
}

TEST(environment, typeBindingsAreScoped)
{
    const auto* outer = environment<concrete>::empty()->bind_type("a", tvalue::integer());
    const auto* inner = outer->bind_type("n", nat::finite(3))->bind_type("a", tvalue::bit());
    ASSERT_NE(inner->lookup_type("a"), nullptr);
    EXPECT_EQ(std::get<tvalue>(*inner->lookup_type("a")), tvalue::bit());
    EXPECT_EQ(std::get<nat>(*inner->lookup_type("n")), nat::finite(3));
    EXPECT_EQ(std::get<tvalue>(*outer->lookup_type("a")), tvalue::integer());
    EXPECT_EQ(outer->lookup_type("n"), nullptr);
}
// NOLINTEND(*-magic-numbers)
