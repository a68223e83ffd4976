#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "symbolic.hpp"

#include <eval/error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>

#include "integer_ops.hpp"

namespace
{
using enum sym_term::op;

auto make_term(sym_term::op oper, std::vector<const sym_term*> args = {}) -> const sym_term*
{
    auto* term = make<sym_term>();
    term->o = oper;
    term->args = std::move(args);
    return term;
}

auto make_const(sym_term::op oper, std::int64_t literal) -> const sym_term*
{
    auto* term = make<sym_term>();
    term->o = oper;
    term->literal = literal;
    return term;
}

auto make_var(sym_term::op oper, std::string name) -> const sym_term*
{
    auto* term = make<sym_term>();
    term->o = oper;
    term->name = std::move(name);
    return term;
}

auto operator_name(sym_term::op oper) -> std::string_view
{
    switch (oper) {
        case bit_not:
            return "not";
        case bit_and:
            return "and";
        case bit_or:
            return "or";
        case bit_xor:
            return "xor";
        case bit_ite:
        case int_ite:
            return "ite";
        case int_add:
            return "+";
        case int_sub:
            return "-";
        case int_mul:
            return "*";
        case int_div:
            return "/";
        case int_eq:
            return "==";
        case int_lt:
            return "<";
        default:
            return "?";
    }
}

auto same_literal(const sym_term* lhs, const sym_term* rhs) -> bool
{
    return lhs == rhs || (lhs->is_const() && rhs->is_const() && lhs->o == rhs->o && lhs->literal == rhs->literal);
}
}  // namespace

auto sym_term::string() const -> std::string
{
    switch (o) {
        case bit_const:
            return literal != 0 ? "True" : "False";
        case int_const:
            return std::to_string(literal);
        case bit_var:
        case int_var:
            return name;
        default: {
            std::vector<std::string> strs;
            for (const auto* arg : args) {
                strs.push_back(arg->string());
            }
            return fmt::format("({} {})", operator_name(o), fmt::join(strs, " "));
        }
    }
}

auto symbolic::fresh_bit(std::string var) const -> bit_type
{
    return make_var(bit_var, std::move(var));
}

auto symbolic::fresh_word(const std::string& var, std::uint64_t width) const -> word_type
{
    sym_word word;
    for (std::uint64_t idx = 0; idx < width; ++idx) {
        word.bits.push_back(make_var(bit_var, fmt::format("{}_{}", var, idx)));
    }
    return word;
}

auto symbolic::fresh_integer(std::string var) const -> integer_type
{
    return make_var(int_var, std::move(var));
}

auto symbolic::bit_lit(bool val) const -> bit_type
{
    return make_const(bit_const, val ? 1 : 0);
}

auto symbolic::bit_as_lit(bit_type bit) const -> std::optional<bool>
{
    if (bit->o == bit_const) {
        return bit->literal != 0;
    }
    return std::nullopt;
}

auto symbolic::bit_complement(bit_type bit) const -> bit_type
{
    if (auto lit = bit_as_lit(bit)) {
        return bit_lit(!*lit);
    }
    if (bit->o == bit_not) {
        return bit->args[0];
    }
    return make_term(bit_not, {bit});
}

auto symbolic::bit_and(bit_type lhs, bit_type rhs) const -> bit_type
{
    if (auto lit = bit_as_lit(lhs)) {
        return *lit ? rhs : lhs;
    }
    if (auto lit = bit_as_lit(rhs)) {
        return *lit ? lhs : rhs;
    }
    if (lhs == rhs) {
        return lhs;
    }
    return make_term(sym_term::op::bit_and, {lhs, rhs});
}

auto symbolic::bit_or(bit_type lhs, bit_type rhs) const -> bit_type
{
    if (auto lit = bit_as_lit(lhs)) {
        return *lit ? lhs : rhs;
    }
    if (auto lit = bit_as_lit(rhs)) {
        return *lit ? rhs : lhs;
    }
    if (lhs == rhs) {
        return lhs;
    }
    return make_term(sym_term::op::bit_or, {lhs, rhs});
}

auto symbolic::bit_eq(bit_type lhs, bit_type rhs) const -> bit_type
{
    if (same_literal(lhs, rhs)) {
        return bit_lit(true);
    }
    auto lhs_lit = bit_as_lit(lhs);
    auto rhs_lit = bit_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return bit_lit(*lhs_lit == *rhs_lit);
    }
    if (lhs_lit) {
        return *lhs_lit ? rhs : bit_complement(rhs);
    }
    if (rhs_lit) {
        return *rhs_lit ? lhs : bit_complement(lhs);
    }
    return bit_complement(make_term(bit_xor, {lhs, rhs}));
}

auto symbolic::ite_bit(bit_type cond, bit_type lhs, bit_type rhs) const -> bit_type
{
    if (auto lit = bit_as_lit(cond)) {
        return *lit ? lhs : rhs;
    }
    if (same_literal(lhs, rhs)) {
        return lhs;
    }
    auto lhs_lit = bit_as_lit(lhs);
    auto rhs_lit = bit_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return *lhs_lit ? cond : bit_complement(cond);
    }
    return make_term(bit_ite, {cond, lhs, rhs});
}

auto symbolic::word_lit(std::uint64_t width, std::uint64_t val) const -> word_type
{
    sym_word word;
    for (std::uint64_t idx = 0; idx < width; ++idx) {
        const auto shift = width - 1 - idx;
        word.bits.push_back(bit_lit(shift < 64 && ((val >> shift) & 1U) != 0));
    }
    return word;
}

auto symbolic::word_bit(const word_type& word, std::uint64_t index) const -> bit_type
{
    if (index >= word.bits.size()) {
        throw_eval_error(
            eval_error::kind::invalid_index, "index {} out of bounds for word of width {}", index, word.bits.size());
    }
    return word.bits[index];
}

auto symbolic::pack_word(const std::vector<bit_type>& bits) const -> std::optional<word_type>
{
    return sym_word {bits};
}

auto symbolic::word_as_lit(const word_type& word) const -> std::optional<std::uint64_t>
{
    if (word.bits.size() > 64) {
        return std::nullopt;
    }
    std::uint64_t value {};
    for (const auto* bit : word.bits) {
        auto lit = bit_as_lit(bit);
        if (!lit) {
            return std::nullopt;
        }
        value = (value << 1U) | (*lit ? 1U : 0U);
    }
    return value;
}

auto symbolic::ite_word(bit_type cond, const word_type& lhs, const word_type& rhs) const -> word_type
{
    if (lhs.bits.size() != rhs.bits.size()) {
        eval_panic("symbolic::ite_word",
                   {fmt::format("word widths differ: {} and {}", lhs.bits.size(), rhs.bits.size())});
    }
    sym_word word;
    for (auto idx = 0UL; idx < lhs.bits.size(); ++idx) {
        word.bits.push_back(ite_bit(cond, lhs.bits[idx], rhs.bits[idx]));
    }
    return word;
}

auto symbolic::word_string(const word_type& word) const -> std::string
{
    if (auto lit = word_as_lit(word)) {
        return fmt::format("0x{:x}", *lit);
    }
    std::vector<std::string> strs;
    for (const auto* bit : word.bits) {
        strs.push_back(bit->string());
    }
    return fmt::format("[{}]", fmt::join(strs, ", "));
}

auto symbolic::integer_lit(std::int64_t val) const -> integer_type
{
    return make_const(int_const, val);
}

auto symbolic::integer_as_lit(integer_type val) const -> std::optional<std::int64_t>
{
    if (val->o == int_const) {
        return val->literal;
    }
    return std::nullopt;
}

auto symbolic::integer_add(integer_type lhs, integer_type rhs) const -> integer_type
{
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return integer_lit(checked_add(*lhs_lit, *rhs_lit));
    }
    if (lhs_lit == std::optional<std::int64_t> {0}) {
        return rhs;
    }
    if (rhs_lit == std::optional<std::int64_t> {0}) {
        return lhs;
    }
    return make_term(int_add, {lhs, rhs});
}

auto symbolic::integer_sub(integer_type lhs, integer_type rhs) const -> integer_type
{
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return integer_lit(checked_sub(*lhs_lit, *rhs_lit));
    }
    if (rhs_lit == std::optional<std::int64_t> {0}) {
        return lhs;
    }
    return make_term(int_sub, {lhs, rhs});
}

auto symbolic::integer_mul(integer_type lhs, integer_type rhs) const -> integer_type
{
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return integer_lit(checked_mul(*lhs_lit, *rhs_lit));
    }
    if (lhs_lit == std::optional<std::int64_t> {1}) {
        return rhs;
    }
    if (rhs_lit == std::optional<std::int64_t> {1}) {
        return lhs;
    }
    return make_term(int_mul, {lhs, rhs});
}

auto symbolic::integer_div(integer_type lhs, integer_type rhs) const -> integer_type
{
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (rhs_lit == std::optional<std::int64_t> {0}) {
        throw_eval_error(eval_error::kind::division_by_zero, "division by 0");
    }
    if (lhs_lit && rhs_lit) {
        return integer_lit(checked_div(*lhs_lit, *rhs_lit));
    }
    return make_term(int_div, {lhs, rhs});
}

auto symbolic::integer_eq(integer_type lhs, integer_type rhs) const -> bit_type
{
    if (same_literal(lhs, rhs)) {
        return bit_lit(true);
    }
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return bit_lit(*lhs_lit == *rhs_lit);
    }
    return make_term(int_eq, {lhs, rhs});
}

auto symbolic::integer_lt(integer_type lhs, integer_type rhs) const -> bit_type
{
    auto lhs_lit = integer_as_lit(lhs);
    auto rhs_lit = integer_as_lit(rhs);
    if (lhs_lit && rhs_lit) {
        return bit_lit(*lhs_lit < *rhs_lit);
    }
    if (lhs == rhs) {
        return bit_lit(false);
    }
    return make_term(int_lt, {lhs, rhs});
}

auto symbolic::ite_integer(bit_type cond, integer_type lhs, integer_type rhs) const -> integer_type
{
    if (auto lit = bit_as_lit(cond)) {
        return *lit ? lhs : rhs;
    }
    if (same_literal(lhs, rhs)) {
        return lhs;
    }
    return make_term(int_ite, {cond, lhs, rhs});
}
