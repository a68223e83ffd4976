#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend.hpp"

// Node of a symbolic term graph. Bit- and integer-valued terms share the node
// type; the operator tells them apart.
struct sym_term final
{
    enum class op : std::uint8_t
    {
        bit_const,
        bit_var,
        bit_not,
        bit_and,
        bit_or,
        bit_xor,
        bit_ite,
        int_const,
        int_var,
        int_add,
        int_sub,
        int_mul,
        int_div,
        int_eq,
        int_lt,
        int_ite,
    };

    [[nodiscard]] auto string() const -> std::string;
    [[nodiscard]] auto is_const() const -> bool { return o == op::bit_const || o == op::int_const; }

    op o {};
    std::int64_t literal {};
    std::string name;
    std::vector<const sym_term*> args;
};

struct sym_word final
{
    std::vector<const sym_term*> bits;
};

// Builds terms instead of computing results whenever an operand is not a
// literal. Constants are folded eagerly, so fully concrete inputs still yield
// literal results.
struct symbolic final : lazy_backend
{
    using bit_type = const sym_term*;
    using word_type = sym_word;
    using integer_type = const sym_term*;

    static constexpr std::string_view name = "symbolic";

    [[nodiscard]] auto fresh_bit(std::string var) const -> bit_type;
    [[nodiscard]] auto fresh_word(const std::string& var, std::uint64_t width) const -> word_type;
    [[nodiscard]] auto fresh_integer(std::string var) const -> integer_type;

    [[nodiscard]] auto bit_lit(bool val) const -> bit_type;
    [[nodiscard]] auto bit_as_lit(bit_type bit) const -> std::optional<bool>;
    [[nodiscard]] auto bit_complement(bit_type bit) const -> bit_type;
    [[nodiscard]] auto bit_and(bit_type lhs, bit_type rhs) const -> bit_type;
    [[nodiscard]] auto bit_or(bit_type lhs, bit_type rhs) const -> bit_type;
    [[nodiscard]] auto bit_eq(bit_type lhs, bit_type rhs) const -> bit_type;
    [[nodiscard]] auto ite_bit(bit_type cond, bit_type lhs, bit_type rhs) const -> bit_type;
    [[nodiscard]] auto bit_string(bit_type bit) const -> std::string { return bit->string(); }

    [[nodiscard]] auto word_lit(std::uint64_t width, std::uint64_t val) const -> word_type;
    [[nodiscard]] auto word_len(const word_type& word) const -> std::uint64_t { return word.bits.size(); }
    [[nodiscard]] auto word_bit(const word_type& word, std::uint64_t index) const -> bit_type;
    [[nodiscard]] auto pack_word(const std::vector<bit_type>& bits) const -> std::optional<word_type>;
    [[nodiscard]] auto word_as_lit(const word_type& word) const -> std::optional<std::uint64_t>;
    [[nodiscard]] auto ite_word(bit_type cond, const word_type& lhs, const word_type& rhs) const -> word_type;
    [[nodiscard]] auto word_string(const word_type& word) const -> std::string;

    [[nodiscard]] auto integer_lit(std::int64_t val) const -> integer_type;
    [[nodiscard]] auto integer_as_lit(integer_type val) const -> std::optional<std::int64_t>;
    [[nodiscard]] auto integer_add(integer_type lhs, integer_type rhs) const -> integer_type;
    [[nodiscard]] auto integer_sub(integer_type lhs, integer_type rhs) const -> integer_type;
    [[nodiscard]] auto integer_mul(integer_type lhs, integer_type rhs) const -> integer_type;
    [[nodiscard]] auto integer_div(integer_type lhs, integer_type rhs) const -> integer_type;
    [[nodiscard]] auto integer_eq(integer_type lhs, integer_type rhs) const -> bit_type;
    [[nodiscard]] auto integer_lt(integer_type lhs, integer_type rhs) const -> bit_type;
    [[nodiscard]] auto ite_integer(bit_type cond, integer_type lhs, integer_type rhs) const -> integer_type;
    [[nodiscard]] auto integer_string(integer_type val) const -> std::string { return val->string(); }
};
