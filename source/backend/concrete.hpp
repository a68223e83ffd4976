#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend.hpp"
#include "integer_ops.hpp"

struct bit_vector final
{
    auto operator==(const bit_vector& other) const -> bool = default;

    std::uint64_t width {};
    std::uint64_t value {};
};

// Executes programs on actual bits and numbers. Words wider than 64 bits are
// not packed and stay lazy sequences of bits.
struct concrete final : lazy_backend
{
    using bit_type = bool;
    using word_type = bit_vector;
    using integer_type = std::int64_t;

    static constexpr std::string_view name = "concrete";
    static constexpr std::uint64_t max_word_width = 64;

    [[nodiscard]] auto bit_lit(bool val) const -> bit_type { return val; }

    [[nodiscard]] auto bit_as_lit(bit_type bit) const -> std::optional<bool> { return bit; }

    [[nodiscard]] auto bit_complement(bit_type bit) const -> bit_type { return !bit; }

    [[nodiscard]] auto bit_and(bit_type lhs, bit_type rhs) const -> bit_type { return lhs && rhs; }

    [[nodiscard]] auto bit_or(bit_type lhs, bit_type rhs) const -> bit_type { return lhs || rhs; }

    [[nodiscard]] auto bit_eq(bit_type lhs, bit_type rhs) const -> bit_type { return lhs == rhs; }

    [[nodiscard]] auto ite_bit(bit_type cond, bit_type lhs, bit_type rhs) const -> bit_type { return cond ? lhs : rhs; }

    [[nodiscard]] auto bit_string(bit_type bit) const -> std::string { return bit ? "True" : "False"; }

    [[nodiscard]] auto word_lit(std::uint64_t width, std::uint64_t val) const -> word_type;
    [[nodiscard]] auto word_len(const word_type& word) const -> std::uint64_t { return word.width; }
    [[nodiscard]] auto word_bit(const word_type& word, std::uint64_t index) const -> bit_type;
    [[nodiscard]] auto pack_word(const std::vector<bit_type>& bits) const -> std::optional<word_type>;
    [[nodiscard]] auto word_as_lit(const word_type& word) const -> std::optional<std::uint64_t> { return word.value; }
    [[nodiscard]] auto ite_word(bit_type cond, const word_type& lhs, const word_type& rhs) const -> word_type;
    [[nodiscard]] auto word_string(const word_type& word) const -> std::string;

    [[nodiscard]] auto integer_lit(std::int64_t val) const -> integer_type { return val; }

    [[nodiscard]] auto integer_as_lit(integer_type val) const -> std::optional<std::int64_t> { return val; }

    [[nodiscard]] auto integer_add(integer_type lhs, integer_type rhs) const -> integer_type
    {
        return checked_add(lhs, rhs);
    }

    [[nodiscard]] auto integer_sub(integer_type lhs, integer_type rhs) const -> integer_type
    {
        return checked_sub(lhs, rhs);
    }

    [[nodiscard]] auto integer_mul(integer_type lhs, integer_type rhs) const -> integer_type
    {
        return checked_mul(lhs, rhs);
    }

    [[nodiscard]] auto integer_div(integer_type lhs, integer_type rhs) const -> integer_type
    {
        return checked_div(lhs, rhs);
    }

    [[nodiscard]] auto integer_eq(integer_type lhs, integer_type rhs) const -> bit_type { return lhs == rhs; }

    [[nodiscard]] auto integer_lt(integer_type lhs, integer_type rhs) const -> bit_type { return lhs < rhs; }

    [[nodiscard]] auto ite_integer(bit_type cond, integer_type lhs, integer_type rhs) const -> integer_type
    {
        return cond ? lhs : rhs;
    }

    [[nodiscard]] auto integer_string(integer_type val) const -> std::string { return std::to_string(val); }
};
