#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "concrete.hpp"

#include <eval/error.hpp>
#include <fmt/format.h>

namespace
{
auto mask(std::uint64_t width) -> std::uint64_t
{
    return width >= concrete::max_word_width ? ~std::uint64_t {0} : (std::uint64_t {1} << width) - 1;
}
}  // namespace

auto concrete::word_lit(std::uint64_t width, std::uint64_t val) const -> word_type
{
    if (width > max_word_width) {
        throw_eval_error(eval_error::kind::unsupported, "word literal of width {} exceeds {} bits", width, max_word_width);
    }
    return bit_vector {.width = width, .value = val & mask(width)};
}

auto concrete::word_bit(const word_type& word, std::uint64_t index) const -> bit_type
{
    if (index >= word.width) {
        throw_eval_error(eval_error::kind::invalid_index, "index {} out of bounds for word of width {}", index, word.width);
    }
    return ((word.value >> (word.width - 1 - index)) & 1U) != 0;
}

auto concrete::pack_word(const std::vector<bit_type>& bits) const -> std::optional<word_type>
{
    if (bits.size() > max_word_width) {
        return std::nullopt;
    }
    std::uint64_t value {};
    for (const auto bit : bits) {
        value = (value << 1U) | (bit ? 1U : 0U);
    }
    return bit_vector {.width = bits.size(), .value = value};
}

auto concrete::ite_word(bit_type cond, const word_type& lhs, const word_type& rhs) const -> word_type
{
    return cond ? lhs : rhs;
}

auto concrete::word_string(const word_type& word) const -> std::string
{
    return fmt::format("0x{:x}", word.value);
}
