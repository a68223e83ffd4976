#include <cstdint>
#include <limits>
#include <string_view>

#include "integer_ops.hpp"

#include <eval/error.hpp>

namespace
{
[[noreturn]] void overflow(std::int64_t lhs, std::string_view oper, std::int64_t rhs)
{
    throw_eval_error(eval_error::kind::overflow, "integer overflow: {} {} {}", lhs, oper, rhs);
}
}  // namespace

auto checked_add(std::int64_t lhs, std::int64_t rhs) -> std::int64_t
{
    std::int64_t result {};
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        overflow(lhs, "+", rhs);
    }
    return result;
}

auto checked_sub(std::int64_t lhs, std::int64_t rhs) -> std::int64_t
{
    std::int64_t result {};
    if (__builtin_sub_overflow(lhs, rhs, &result)) {
        overflow(lhs, "-", rhs);
    }
    return result;
}

auto checked_mul(std::int64_t lhs, std::int64_t rhs) -> std::int64_t
{
    std::int64_t result {};
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
        overflow(lhs, "*", rhs);
    }
    return result;
}

auto checked_div(std::int64_t lhs, std::int64_t rhs) -> std::int64_t
{
    if (rhs == 0) {
        throw_eval_error(eval_error::kind::division_by_zero, "division by 0");
    }
    if (lhs == std::numeric_limits<std::int64_t>::min() && rhs == -1) {
        overflow(lhs, "/", rhs);
    }
    return lhs / rhs;
}
