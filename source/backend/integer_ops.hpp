#pragma once

#include <cstdint>

// 64-bit integer arithmetic that raises an overflow error instead of wrapping.
auto checked_add(std::int64_t lhs, std::int64_t rhs) -> std::int64_t;
auto checked_sub(std::int64_t lhs, std::int64_t rhs) -> std::int64_t;
auto checked_mul(std::int64_t lhs, std::int64_t rhs) -> std::int64_t;
auto checked_div(std::int64_t lhs, std::int64_t rhs) -> std::int64_t;
