#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <fmt/ostream.h>

// A type-level natural number extended with infinity.
struct nat final
{
    static auto finite(std::uint64_t num) -> nat { return nat {num}; }

    static auto inf() -> nat { return nat {}; }

    [[nodiscard]] auto is_inf() const -> bool { return !value.has_value(); }

    [[nodiscard]] auto is_finite() const -> bool { return value.has_value(); }

    [[nodiscard]] auto get() const -> std::uint64_t;

    auto operator==(const nat& other) const -> bool = default;

    std::optional<std::uint64_t> value;
};

auto operator<<(std::ostream& ostrm, const nat& num) -> std::ostream&;

template<>
struct fmt::formatter<nat> : ostream_formatter
{
};

auto nat_add(nat lhs, nat rhs) -> nat;
auto nat_sub(nat lhs, nat rhs) -> nat;
auto nat_mul(nat lhs, nat rhs) -> nat;
auto nat_min(nat lhs, nat rhs) -> nat;
auto nat_max(nat lhs, nat rhs) -> nat;
