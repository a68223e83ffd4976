#pragma once

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

// Broken interpreter invariant: an ill-typed program got past the type checker
// or the recursion bookkeeping is inconsistent. Never recovered from.
struct panic final : std::logic_error
{
    panic(std::string where, std::vector<std::string> lines);

    std::string location;
    std::vector<std::string> details;
};

[[noreturn]] auto eval_panic(std::string_view where, std::initializer_list<std::string> lines) -> void;

// Failure of the evaluated program itself, reported to the user.
struct eval_error final : std::runtime_error
{
    enum class kind : std::uint8_t
    {
        loop,
        no_prim,
        user,
        division_by_zero,
        overflow,
        invalid_index,
        unsupported,
    };

    eval_error(kind knd, const std::string& message);

    kind k {};
};

auto operator<<(std::ostream& ostrm, eval_error::kind knd) -> std::ostream&;

template<>
struct fmt::formatter<eval_error::kind> : ostream_formatter
{
};

template<typename... T>
[[noreturn]] auto throw_eval_error(eval_error::kind knd, fmt::format_string<T...> format, T&&... args) -> void
{
    throw eval_error(knd, fmt::format(format, std::forward<T>(args)...));
}
