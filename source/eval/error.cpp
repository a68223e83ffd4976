#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

panic::panic(std::string where, std::vector<std::string> lines)
    : std::logic_error {fmt::format("[{}] internal error:\n  {}", where, fmt::join(lines, "\n  "))}
    , location {std::move(where)}
    , details {std::move(lines)}
{
}

auto eval_panic(std::string_view where, std::initializer_list<std::string> lines) -> void
{
    throw panic(std::string {where}, std::vector<std::string> {lines});
}

eval_error::eval_error(kind knd, const std::string& message)
    : std::runtime_error {message}
    , k {knd}
{
}

auto operator<<(std::ostream& ostrm, eval_error::kind knd) -> std::ostream&
{
    using enum eval_error::kind;
    switch (knd) {
        case loop:
            return ostrm << "loop";
        case no_prim:
            return ostrm << "no_prim";
        case user:
            return ostrm << "user";
        case division_by_zero:
            return ostrm << "division_by_zero";
        case overflow:
            return ostrm << "overflow";
        case invalid_index:
            return ostrm << "invalid_index";
        case unsupported:
            return ostrm << "unsupported";
    }
    return ostrm << "unknown";
}
