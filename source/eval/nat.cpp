#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>

#include "nat.hpp"

#include "error.hpp"

auto nat::get() const -> std::uint64_t
{
    if (!value) {
        eval_panic("nat::get", {"expected a finite number, got inf"});
    }
    return *value;
}

auto operator<<(std::ostream& ostrm, const nat& num) -> std::ostream&
{
    if (num.is_inf()) {
        return ostrm << "inf";
    }
    return ostrm << *num.value;
}

auto nat_add(nat lhs, nat rhs) -> nat
{
    if (lhs.is_inf() || rhs.is_inf()) {
        return nat::inf();
    }
    return nat::finite(lhs.get() + rhs.get());
}

auto nat_sub(nat lhs, nat rhs) -> nat
{
    if (rhs.is_inf()) {
        eval_panic("nat_sub", {fmt::format("cannot subtract inf from {}", lhs)});
    }
    if (lhs.is_inf()) {
        return nat::inf();
    }
    if (rhs.get() > lhs.get()) {
        eval_panic("nat_sub", {fmt::format("negative result for {} - {}", lhs, rhs)});
    }
    return nat::finite(lhs.get() - rhs.get());
}

auto nat_mul(nat lhs, nat rhs) -> nat
{
    if (lhs == nat::finite(0) || rhs == nat::finite(0)) {
        return nat::finite(0);
    }
    if (lhs.is_inf() || rhs.is_inf()) {
        return nat::inf();
    }
    return nat::finite(lhs.get() * rhs.get());
}

auto nat_min(nat lhs, nat rhs) -> nat
{
    if (lhs.is_inf()) {
        return rhs;
    }
    if (rhs.is_inf()) {
        return lhs;
    }
    return nat::finite(std::min(lhs.get(), rhs.get()));
}

auto nat_max(nat lhs, nat rhs) -> nat
{
    if (lhs.is_inf() || rhs.is_inf()) {
        return nat::inf();
    }
    return nat::finite(std::max(lhs.get(), rhs.get()));
}
