#include <string>

#include "type_abstraction.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto type_abstraction::string() const -> std::string
{
    return fmt::format("/\\({} : {}) -> {}", parameter.name, parameter.kind, body->string());
}

void type_abstraction::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto type_application::string() const -> std::string
{
    return fmt::format("{}`{{{}}}", function->string(), argument->string());
}

void type_application::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto proof_abstraction::string() const -> std::string
{
    return fmt::format("<{}> => {}", property != nullptr ? property->string() : "?", body->string());
}

void proof_abstraction::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto proof_application::string() const -> std::string
{
    return fmt::format("{} <>", body->string());
}

void proof_application::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
