#include <string>
#include <utility>
#include <vector>

#include "comprehension.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>

#include "util.hpp"
#include "visitor.hpp"

auto match::string() const -> std::string
{
    if (k == kind::let) {
        return fmt::format("let {}", binding->string());
    }
    return fmt::format("{} <- {}", name, source->string());
}

auto from(std::string name, const type_expr* len, const type_expr* elem_type, const expression* source)
    -> const match*
{
    auto* mtch = make<match>();
    mtch->k = match::kind::from;
    mtch->name = std::move(name);
    mtch->length = len;
    mtch->element_type = elem_type;
    mtch->source = source;
    return mtch;
}

auto let(const decl* binding) -> const match*
{
    auto* mtch = make<match>();
    mtch->k = match::kind::let;
    mtch->binding = binding;
    return mtch;
}

auto comprehension_expression::string() const -> std::string
{
    std::vector<std::string> arms;
    for (const auto& branch : branches) {
        arms.push_back(join(branch, ", "));
    }
    return fmt::format("[ {} | {} ]", head->string(), fmt::join(arms, " | "));
}

void comprehension_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
