#include <string>
#include <utility>
#include <vector>

#include "declaration.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>

auto decl::string() const -> std::string
{
    const auto sig = signature != nullptr ? signature->string() : std::string {"?"};
    if (is_primitive()) {
        return fmt::format("primitive {} : {}", name, sig);
    }
    return fmt::format("{} : {} = {}", name, sig, body->string());
}

auto make_decl(std::string name, const schema* sig, const expression* body) -> const decl*
{
    auto* dcl = make<decl>();
    dcl->name = std::move(name);
    dcl->signature = sig;
    dcl->body = body;
    return dcl;
}

auto make_prim(std::string name, const schema* sig) -> const decl*
{
    return make_decl(std::move(name), sig, nullptr);
}

auto decl_group::string() const -> std::string
{
    std::vector<std::string> strs;
    for (const auto* dcl : decls) {
        strs.push_back(dcl->string());
    }
    return fmt::format("{} {{ {} }}", recursive ? "rec" : "nonrec", fmt::join(strs, "; "));
}

auto decl_group::names() const -> std::vector<std::string>
{
    std::vector<std::string> result;
    for (const auto* dcl : decls) {
        result.push_back(dcl->name);
    }
    return result;
}

auto non_recursive(const decl* dcl) -> const decl_group*
{
    auto* group = make<decl_group>();
    group->decls.push_back(dcl);
    return group;
}

auto recursive(std::vector<const decl*> decls) -> const decl_group*
{
    auto* group = make<decl_group>();
    group->recursive = true;
    group->decls = std::move(decls);
    return group;
}

auto newtype::string() const -> std::string
{
    std::vector<std::string> strs;
    for (const auto& [field, type] : fields) {
        strs.push_back(fmt::format("{} : {}", field, type->string()));
    }
    std::vector<std::string> param_names;
    for (const auto& param : params) {
        param_names.push_back(param.name);
    }
    return fmt::format("newtype {} {} = {{{}}}", name, fmt::join(param_names, " "), fmt::join(strs, ", "));
}
