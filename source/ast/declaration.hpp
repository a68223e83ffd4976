#pragma once

#include <string>
#include <utility>
#include <vector>

#include "expression.hpp"
#include "type.hpp"

struct decl final
{
    [[nodiscard]] auto string() const -> std::string;
    [[nodiscard]] auto is_primitive() const -> bool { return body == nullptr; }

    std::string name;
    const schema* signature {};
    // nullptr for declarations implemented by a primitive
    const expression* body {};
};

auto make_decl(std::string name, const schema* sig, const expression* body) -> const decl*;
auto make_prim(std::string name, const schema* sig) -> const decl*;

struct decl_group final
{
    [[nodiscard]] auto string() const -> std::string;
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    bool recursive {};
    std::vector<const decl*> decls;
};

auto non_recursive(const decl* dcl) -> const decl_group*;
auto recursive(std::vector<const decl*> decls) -> const decl_group*;

using decl_groups = std::vector<const decl_group*>;

struct newtype final
{
    [[nodiscard]] auto string() const -> std::string;

    std::string name;
    std::vector<type_param> params;
    std::vector<std::pair<std::string, const type_expr*>> fields;
};

struct module_def final
{
    std::string name;
    std::vector<const newtype*> newtypes;
    decl_groups decls;
};
