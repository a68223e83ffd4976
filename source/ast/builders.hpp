#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "comprehension.hpp"
#include "declaration.hpp"
#include "expression.hpp"
#include "selector.hpp"
#include "type.hpp"

// Shorthands for assembling type-checked programs by hand. Literals and
// operators refer to the prelude primitives by name.

auto var(std::string name) -> const expression*;
auto app(const expression* func, std::initializer_list<const expression*> args) -> const expression*;
auto lam(std::string param, const type_expr* param_type, const expression* body) -> const expression*;
auto tabs(std::string param, type_kind kind, const expression* body) -> const expression*;
auto tapp(const expression* func, std::initializer_list<const type_expr*> args) -> const expression*;
auto cond(const type_expr* type, const expression* condition, const expression* then, const expression* otherwise)
    -> const expression*;
auto where(const expression* body, decl_groups groups) -> const expression*;

auto list(std::vector<const expression*> elems, const type_expr* elem_type) -> const expression*;
auto tuple(std::vector<const expression*> elems) -> const expression*;
auto record(std::vector<std::pair<std::string, const expression*>> fields) -> const expression*;
auto project(const expression* target, selector sel) -> const expression*;
auto update(const type_expr* type, const expression* target, selector sel, const expression* val)
    -> const expression*;
auto comprehension(const type_expr* len,
                   const type_expr* elem_type,
                   const expression* head,
                   std::vector<matches> branches) -> const expression*;

// `number` at the given type
auto num_lit(std::uint64_t num, const type_expr* type) -> const expression*;
auto int_lit(std::uint64_t num) -> const expression*;
auto bit_lit(bool bit) -> const expression*;
auto str_lit(std::string_view str) -> const expression*;

// prelude operator `oper` instantiated at `type` and applied to both operands
auto binop(std::string oper, const type_expr* type, const expression* lhs, const expression* rhs)
    -> const expression*;
