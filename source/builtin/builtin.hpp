#pragma once

#include <functional>
#include <string>
#include <vector>

#include <ast/declaration.hpp>
#include <backend/backend.hpp>
#include <eval/value.hpp>

// A primitive of the prelude. `signature` documents the type the primitive is
// declared with; the body builds its value for a backend.
template<typename Sym>
struct builtin final
{
    std::string name;
    std::string signature;
    std::function<generic_value<Sym>(const Sym& sym)> body;
};

template<backend Sym>
auto builtins() -> const std::vector<builtin<Sym>>&;

// Primitive table serving the prelude. `sym` must outlive the table and every
// value taken from it.
template<backend Sym>
auto prelude_primitives(const Sym& sym) -> primitive_table<Sym>;

// Primitive declarations naming every prelude builtin, one group each.
auto prelude_decls() -> const decl_groups&;
