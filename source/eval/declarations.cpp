#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "evaluator.hpp"

#include <ast/declaration.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "error.hpp"
#include "hole.hpp"
#include "value_ops.hpp"

template<backend Sym>
auto evaluator<Sym>::module_env(const module_def& mod, const env_type* env) const -> const env_type*
{
    trace("entering module {}", mod.name);
    return eval_decls(mod.decls, eval_newtypes(mod.newtypes, env));
}

// A newtype constructor is the identity, under one abstraction per type
// parameter.
template<backend Sym>
auto evaluator<Sym>::eval_newtypes(const std::vector<const newtype*>& newtypes, const env_type* env) const
    -> const env_type*
{
    for (const auto* ntype : newtypes) {
        auto con = make_fun<Sym>([](lazy arg) { return arg->force(); });
        for (auto param = ntype->params.rbegin(); param != ntype->params.rend(); ++param) {
            if (param->kind == type_kind::num) {
                con = make_num_poly<Sym>([con](const nat& /*num*/) { return con; });
            } else {
                con = make_poly<Sym>([con](const tvalue& /*type*/) { return con; });
            }
        }
        trace("binding newtype constructor {}", ntype->name);
        env = env->bind_var_direct(ntype->name, ready_value(m_sym, std::move(con)));
    }
    return env;
}

template<backend Sym>
auto evaluator<Sym>::eval_decls(const decl_groups& groups, const env_type* env) const -> const env_type*
{
    for (const auto* group : groups) {
        env = eval_decl_group(*group, env);
    }
    return env;
}

template<backend Sym>
auto evaluator<Sym>::eval_decl_group(const decl_group& group, const env_type* env) const -> const env_type*
{
    if (!group.recursive) {
        return bind_decl(*group.decls.front(), env, env);
    }

    trace("binding recursive group {}", fmt::join(group.names(), ", "));
    std::vector<hole<value_type>*> holes;
    std::vector<std::pair<std::string, lazy>> hole_bindings;
    for (const auto* dcl : group.decls) {
        if (dcl->is_primitive()) {
            eval_panic("evaluator::eval_decl_group",
                       {"Unexpected primitive declaration in recursive group", dcl->string()});
        }
        auto* hle = m_sym.template declare_hole<value_type>(
            dcl->name, dcl->signature, fmt::format("<<loop>> while evaluating {}", dcl->name));
        holes.push_back(hle);
        hole_bindings.emplace_back(dcl->name, hle->read_handle());
    }
    const auto* hole_env = env->bind_vars(hole_bindings);

    // every body is built before any hole is filled
    const auto* body_env = env;
    for (const auto* dcl : group.decls) {
        body_env = bind_decl(*dcl, hole_env, body_env);
    }

    for (auto* hle : holes) {
        auto* body = body_env->lookup_var(hle->name());
        if (body == nullptr) {
            eval_panic("evaluator::eval_decl_group", {"Recursive definition not completed", hle->name()});
        }
        if (!hle->fill(body)) {
            eval_panic("evaluator::eval_decl_group", {fmt::format("hole for `{}` filled twice", hle->name())});
        }
        trace("filled hole {}", hle->name());
    }
    for (auto* hle : holes) {
        hle->seal();
    }
    return hole_env;
}

// Binds one declaration in `env`. Its body sees `read_env`.
template<backend Sym>
auto evaluator<Sym>::bind_decl(const decl& dcl, const env_type* read_env, const env_type* env) const
    -> const env_type*
{
    if (dcl.is_primitive()) {
        if (auto prim = m_prims ? m_prims(dcl.name) : std::nullopt) {
            return env->bind_var_direct(dcl.name, ready_value(m_sym, std::move(*prim)));
        }
        trace("no implementation for primitive {}", dcl.name);
        return env->bind_var_direct(dcl.name,
                                    delay_value(m_sym,
                                                [name = dcl.name]() -> value_type
                                                {
                                                    throw_eval_error(
                                                        eval_error::kind::no_prim, "unimplemented primitive: {}", name);
                                                },
                                                dcl.name));
    }
    return env->bind_var_direct(dcl.name, suspend(dcl.body, read_env, dcl.name));
}

template auto evaluator<concrete>::module_env(const module_def& mod, const env_type* env) const -> const env_type*;
template auto evaluator<concrete>::eval_newtypes(const std::vector<const newtype*>& newtypes,
                                                 const env_type* env) const -> const env_type*;
template auto evaluator<concrete>::eval_decls(const decl_groups& groups, const env_type* env) const
    -> const env_type*;
template auto evaluator<concrete>::eval_decl_group(const decl_group& group, const env_type* env) const
    -> const env_type*;
template auto evaluator<symbolic>::module_env(const module_def& mod, const env_type* env) const -> const env_type*;
template auto evaluator<symbolic>::eval_newtypes(const std::vector<const newtype*>& newtypes,
                                                 const env_type* env) const -> const env_type*;
template auto evaluator<symbolic>::eval_decls(const decl_groups& groups, const env_type* env) const
    -> const env_type*;
template auto evaluator<symbolic>::eval_decl_group(const decl_group& group, const env_type* env) const
    -> const env_type*;
