#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "evaluator.hpp"

#include <ast/comprehension.hpp>
#include <ast/declaration.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <fmt/format.h>

#include "error.hpp"
#include "list_env.hpp"
#include "value_ops.hpp"

template<backend Sym>
auto evaluator<Sym>::eval_comp(const env_type* env,
                               nat len,
                               const tvalue& elem_type,
                               const expression* head,
                               const std::vector<matches>& branches) const -> value_type
{
    trace("comprehension of length {} with {} branch(es)", len, branches.size());
    list_env<Sym> combined {env};
    for (const auto& arm : branches) {
        combined = merge_list_envs(std::move(combined), branch_env(list_env<Sym> {env}, arm));
    }
    auto lenv = std::make_shared<const list_env<Sym>>(std::move(combined));
    auto vals = generate_seq_map<Sym>(
        [this, lenv, head](index_type index)
        {
            return delay_value(m_sym,
                               [this, lenv, head, index]() { return eval_expr(head, eval_list_env(*lenv, index)); });
        });
    return make_seq<Sym>(len, elem_type, memo_map(vals));
}

template<backend Sym>
auto evaluator<Sym>::branch_env(list_env<Sym> lenv, const matches& arm) const -> list_env<Sym>
{
    for (const auto* mtch : arm) {
        lenv = eval_match(std::move(lenv), *mtch);
    }
    return lenv;
}

template<backend Sym>
auto evaluator<Sym>::eval_match(list_env<Sym> lenv, const match& mtch) const -> list_env<Sym>
{
    if (mtch.k == match::kind::let) {
        const auto& dcl = *mtch.binding;
        if (dcl.is_primitive()) {
            eval_panic("evaluator::eval_match", {"Unexpected local primitive", dcl.string()});
        }
        // not recursive: the body sees the bindings made before this one
        auto current = std::make_shared<const list_env<Sym>>(lenv);
        lenv.vars[dcl.name] = [this, current, body = dcl.body, name = dcl.name](index_type index)
        {
            return delay_value(
                m_sym, [this, current, body, index]() { return eval_expr(body, eval_list_env(*current, index)); }, name);
        };
        return lenv;
    }

    const auto len = eval_num_type(lenv.base->type_bindings(), mtch.length);
    const auto* source = mtch.source;
    if (len.is_finite()) {
        // the new binder is the innermost loop, so every earlier one repeats
        // each of its values `inner` times
        const auto inner = len.get();
        if (inner == 0) {
            // an empty source makes the whole comprehension empty; a later
            // infinite from still fixes this binder at index 0 without reading it
            lenv.vars[mtch.name] = [this, name = mtch.name](index_type index)
            {
                return delay_value(m_sym,
                                   [name, index]() -> value_type
                                   {
                                       eval_panic("evaluator::eval_match",
                                                  {fmt::format("lookup of {} at {} in an empty from", name, index)});
                                   });
            };
            return lenv;
        }
        trace("from {} over {} elements", mtch.name, inner);
        auto current = std::make_shared<const list_env<Sym>>(lenv);
        auto rows = memo_map(generate_seq_map<Sym>(
            [this, current, source](index_type index)
            {
                return delay_value(m_sym,
                                   [this, current, source, index]()
                                   { return eval_expr(source, eval_list_env(*current, index)); });
            }));
        auto elems = memo_map(join_seq_map(m_sym, rows, inner));
        for (auto& [name, gen] : lenv.vars) {
            gen = [outer = std::move(gen), inner](index_type index) { return outer(index / inner); };
        }
        lenv.vars[mtch.name] = [elems](index_type index) { return elems.lookup(index); };
        return lenv;
    }

    // an infinite innermost loop never advances the outer ones
    trace("from {} over an infinite sequence", mtch.name);
    for (const auto& [name, gen] : lenv.vars) {
        lenv.fixed[name] = gen(0);
    }
    lenv.vars.clear();
    const auto* source_env = eval_list_env(lenv, 0);
    auto* source_val = delay_value(m_sym, [this, source, source_env]() { return eval_expr(source, source_env); });
    auto elems = delay_seq_map(m_sym, source_val);
    lenv.vars[mtch.name] = [elems](index_type index) { return elems.lookup(index); };
    return lenv;
}

template auto evaluator<concrete>::eval_comp(const env_type* env,
                                             nat len,
                                             const tvalue& elem_type,
                                             const expression* head,
                                             const std::vector<matches>& branches) const -> value_type;
template auto evaluator<symbolic>::eval_comp(const env_type* env,
                                             nat len,
                                             const tvalue& elem_type,
                                             const expression* head,
                                             const std::vector<matches>& branches) const -> value_type;
