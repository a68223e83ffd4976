#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "environment.hpp"
#include "seq_map.hpp"

// Bindings of one comprehension branch. Names in `vars` take a different value
// at each position of the comprehension, names in `fixed` the same value at
// every position.
template<typename Sym>
struct list_env final
{
    using lazy = lazy_value<Sym>;
    using generator = std::function<lazy(index_type)>;

    explicit list_env(const environment<Sym>* base_env)
        : base {base_env}
    {
    }

    std::map<std::string, generator> vars;
    std::map<std::string, lazy> fixed;
    const environment<Sym>* base {};
};

// Environment of position `index`. Varying bindings shadow fixed ones.
template<typename Sym>
auto eval_list_env(const list_env<Sym>& lenv, index_type index) -> const environment<Sym>*
{
    std::vector<std::pair<std::string, lazy_value<Sym>>> bindings;
    bindings.reserve(lenv.vars.size() + lenv.fixed.size());
    for (const auto& [name, val] : lenv.fixed) {
        if (!lenv.vars.contains(name)) {
            bindings.emplace_back(name, val);
        }
    }
    for (const auto& [name, gen] : lenv.vars) {
        bindings.emplace_back(name, gen(index));
    }
    return lenv.base->bind_vars(bindings);
}

// Union of parallel branches; the left operand wins on a clash.
template<typename Sym>
auto merge_list_envs(list_env<Sym> lhs, const list_env<Sym>& rhs) -> list_env<Sym>
{
    lhs.vars.insert(rhs.vars.begin(), rhs.vars.end());
    lhs.fixed.insert(rhs.fixed.begin(), rhs.fixed.end());
    return lhs;
}
