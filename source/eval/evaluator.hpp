#pragma once

#include <string>
#include <utility>
#include <vector>

#include <ast/comprehension.hpp>
#include <ast/declaration.hpp>
#include <ast/expression.hpp>
#include <ast/selector.hpp>
#include <backend/backend.hpp>
#include <fmt/format.h>

#include "environment.hpp"
#include "list_env.hpp"
#include "nat.hpp"
#include "type_value.hpp"
#include "value.hpp"

struct eval_options
{
    // trace declaration binding and comprehension setup to stderr
    bool debug {};
};

// Non-strict evaluator of type-checked programs over the backend `Sym`.
// Values produced by an evaluator refer back to it and to its backend; both
// must outlive every value they produced.
template<backend Sym>
class evaluator final
{
  public:
    using value_type = generic_value<Sym>;
    using lazy = lazy_value<Sym>;
    using env_type = environment<Sym>;

    evaluator(const Sym& sym, primitive_table<Sym> prims, eval_options opts = {})
        : m_sym {sym}
        , m_prims {std::move(prims)}
        , m_opts {opts}
    {
    }

    [[nodiscard]] auto sym() const -> const Sym& { return m_sym; }

    [[nodiscard]] auto options() const -> const eval_options& { return m_opts; }

    // Environment of a module: its newtype constructors, then its declarations.
    auto module_env(const module_def& mod, const env_type* env = env_type::empty()) const -> const env_type*;
    auto eval_newtypes(const std::vector<const newtype*>& newtypes, const env_type* env) const -> const env_type*;
    auto eval_decls(const decl_groups& groups, const env_type* env) const -> const env_type*;
    auto eval_decl_group(const decl_group& group, const env_type* env) const -> const env_type*;

    auto eval_expr(const expression* expr, const env_type* env) const -> value_type;

    // The suspended component addressed by `sel`, without forcing it.
    auto eval_sel(const value_type& val, const selector& sel) const -> lazy;
    auto eval_set_sel(const tvalue& type, lazy target, const selector& sel, lazy val) const -> value_type;

    auto eval_comp(const env_type* env,
                   nat len,
                   const tvalue& elem_type,
                   const expression* head,
                   const std::vector<matches>& branches) const -> value_type;

    auto suspend(const expression* expr, const env_type* env, std::string label = {}) const -> lazy;

  private:
    auto bind_decl(const decl& dcl, const env_type* read_env, const env_type* env) const -> const env_type*;
    auto branch_env(list_env<Sym> lenv, const matches& arm) const -> list_env<Sym>;
    auto eval_match(list_env<Sym> lenv, const match& mtch) const -> list_env<Sym>;

    template<typename... T>
    void trace(fmt::format_string<T...> format, T&&... args) const
    {
        if (m_opts.debug) {
            fmt::print(stderr, "[{}] {}\n", Sym::name, fmt::format(format, std::forward<T>(args)...));
        }
    }

    const Sym& m_sym;
    primitive_table<Sym> m_prims;
    eval_options m_opts;
};
