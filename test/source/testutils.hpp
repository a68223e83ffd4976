#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <ast/declaration.hpp>
#include <ast/expression.hpp>
#include <ast/type.hpp>
#include <backend/backend.hpp>
#include <builtin/builtin.hpp>
#include <eval/environment.hpp>
#include <eval/error.hpp>
#include <eval/evaluator.hpp>
#include <eval/value.hpp>
#include <eval/value_ops.hpp>

// The prelude followed by `decls`.
auto with_prelude(const decl_groups& decls) -> decl_groups;

// The evaluation error raised by `action`, if any.
auto eval_error_of(const std::function<void()>& action) -> std::optional<eval_error>;

// An evaluator over the prelude and the given declarations. Owns the backend
// the evaluator refers to, so it is neither copied nor moved.
template<backend Sym>
class session final
{
  public:
    explicit session(const decl_groups& decls = {}, const std::vector<const newtype*>& newtypes = {})
        : m_eval {m_sym, prelude_primitives(m_sym)}
        , m_env {m_eval.module_env(module_def {.name = "Test", .newtypes = newtypes, .decls = with_prelude(decls)})}
    {
    }

    session(const session&) = delete;
    session(session&&) = delete;
    auto operator=(const session&) -> session& = delete;
    auto operator=(session&&) -> session& = delete;
    ~session() = default;

    [[nodiscard]] auto sym() const -> const Sym& { return m_sym; }

    [[nodiscard]] auto eval() const -> const evaluator<Sym>& { return m_eval; }

    [[nodiscard]] auto env() const -> const environment<Sym>* { return m_env; }

    auto run(const expression* expr) const -> generic_value<Sym> { return m_eval.eval_expr(expr, m_env); }

    auto show(const expression* expr) const -> std::string { return inspect(m_sym, run(expr)); }

    void bind(const std::string& name, generic_value<Sym> val)
    {
        m_env = m_env->bind_var_direct(name, ready_value(m_sym, std::move(val)));
    }

    void bind_lazy(const std::string& name, lazy_value<Sym> val) { m_env = m_env->bind_var_direct(name, val); }

  private:
    Sym m_sym;
    evaluator<Sym> m_eval;
    const environment<Sym>* m_env;
};

// `error message` at type `type`.
auto error_expr(const type_expr* type, std::string_view message) -> const expression*;
