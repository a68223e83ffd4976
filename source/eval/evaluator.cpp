#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/aggregate_expressions.hpp>
#include <ast/call_expression.hpp>
#include <ast/comprehension.hpp>
#include <ast/function_literal.hpp>
#include <ast/identifier.hpp>
#include <ast/if_expression.hpp>
#include <ast/selector.hpp>
#include <ast/type_abstraction.hpp>
#include <ast/visitor.hpp>
#include <ast/where_expression.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <fmt/format.h>

#include "error.hpp"
#include "value_ops.hpp"

namespace
{

template<backend Sym>
struct expression_evaluator final : visitor
{
    using value_type = generic_value<Sym>;
    using env_type = environment<Sym>;

    expression_evaluator(const evaluator<Sym>& eval, const env_type* env)
        : m_eval {eval}
        , m_env {env}
    {
    }

    auto result() -> value_type { return std::move(*m_result); }

    void visit(const list_expression& expr) final
    {
        const auto& sym = m_eval.sym();
        auto elem_type = eval_value_type(m_env->type_bindings(), expr.element_type);
        std::vector<lazy_value<Sym>> elems;
        elems.reserve(expr.elements.size());
        for (const auto* element : expr.elements) {
            elems.push_back(m_eval.suspend(element, m_env));
        }
        const auto len = nat::finite(elems.size());
        if (elem_type.is(tvalue::kind::bit)) {
            if (auto word = try_pack_bits(sym, elems)) {
                m_result = make_seq<Sym>(len, elem_type, unpack_seq_map(sym, *word));
                return;
            }
        }
        m_result = make_seq<Sym>(len, elem_type, finite_seq_map<Sym>(std::move(elems)));
    }

    void visit(const tuple_expression& expr) final
    {
        std::vector<lazy_value<Sym>> elems;
        elems.reserve(expr.elements.size());
        for (const auto* element : expr.elements) {
            elems.push_back(m_eval.suspend(element, m_env));
        }
        m_result = make_tuple<Sym>(std::move(elems));
    }

    void visit(const record_expression& expr) final
    {
        std::map<std::string, lazy_value<Sym>> fields;
        for (const auto& [name, field] : expr.fields) {
            fields.emplace(name, m_eval.suspend(field, m_env));
        }
        m_result = make_record<Sym>(std::move(fields));
    }

    void visit(const select_expression& expr) final
    {
        auto container = m_eval.eval_expr(expr.target, m_env);
        m_result = m_eval.eval_sel(container, expr.sel)->force();
    }

    void visit(const update_expression& expr) final
    {
        auto type = eval_value_type(m_env->type_bindings(), expr.target_type);
        auto* target = m_eval.suspend(expr.target, m_env);
        auto* val = m_eval.suspend(expr.value, m_env);
        m_result = m_eval.eval_set_sel(type, target, expr.sel, val);
    }

    void visit(const if_expression& expr) final
    {
        const auto& eval = m_eval;
        const auto* env = m_env;
        auto cond = from_bit(eval.eval_expr(expr.condition, env));
        auto type = eval_value_type(env->type_bindings(), expr.result_type);
        m_result = ite_value<Sym>(
            eval.sym(),
            type,
            cond,
            [&eval, env, &expr]() { return eval.eval_expr(expr.consequence, env); },
            [&eval, env, &expr]() { return eval.eval_expr(expr.alternative, env); });
    }

    void visit(const comprehension_expression& expr) final
    {
        auto len = eval_num_type(m_env->type_bindings(), expr.length);
        auto elem_type = eval_value_type(m_env->type_bindings(), expr.element_type);
        m_result = m_eval.eval_comp(m_env, len, elem_type, expr.head, expr.branches);
    }

    void visit(const identifier& expr) final
    {
        auto* val = m_env->lookup_var(expr.value);
        if (val == nullptr) {
            eval_panic("evaluator::eval_expr", {fmt::format("var `{}` is not defined", expr.value)});
        }
        m_result = val->force();
    }

    void visit(const type_abstraction& expr) final
    {
        const auto& eval = m_eval;
        const auto* env = m_env;
        const auto* node = &expr;
        switch (expr.parameter.kind) {
            case type_kind::type:
                m_result = make_poly<Sym>(
                    [&eval, env, node](const tvalue& type)
                    { return eval.eval_expr(node->body, env->bind_type(node->parameter.name, type)); });
                return;
            case type_kind::num:
                m_result = make_num_poly<Sym>(
                    [&eval, env, node](const nat& num)
                    { return eval.eval_expr(node->body, env->bind_type(node->parameter.name, num)); });
                return;
            case type_kind::prop:
                break;
        }
        eval_panic("evaluator::eval_expr",
                   {"invalid kind on type abstraction", fmt::format("{}", expr.parameter.kind), expr.string()});
    }

    void visit(const type_application& expr) final
    {
        auto func = m_eval.eval_expr(expr.function, m_env);
        if (const auto* poly = std::get_if<typename value_type::poly>(&func.data)) {
            m_result = poly->apply(eval_value_type(m_env->type_bindings(), expr.argument));
            return;
        }
        if (const auto* num_poly = std::get_if<typename value_type::num_poly>(&func.data)) {
            m_result = num_poly->apply(eval_num_type(m_env->type_bindings(), expr.argument));
            return;
        }
        if (const auto* err = std::get_if<typename value_type::error>(&func.data)) {
            throw eval_error(err->kind, err->message);
        }
        eval_panic("evaluator::eval_expr",
                   {"expected a polymorphic value", expr.function->string(), expr.argument->string()});
    }

    void visit(const call_expression& expr) final
    {
        auto func = m_eval.eval_expr(expr.function, m_env);
        if (const auto* fun = std::get_if<typename value_type::function>(&func.data)) {
            m_result = fun->apply(m_eval.suspend(expr.argument, m_env));
            return;
        }
        if (const auto* err = std::get_if<typename value_type::error>(&func.data)) {
            throw eval_error(err->kind, err->message);
        }
        eval_panic("evaluator::eval_expr", {"not a function", expr.function->string()});
    }

    void visit(const function_literal& expr) final
    {
        const auto& eval = m_eval;
        const auto* env = m_env;
        const auto* node = &expr;
        m_result = make_fun<Sym>([&eval, env, node](lazy_value<Sym> arg)
                                 { return eval.eval_expr(node->body, env->bind_var_direct(node->parameter, arg)); });
    }

    void visit(const proof_abstraction& expr) final { m_result = m_eval.eval_expr(expr.body, m_env); }

    void visit(const proof_application& expr) final { m_result = m_eval.eval_expr(expr.body, m_env); }

    void visit(const where_expression& expr) final
    {
        const auto* env = m_eval.eval_decls(expr.groups, m_env);
        m_result = m_eval.eval_expr(expr.body, env);
    }

  private:
    const evaluator<Sym>& m_eval;
    const env_type* m_env;
    std::optional<value_type> m_result;
};

}  // namespace

template<backend Sym>
auto evaluator<Sym>::eval_expr(const expression* expr, const env_type* env) const -> value_type
{
    expression_evaluator<Sym> vis {*this, env};
    expr->accept(vis);
    return vis.result();
}

// A variable already names a suspension; anything else gets a new one.
template<backend Sym>
auto evaluator<Sym>::suspend(const expression* expr, const env_type* env, std::string label) const -> lazy
{
    if (const auto* ident = dynamic_cast<const identifier*>(expr); ident != nullptr) {
        if (auto* val = env->lookup_var(ident->value); val != nullptr) {
            return val;
        }
    }
    return delay_value(m_sym, [this, expr, env]() { return eval_expr(expr, env); }, std::move(label));
}

template auto evaluator<concrete>::eval_expr(const expression* expr, const env_type* env) const -> value_type;
template auto evaluator<concrete>::suspend(const expression* expr, const env_type* env, std::string label) const
    -> lazy;
template auto evaluator<symbolic>::eval_expr(const expression* expr, const env_type* env) const -> value_type;
template auto evaluator<symbolic>::suspend(const expression* expr, const env_type* env, std::string label) const
    -> lazy;
