#pragma once

#include <ast/aggregate_expressions.hpp>
#include <ast/call_expression.hpp>
#include <ast/comprehension.hpp>
#include <ast/function_literal.hpp>
#include <ast/identifier.hpp>
#include <ast/if_expression.hpp>
#include <ast/selector.hpp>
#include <ast/type_abstraction.hpp>
#include <ast/where_expression.hpp>

#include "expression.hpp"

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const comprehension_expression& expr) = 0;
    virtual void visit(const function_literal& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const if_expression& expr) = 0;
    virtual void visit(const list_expression& expr) = 0;
    virtual void visit(const proof_abstraction& expr) = 0;
    virtual void visit(const proof_application& expr) = 0;
    virtual void visit(const record_expression& expr) = 0;
    virtual void visit(const select_expression& expr) = 0;
    virtual void visit(const tuple_expression& expr) = 0;
    virtual void visit(const type_abstraction& expr) = 0;
    virtual void visit(const type_application& expr) = 0;
    virtual void visit(const update_expression& expr) = 0;
    virtual void visit(const where_expression& expr) = 0;
};
