#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "builders.hpp"

#include <gc.hpp>

#include "aggregate_expressions.hpp"
#include "call_expression.hpp"
#include "function_literal.hpp"
#include "identifier.hpp"
#include "if_expression.hpp"
#include "type_abstraction.hpp"
#include "where_expression.hpp"

auto var(std::string name) -> const expression*
{
    return make<identifier>(std::move(name));
}

auto app(const expression* func, std::initializer_list<const expression*> args) -> const expression*
{
    for (const auto* arg : args) {
        func = make<call_expression>(func, arg);
    }
    return func;
}

auto lam(std::string param, const type_expr* param_type, const expression* body) -> const expression*
{
    return make<function_literal>(std::move(param), param_type, body);
}

auto tabs(std::string param, type_kind kind, const expression* body) -> const expression*
{
    return make<type_abstraction>(type_param {.name = std::move(param), .kind = kind}, body);
}

auto tapp(const expression* func, std::initializer_list<const type_expr*> args) -> const expression*
{
    for (const auto* arg : args) {
        func = make<type_application>(func, arg);
    }
    return func;
}

auto cond(const type_expr* type, const expression* condition, const expression* then, const expression* otherwise)
    -> const expression*
{
    return make<if_expression>(type, condition, then, otherwise);
}

auto where(const expression* body, decl_groups groups) -> const expression*
{
    return make<where_expression>(body, std::move(groups));
}

auto list(std::vector<const expression*> elems, const type_expr* elem_type) -> const expression*
{
    return make<list_expression>(std::move(elems), elem_type);
}

auto tuple(std::vector<const expression*> elems) -> const expression*
{
    return make<tuple_expression>(std::move(elems));
}

auto record(std::vector<std::pair<std::string, const expression*>> fields) -> const expression*
{
    return make<record_expression>(std::move(fields));
}

auto project(const expression* target, selector sel) -> const expression*
{
    return make<select_expression>(target, std::move(sel));
}

auto update(const type_expr* type, const expression* target, selector sel, const expression* val)
    -> const expression*
{
    return make<update_expression>(type, target, std::move(sel), val);
}

auto comprehension(const type_expr* len,
                   const type_expr* elem_type,
                   const expression* head,
                   std::vector<matches> branches) -> const expression*
{
    return make<comprehension_expression>(len, elem_type, head, std::move(branches));
}

auto num_lit(std::uint64_t num, const type_expr* type) -> const expression*
{
    return tapp(var("number"), {t_num(num), type});
}

auto int_lit(std::uint64_t num) -> const expression*
{
    return num_lit(num, t_integer());
}

auto bit_lit(bool bit) -> const expression*
{
    return var(bit ? "True" : "False");
}

auto str_lit(std::string_view str) -> const expression*
{
    constexpr auto char_width = 8;
    std::vector<const expression*> chars;
    for (const auto chr : str) {
        chars.push_back(num_lit(static_cast<unsigned char>(chr), t_word(char_width)));
    }
    return list(std::move(chars), t_word(char_width));
}

auto binop(std::string oper, const type_expr* type, const expression* lhs, const expression* rhs)
    -> const expression*
{
    return app(tapp(var(std::move(oper)), {type}), {lhs, rhs});
}
