#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "type_value.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "error.hpp"

auto tvalue::bit() -> tvalue
{
    return tvalue {.k = kind::bit};
}

auto tvalue::integer() -> tvalue
{
    return tvalue {.k = kind::integer};
}

auto tvalue::seq(std::uint64_t len, tvalue elem) -> tvalue
{
    return tvalue {.k = kind::seq, .len = len, .elems = {std::move(elem)}};
}

auto tvalue::stream(tvalue elem) -> tvalue
{
    return tvalue {.k = kind::stream, .elems = {std::move(elem)}};
}

auto tvalue::sequence(nat len, tvalue elem) -> tvalue
{
    if (len.is_inf()) {
        return stream(std::move(elem));
    }
    return seq(len.get(), std::move(elem));
}

auto tvalue::tuple(std::vector<tvalue> elems) -> tvalue
{
    return tvalue {.k = kind::tuple, .elems = std::move(elems)};
}

auto tvalue::record(std::vector<std::pair<std::string, tvalue>> fields) -> tvalue
{
    tvalue result {.k = kind::record};
    for (auto& [name, type] : fields) {
        result.fields.push_back(std::move(name));
        result.elems.push_back(std::move(type));
    }
    return result;
}

auto tvalue::function(tvalue arg, tvalue res) -> tvalue
{
    return tvalue {.k = kind::function, .elems = {std::move(arg), std::move(res)}};
}

auto tvalue::element() const -> const tvalue&
{
    if ((k != kind::seq && k != kind::stream) || elems.empty()) {
        eval_panic("tvalue::element", {fmt::format("not a sequence type: {}", string())});
    }
    return elems.front();
}

auto tvalue::length() const -> nat
{
    switch (k) {
        case kind::seq:
            return nat::finite(len);
        case kind::stream:
            return nat::inf();
        default:
            eval_panic("tvalue::length", {fmt::format("not a sequence type: {}", string())});
    }
}

auto tvalue::string() const -> std::string
{
    switch (k) {
        case kind::bit:
            return "Bit";
        case kind::integer:
            return "Integer";
        case kind::seq:
            return fmt::format("[{}]{}", len, elems.front().string());
        case kind::stream:
            return fmt::format("[inf]{}", elems.front().string());
        case kind::tuple: {
            std::vector<std::string> strs;
            for (const auto& elem : elems) {
                strs.push_back(elem.string());
            }
            return fmt::format("({})", fmt::join(strs, ", "));
        }
        case kind::record: {
            std::vector<std::string> strs;
            for (auto idx = 0UL; idx < fields.size(); ++idx) {
                strs.push_back(fmt::format("{} : {}", fields[idx], elems[idx].string()));
            }
            return fmt::format("{{{}}}", fmt::join(strs, ", "));
        }
        case kind::function:
            return fmt::format("({} -> {})", elems[0].string(), elems[1].string());
    }
    return "?";
}

auto operator<<(std::ostream& ostrm, const tvalue& type) -> std::ostream&
{
    return ostrm << type.string();
}

auto eval_type(const type_env& env, const type_expr* type) -> type_binding
{
    using enum type_expr::tag;
    switch (type->t) {
        case var: {
            const auto itr = env.find(type->name);
            if (itr == env.end()) {
                eval_panic("eval_type", {fmt::format("type variable `{}` is not bound", type->name)});
            }
            return itr->second;
        }
        case num:
            return nat::finite(type->number);
        case inf:
            return nat::inf();
        case bit:
            return tvalue::bit();
        case integer:
            return tvalue::integer();
        case seq:
            return tvalue::sequence(eval_num_type(env, type->args[0]), eval_value_type(env, type->args[1]));
        case tuple: {
            std::vector<tvalue> elems;
            for (const auto* elem : type->args) {
                elems.push_back(eval_value_type(env, elem));
            }
            return tvalue::tuple(std::move(elems));
        }
        case record: {
            std::vector<std::pair<std::string, tvalue>> fields;
            for (auto idx = 0UL; idx < type->fields.size(); ++idx) {
                fields.emplace_back(type->fields[idx], eval_value_type(env, type->args[idx]));
            }
            return tvalue::record(std::move(fields));
        }
        case function:
            return tvalue::function(eval_value_type(env, type->args[0]), eval_value_type(env, type->args[1]));
        case add:
            return nat_add(eval_num_type(env, type->args[0]), eval_num_type(env, type->args[1]));
        case sub:
            return nat_sub(eval_num_type(env, type->args[0]), eval_num_type(env, type->args[1]));
        case mul:
            return nat_mul(eval_num_type(env, type->args[0]), eval_num_type(env, type->args[1]));
        case min:
            return nat_min(eval_num_type(env, type->args[0]), eval_num_type(env, type->args[1]));
        case max:
            return nat_max(eval_num_type(env, type->args[0]), eval_num_type(env, type->args[1]));
    }
    eval_panic("eval_type", {fmt::format("unexpected type {}", type->string())});
}

auto eval_num_type(const type_env& env, const type_expr* type) -> nat
{
    auto result = eval_type(env, type);
    if (const auto* num = std::get_if<nat>(&result)) {
        return *num;
    }
    eval_panic("eval_num_type", {fmt::format("expected a numeric type, got {}", type->string())});
}

auto eval_value_type(const type_env& env, const type_expr* type) -> tvalue
{
    auto result = eval_type(env, type);
    if (auto* val = std::get_if<tvalue>(&result)) {
        return std::move(*val);
    }
    eval_panic("eval_value_type", {fmt::format("expected a value type, got {}", type->string())});
}
