#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "type.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>

#include "util.hpp"

auto operator<<(std::ostream& ostrm, type_kind knd) -> std::ostream&
{
    switch (knd) {
        case type_kind::type:
            return ostrm << "*";
        case type_kind::num:
            return ostrm << "#";
        case type_kind::prop:
            return ostrm << "Prop";
    }
    return ostrm << "?";
}

namespace
{
auto operator_symbol(type_expr::tag oper) -> std::string_view
{
    using enum type_expr::tag;
    switch (oper) {
        case add:
            return "+";
        case sub:
            return "-";
        case mul:
            return "*";
        case min:
            return "min";
        case max:
            return "max";
        default:
            return "?";
    }
}
}  // namespace

auto type_expr::string() const -> std::string
{
    using enum type_expr::tag;
    switch (t) {
        case var:
            return name;
        case num:
            return std::to_string(number);
        case inf:
            return "inf";
        case bit:
            return "Bit";
        case integer:
            return "Integer";
        case seq:
            return fmt::format("[{}]{}", args[0]->string(), args[1]->string());
        case tuple:
            return fmt::format("({})", join(args, ", "));
        case record: {
            std::vector<std::string> strs;
            for (auto idx = 0UL; idx < fields.size(); ++idx) {
                strs.push_back(fmt::format("{} : {}", fields[idx], args[idx]->string()));
            }
            return fmt::format("{{{}}}", fmt::join(strs, ", "));
        }
        case function:
            return fmt::format("({} -> {})", args[0]->string(), args[1]->string());
        case min:
        case max:
            return fmt::format("{} {} {}", operator_symbol(t), args[0]->string(), args[1]->string());
        case add:
        case sub:
        case mul:
            return fmt::format("({} {} {})", args[0]->string(), operator_symbol(t), args[1]->string());
    }
    return "?";
}

auto schema::string() const -> std::string
{
    std::string result;
    if (!params.empty()) {
        std::vector<std::string> strs;
        for (const auto& param : params) {
            strs.push_back(param.kind == type_kind::num ? fmt::format("{} : #", param.name) : param.name);
        }
        result += fmt::format("{{{}}} ", fmt::join(strs, ", "));
    }
    if (!props.empty()) {
        result += fmt::format("({}) => ", join(props, ", "));
    }
    return result + (type != nullptr ? type->string() : "?");
}

namespace
{
auto make_type(type_expr::tag tag, std::vector<const type_expr*> args = {}) -> type_expr*
{
    auto* type = make<type_expr>();
    type->t = tag;
    type->args = std::move(args);
    return type;
}
}  // namespace

auto t_var(std::string name) -> const type_expr*
{
    auto* type = make_type(type_expr::tag::var);
    type->name = std::move(name);
    return type;
}

auto t_num(std::uint64_t num) -> const type_expr*
{
    auto* type = make_type(type_expr::tag::num);
    type->number = num;
    return type;
}

auto t_inf() -> const type_expr*
{
    return make_type(type_expr::tag::inf);
}

auto t_bit() -> const type_expr*
{
    return make_type(type_expr::tag::bit);
}

auto t_integer() -> const type_expr*
{
    return make_type(type_expr::tag::integer);
}

auto t_seq(const type_expr* len, const type_expr* elem) -> const type_expr*
{
    return make_type(type_expr::tag::seq, {len, elem});
}

auto t_word(std::uint64_t width) -> const type_expr*
{
    return t_seq(t_num(width), t_bit());
}

auto t_stream(const type_expr* elem) -> const type_expr*
{
    return t_seq(t_inf(), elem);
}

auto t_tuple(std::vector<const type_expr*> elems) -> const type_expr*
{
    return make_type(type_expr::tag::tuple, std::move(elems));
}

auto t_record(std::vector<std::pair<std::string, const type_expr*>> fields) -> const type_expr*
{
    auto* type = make_type(type_expr::tag::record);
    for (auto& [name, field_type] : fields) {
        type->fields.push_back(std::move(name));
        type->args.push_back(field_type);
    }
    return type;
}

auto t_fun(const type_expr* arg, const type_expr* res) -> const type_expr*
{
    return make_type(type_expr::tag::function, {arg, res});
}

auto t_op(type_expr::tag oper, const type_expr* lhs, const type_expr* rhs) -> const type_expr*
{
    return make_type(oper, {lhs, rhs});
}

auto mono(const type_expr* type) -> const schema*
{
    auto* sig = make<schema>();
    sig->type = type;
    return sig;
}
