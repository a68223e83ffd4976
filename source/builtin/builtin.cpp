#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "builtin.hpp"

#include <ast/declaration.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <eval/error.hpp>
#include <eval/nat.hpp>
#include <eval/type_value.hpp>
#include <eval/value.hpp>
#include <eval/value_ops.hpp>
#include <fmt/format.h>

namespace
{

template<backend Sym>
using binary_op = std::function<generic_value<Sym>(lazy_value<Sym>, lazy_value<Sym>)>;

template<backend Sym>
auto binary(binary_op<Sym> oper) -> generic_value<Sym>
{
    return make_fun<Sym>([oper](lazy_value<Sym> lhs)
                         { return make_fun<Sym>([oper, lhs](lazy_value<Sym> rhs) { return oper(lhs, rhs); }); });
}

[[noreturn]] void unsupported_at(std::string_view name, const tvalue& type)
{
    throw_eval_error(eval_error::kind::unsupported, "`{}` is not supported at type {}", name, type);
}

auto to_unsigned(const nat& num, std::string_view name) -> std::uint64_t
{
    if (num.is_inf()) {
        throw_eval_error(eval_error::kind::unsupported, "`{}` needs a finite number", name);
    }
    return num.get();
}

auto to_signed(const nat& num, std::string_view name) -> std::int64_t
{
    const auto val = to_unsigned(num, name);
    if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw_eval_error(eval_error::kind::unsupported, "`{}`: {} does not fit a 64-bit integer", name, val);
    }
    return static_cast<std::int64_t>(val);
}

template<backend Sym>
auto integer_arith(std::string_view name,
                   std::function<typename Sym::integer_type(typename Sym::integer_type, typename Sym::integer_type)>
                       oper) -> generic_value<Sym>
{
    return make_poly<Sym>(
        [name, oper](const tvalue& type)
        {
            if (!type.is(tvalue::kind::integer)) {
                unsupported_at(name, type);
            }
            return binary<Sym>([oper](lazy_value<Sym> lhs, lazy_value<Sym> rhs)
                               { return make_integer<Sym>(oper(from_integer(lhs->force()), from_integer(rhs->force()))); });
        });
}

// Structural equality of two values of type `type`, forcing both completely.
template<backend Sym>
auto values_equal(const Sym& sym, const tvalue& type, const generic_value<Sym>& lhs, const generic_value<Sym>& rhs)
    -> typename Sym::bit_type
{
    switch (type.k) {
        case tvalue::kind::bit:
            return sym.bit_eq(from_bit(lhs), from_bit(rhs));
        case tvalue::kind::integer:
            return sym.integer_eq(from_integer(lhs), from_integer(rhs));
        case tvalue::kind::seq: {
            auto result = sym.bit_lit(true);
            const auto lvals = seq_map_of(sym, lhs);
            const auto rvals = seq_map_of(sym, rhs);
            for (index_type idx = 0; idx < type.len; ++idx) {
                result = sym.bit_and(
                    result, values_equal(sym, type.element(), lvals.lookup(idx)->force(), rvals.lookup(idx)->force()));
            }
            return result;
        }
        case tvalue::kind::tuple: {
            auto result = sym.bit_lit(true);
            const auto& lelems = from_tuple(lhs);
            const auto& relems = from_tuple(rhs);
            for (size_t idx = 0; idx < type.elems.size(); ++idx) {
                result = sym.bit_and(result, values_equal(sym, type.elems[idx], lelems[idx]->force(), relems[idx]->force()));
            }
            return result;
        }
        default:
            unsupported_at("==", type);
    }
}

template<backend Sym>
auto decode_string(const Sym& sym, const generic_value<Sym>& str, std::uint64_t len) -> std::string
{
    std::string result;
    const auto chars = seq_map_of(sym, str);
    for (index_type idx = 0; idx < len; ++idx) {
        const auto bits = seq_map_of(sym, chars.lookup(idx)->force());
        unsigned code = 0;
        bool known = true;
        for (index_type bit = 0; bit < 8; ++bit) {
            const auto lit = sym.bit_as_lit(from_bit(bits.lookup(bit)->force()));
            known = known && lit.has_value();
            code = (code << 1U) | (lit.value_or(false) ? 1U : 0U);
        }
        result.push_back(known ? static_cast<char>(code) : '?');
    }
    return result;
}

template<backend Sym>
auto make_builtins() -> std::vector<builtin<Sym>>
{
    using value_type = generic_value<Sym>;
    using lazy = lazy_value<Sym>;
    using int_type = typename Sym::integer_type;

    return {
        {"True", "Bit", [](const Sym& sym) { return make_bit<Sym>(sym.bit_lit(true)); }},
        {"False", "Bit", [](const Sym& sym) { return make_bit<Sym>(sym.bit_lit(false)); }},
        {"complement",
         "Bit -> Bit",
         [](const Sym& sym)
         { return make_fun<Sym>([&sym](lazy arg) { return make_bit<Sym>(sym.bit_complement(from_bit(arg->force()))); }); }},
        {"&&",
         "Bit -> Bit -> Bit",
         [](const Sym& sym)
         {
             return binary<Sym>(
                 [&sym](lazy lhs, lazy rhs) -> value_type
                 {
                     auto left = from_bit(lhs->force());
                     if (const auto lit = sym.bit_as_lit(left)) {
                         return *lit ? rhs->force() : make_bit<Sym>(left);
                     }
                     return make_bit<Sym>(sym.bit_and(left, from_bit(rhs->force())));
                 });
         }},
        {"||",
         "Bit -> Bit -> Bit",
         [](const Sym& sym)
         {
             return binary<Sym>(
                 [&sym](lazy lhs, lazy rhs) -> value_type
                 {
                     auto left = from_bit(lhs->force());
                     if (const auto lit = sym.bit_as_lit(left)) {
                         return *lit ? make_bit<Sym>(left) : rhs->force();
                     }
                     return make_bit<Sym>(sym.bit_or(left, from_bit(rhs->force())));
                 });
         }},
        {"number",
         "{val, a} (Literal val a) => a",
         [](const Sym& sym)
         {
             return make_num_poly<Sym>(
                 [&sym](const nat& val)
                 {
                     return make_poly<Sym>(
                         [&sym, val](const tvalue& type) -> value_type
                         {
                             if (type.is(tvalue::kind::integer)) {
                                 return make_integer<Sym>(sym.integer_lit(to_signed(val, "number")));
                             }
                             const auto num = to_unsigned(val, "number");
                             if (type.is(tvalue::kind::bit) && num <= 1) {
                                 return make_bit<Sym>(sym.bit_lit(num == 1));
                             }
                             if (type.is(tvalue::kind::seq) && type.element().is(tvalue::kind::bit)) {
                                 return make_word<Sym>(sym.word_lit(type.len, num));
                             }
                             unsupported_at("number", type);
                         });
                 });
         }},
        {"+",
         "{a} (Ring a) => a -> a -> a",
         [](const Sym& sym)
         { return integer_arith<Sym>("+", [&sym](int_type lhs, int_type rhs) { return sym.integer_add(lhs, rhs); }); }},
        {"-",
         "{a} (Ring a) => a -> a -> a",
         [](const Sym& sym)
         { return integer_arith<Sym>("-", [&sym](int_type lhs, int_type rhs) { return sym.integer_sub(lhs, rhs); }); }},
        {"*",
         "{a} (Ring a) => a -> a -> a",
         [](const Sym& sym)
         { return integer_arith<Sym>("*", [&sym](int_type lhs, int_type rhs) { return sym.integer_mul(lhs, rhs); }); }},
        {"/",
         "{a} (Integral a) => a -> a -> a",
         [](const Sym& sym)
         { return integer_arith<Sym>("/", [&sym](int_type lhs, int_type rhs) { return sym.integer_div(lhs, rhs); }); }},
        {"==",
         "{a} (Eq a) => a -> a -> Bit",
         [](const Sym& sym)
         {
             return make_poly<Sym>(
                 [&sym](const tvalue& type)
                 {
                     return binary<Sym>([&sym, type](lazy lhs, lazy rhs)
                                        { return make_bit<Sym>(values_equal(sym, type, lhs->force(), rhs->force())); });
                 });
         }},
        {"<",
         "{a} (Cmp a) => a -> a -> Bit",
         [](const Sym& sym)
         {
             return make_poly<Sym>(
                 [&sym](const tvalue& type)
                 {
                     if (!type.is(tvalue::kind::integer)) {
                         unsupported_at("<", type);
                     }
                     return binary<Sym>(
                         [&sym](lazy lhs, lazy rhs) {
                             return make_bit<Sym>(
                                 sym.integer_lt(from_integer(lhs->force()), from_integer(rhs->force())));
                         });
                 });
         }},
        {"infFrom",
         "{a} (Integral a) => a -> [inf]a",
         [](const Sym& sym)
         {
             return make_poly<Sym>(
                 [&sym](const tvalue& type)
                 {
                     if (!type.is(tvalue::kind::integer)) {
                         unsupported_at("infFrom", type);
                     }
                     return make_fun<Sym>(
                         [&sym, type](lazy first)
                         {
                             auto vals = generate_seq_map<Sym>(
                                 [&sym, first](index_type index)
                                 {
                                     return delay_value(
                                         sym,
                                         [&sym, first, index]()
                                         {
                                             return make_integer<Sym>(
                                                 sym.integer_add(from_integer(first->force()),
                                                                 sym.integer_lit(static_cast<std::int64_t>(index))));
                                         });
                                 });
                             return make_seq<Sym>(nat::inf(), type, memo_map(vals));
                         });
                 });
         }},
        {"fromTo",
         "{first, last, a} (fin last, last >= first, Literal last a) => [1 + (last - first)]a",
         [](const Sym& sym)
         {
             return make_num_poly<Sym>(
                 [&sym](const nat& first)
                 {
                     return make_num_poly<Sym>(
                         [&sym, first](const nat& last)
                         {
                             return make_poly<Sym>(
                                 [&sym, first, last](const tvalue& type)
                                 {
                                     if (!type.is(tvalue::kind::integer)) {
                                         unsupported_at("fromTo", type);
                                     }
                                     const auto low = to_signed(first, "fromTo");
                                     const auto high = to_signed(last, "fromTo");
                                     std::vector<lazy> elems;
                                     for (auto num = low; low <= high; ++num) {
                                         elems.push_back(ready_value(sym, make_integer<Sym>(sym.integer_lit(num))));
                                         if (num == high) {
                                             break;
                                         }
                                     }
                                     const auto len = nat::finite(elems.size());
                                     return make_seq<Sym>(len, type, finite_seq_map<Sym>(std::move(elems)));
                                 });
                         });
                 });
         }},
        {"error",
         "{a, n} (fin n) => String n -> a",
         [](const Sym& sym)
         {
             return make_poly<Sym>(
                 [&sym](const tvalue& /*type*/)
                 {
                     return make_num_poly<Sym>(
                         [&sym](const nat& len)
                         {
                             return make_fun<Sym>(
                                 [&sym, len](lazy msg)
                                 {
                                     return make_error_value<Sym>(
                                         eval_error::kind::user,
                                         decode_string(sym, msg->force(), len.is_finite() ? len.get() : 0));
                                 });
                         });
                 });
         }},
    };
}

}  // namespace

template<backend Sym>
auto builtins() -> const std::vector<builtin<Sym>>&
{
    static const std::vector<builtin<Sym>> bltns = make_builtins<Sym>();
    return bltns;
}

template<backend Sym>
auto prelude_primitives(const Sym& sym) -> primitive_table<Sym>
{
    return [&sym](const std::string& name) -> std::optional<generic_value<Sym>>
    {
        for (const auto& bltn : builtins<Sym>()) {
            if (bltn.name == name) {
                return bltn.body(sym);
            }
        }
        return std::nullopt;
    };
}

// The names do not depend on the backend.
auto prelude_decls() -> const decl_groups&
{
    static const decl_groups groups = []()
    {
        decl_groups result;
        for (const auto& bltn : builtins<concrete>()) {
            result.push_back(non_recursive(make_prim(bltn.name, nullptr)));
        }
        return result;
    }();
    return groups;
}

template auto builtins<concrete>() -> const std::vector<builtin<concrete>>&;
template auto builtins<symbolic>() -> const std::vector<builtin<symbolic>>&;
template auto prelude_primitives<concrete>(const concrete& sym) -> primitive_table<concrete>;
template auto prelude_primitives<symbolic>(const symbolic& sym) -> primitive_table<symbolic>;
