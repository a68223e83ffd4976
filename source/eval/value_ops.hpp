#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <backend/backend.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <overloaded.hpp>

#include "error.hpp"
#include "nat.hpp"
#include "seq_map.hpp"
#include "type_value.hpp"
#include "value.hpp"

template<backend Sym>
auto delay_value(const Sym& sym, std::type_identity_t<std::function<generic_value<Sym>()>> comp, std::string label = {})
    -> lazy_value<Sym>
{
    return sym.template delay<generic_value<Sym>>(std::move(comp), std::move(label));
}

template<backend Sym>
auto ready_value(const Sym& sym, generic_value<Sym> val) -> lazy_value<Sym>
{
    return sym.template ready<generic_value<Sym>>(std::move(val));
}

template<backend Sym>
auto generate_seq_map(std::function<lazy_value<Sym>(index_type)> rule) -> seq_map<Sym>
{
    return seq_map<Sym> {std::move(rule)};
}

// Wraps a map so that every index is computed at most once.
template<backend Sym>
auto memo_map(const seq_map<Sym>& vals) -> seq_map<Sym>
{
    auto cache = std::make_shared<std::map<index_type, lazy_value<Sym>>>();
    auto memoized = [vals, cache](index_type index) -> lazy_value<Sym>
    {
        if (const auto itr = cache->find(index); itr != cache->end()) {
            return itr->second;
        }
        auto* val = vals.lookup(index);
        cache->emplace(index, val);
        return val;
    };
    if (const auto& word = vals.packed_word()) {
        return seq_map<Sym> {std::move(memoized), *word};
    }
    return seq_map<Sym> {std::move(memoized)};
}

template<backend Sym>
auto finite_seq_map(std::vector<lazy_value<Sym>> elems) -> seq_map<Sym>
{
    return seq_map<Sym> {[elems = std::move(elems)](index_type index) -> lazy_value<Sym>
                         {
                             if (index >= elems.size()) {
                                 throw_eval_error(eval_error::kind::invalid_index,
                                                  "index {} out of bounds for a sequence of length {}",
                                                  index,
                                                  elems.size());
                             }
                             return elems[index];
                         }};
}

template<backend Sym>
auto lookup_seq_map(const seq_map<Sym>& vals, index_type index) -> lazy_value<Sym>
{
    return vals.lookup(index);
}

template<backend Sym>
auto update_seq_map(const seq_map<Sym>& vals, index_type index, lazy_value<Sym> val) -> seq_map<Sym>
{
    return vals.update(index, val);
}

template<backend Sym>
auto unpack_seq_map(const Sym& sym, const typename Sym::word_type& word) -> seq_map<Sym>
{
    return seq_map<Sym> {[&sym, word](index_type index) -> lazy_value<Sym>
                         {
                             if (index >= sym.word_len(word)) {
                                 throw_eval_error(eval_error::kind::invalid_index,
                                                  "index {} out of bounds for a word of width {}",
                                                  index,
                                                  sym.word_len(word));
                             }
                             return ready_value(sym, make_bit<Sym>(sym.word_bit(word, index)));
                         },
                         word};
}

// The elements of a sequence-shaped value. A packed word is unpacked lazily.
template<backend Sym>
auto seq_map_of(const Sym& sym, const generic_value<Sym>& val) -> seq_map<Sym>
{
    using value_type = generic_value<Sym>;
    if (const auto* word = std::get_if<typename value_type::word>(&val.data)) {
        return unpack_seq_map(sym, word->value);
    }
    return value_as<typename value_type::seq>(val, "sequence").values;
}

// Flattens one level of nesting: position i is element i mod inner of the
// sequence at outer position i div inner.
template<backend Sym>
auto join_seq_map(const Sym& sym, const seq_map<Sym>& outer, index_type inner) -> seq_map<Sym>
{
    return seq_map<Sym> {[&sym, outer, inner](index_type index) -> lazy_value<Sym>
                         {
                             if (inner == 0) {
                                 eval_panic("join_seq_map", {fmt::format("lookup of {} in an empty join", index)});
                             }
                             auto* row = outer.lookup(index / inner);
                             return delay_value(sym,
                                                [&sym, row, index, inner]()
                                                { return seq_map_of(sym, row->force()).lookup(index % inner)->force(); });
                         }};
}

// Elements of a sequence that is not forced until one of them is demanded.
template<backend Sym>
auto delay_seq_map(const Sym& sym, lazy_value<Sym> vals) -> seq_map<Sym>
{
    return memo_map(seq_map<Sym> {[&sym, vals](index_type index) -> lazy_value<Sym>
                                  {
                                      return delay_value(sym,
                                                         [&sym, vals, index]()
                                                         { return seq_map_of(sym, vals->force()).lookup(index)->force(); });
                                  }});
}

// Packs bits that are already evaluated. Anything still suspended, or a
// backend refusing the width, leaves the sequence lazy.
template<backend Sym>
auto try_pack_bits(const Sym& sym, const std::vector<lazy_value<Sym>>& bits) -> std::optional<typename Sym::word_type>
{
    std::vector<typename Sym::bit_type> forced;
    forced.reserve(bits.size());
    for (auto* bit : bits) {
        if (!bit->is_forced()) {
            return std::nullopt;
        }
        const auto& val = bit->force();
        if (is_error(val)) {
            return std::nullopt;
        }
        forced.push_back(from_bit(val));
    }
    return sym.pack_word(forced);
}

template<backend Sym>
auto merge_value(const Sym& sym, const tvalue& type, typename Sym::bit_type cond, const generic_value<Sym>& lhs, const generic_value<Sym>& rhs)
    -> generic_value<Sym>;

namespace detail
{
template<backend Sym>
auto merge_lazy(const Sym& sym, const tvalue& type, typename Sym::bit_type cond, lazy_value<Sym> lhs, lazy_value<Sym> rhs)
    -> lazy_value<Sym>
{
    return delay_value(sym,
                       [&sym, type, cond, lhs, rhs]() { return merge_value(sym, type, cond, lhs->force(), rhs->force()); });
}

// A packed word as the sequence of its bits.
template<backend Sym>
auto as_bit_seq(const Sym& sym, const generic_value<Sym>& val) -> generic_value<Sym>
{
    if (const auto* word = std::get_if<typename generic_value<Sym>::word>(&val.data)) {
        return make_seq<Sym>(nat::finite(sym.word_len(word->value)), tvalue::bit(), unpack_seq_map(sym, word->value));
    }
    return val;
}

template<backend Sym>
auto merge_seq(const Sym& sym,
               typename Sym::bit_type cond,
               const typename generic_value<Sym>::seq& lhs,
               const typename generic_value<Sym>::seq& rhs) -> generic_value<Sym>
{
    const auto& lword = lhs.values.packed_word();
    const auto& rword = rhs.values.packed_word();
    if (lword && rword) {
        return make_seq(lhs.length, lhs.element, unpack_seq_map(sym, sym.ite_word(cond, *lword, *rword)));
    }
    auto elem = lhs.element;
    auto lvals = lhs.values;
    auto rvals = rhs.values;
    return make_seq(lhs.length,
                    lhs.element,
                    memo_map(generate_seq_map<Sym>(
                        [&sym, elem, cond, lvals, rvals](index_type index)
                        { return merge_lazy(sym, elem, cond, lvals.lookup(index), rvals.lookup(index)); })));
}
}  // namespace detail

// Pointwise if-then-else of two values of the same type, for a condition that
// is not a literal. No path condition is tracked, so a branch that fails makes
// the merged value fail whatever the condition.
template<backend Sym>
auto merge_value(const Sym& sym, const tvalue& type, typename Sym::bit_type cond, const generic_value<Sym>& lhs, const generic_value<Sym>& rhs)
    -> generic_value<Sym>
{
    using value_type = generic_value<Sym>;
    if (is_error(lhs)) {
        return lhs;
    }
    if (is_error(rhs)) {
        return rhs;
    }
    if (lhs.data.index() != rhs.data.index()) {
        if (std::holds_alternative<typename value_type::word>(lhs.data)
            || std::holds_alternative<typename value_type::word>(rhs.data))
        {
            return merge_value(sym, type, cond, detail::as_bit_seq(sym, lhs), detail::as_bit_seq(sym, rhs));
        }
        eval_panic("merge_value",
                   {fmt::format("cannot merge a {} with a {}", kind_name(lhs), kind_name(rhs)),
                    fmt::format("type: {}", type)});
    }
    return std::visit(
        overloaded {
            [&](const typename value_type::bit& left) -> value_type
            { return make_bit<Sym>(sym.ite_bit(cond, left.value, std::get<typename value_type::bit>(rhs.data).value)); },
            [&](const typename value_type::integer& left) -> value_type
            {
                return make_integer<Sym>(
                    sym.ite_integer(cond, left.value, std::get<typename value_type::integer>(rhs.data).value));
            },
            [&](const typename value_type::word& left) -> value_type
            { return make_word<Sym>(sym.ite_word(cond, left.value, std::get<typename value_type::word>(rhs.data).value)); },
            [&](const typename value_type::seq& left) -> value_type
            { return detail::merge_seq(sym, cond, left, std::get<typename value_type::seq>(rhs.data)); },
            [&](const typename value_type::tuple& left) -> value_type
            {
                const auto& right = std::get<typename value_type::tuple>(rhs.data).elements;
                std::vector<lazy_value<Sym>> elems;
                elems.reserve(left.elements.size());
                for (size_t idx = 0; idx < left.elements.size(); ++idx) {
                    const auto& elem_type = idx < type.elems.size() ? type.elems[idx] : type;
                    elems.push_back(detail::merge_lazy(sym, elem_type, cond, left.elements[idx], right[idx]));
                }
                return make_tuple<Sym>(std::move(elems));
            },
            [&](const typename value_type::record& left) -> value_type
            {
                const auto& right = std::get<typename value_type::record>(rhs.data).fields;
                std::map<std::string, lazy_value<Sym>> fields;
                for (const auto& [name, val] : left.fields) {
                    tvalue field_type = type;
                    for (size_t idx = 0; idx < type.fields.size(); ++idx) {
                        if (type.fields[idx] == name) {
                            field_type = type.elems[idx];
                        }
                    }
                    fields.emplace(name, detail::merge_lazy(sym, field_type, cond, val, right.at(name)));
                }
                return make_record<Sym>(std::move(fields));
            },
            [&](const typename value_type::function& left) -> value_type
            {
                auto lfun = left.apply;
                auto rfun = std::get<typename value_type::function>(rhs.data).apply;
                auto res_type = type.is(tvalue::kind::function) ? type.elems[1] : type;
                return make_fun<Sym>([&sym, res_type, cond, lfun, rfun](lazy_value<Sym> arg)
                                     { return merge_value(sym, res_type, cond, lfun(arg), rfun(arg)); });
            },
            [&](const auto& /*other*/) -> value_type
            { eval_panic("merge_value", {fmt::format("cannot merge values of kind {}", kind_name(lhs)), type.string()}); },
        },
        lhs.data);
}

// Chooses a branch when the condition is a literal. Otherwise both branches are
// evaluated and merged.
template<backend Sym>
auto ite_value(const Sym& sym,
               const tvalue& type,
               typename Sym::bit_type cond,
               const std::type_identity_t<std::function<generic_value<Sym>()>>& consequence,
               const std::type_identity_t<std::function<generic_value<Sym>()>>& alternative) -> generic_value<Sym>
{
    if (const auto lit = sym.bit_as_lit(cond)) {
        return *lit ? consequence() : alternative();
    }
    return merge_value(sym, type, cond, consequence(), alternative());
}

// Forces a finite value completely.
template<backend Sym>
void force_value(const Sym& sym, const generic_value<Sym>& val)
{
    using value_type = generic_value<Sym>;
    std::visit(overloaded {
                   [&](const typename value_type::seq& seq)
                   {
                       if (seq.length.is_inf() || seq.values.packed_word()) {
                           return;
                       }
                       for (index_type idx = 0; idx < seq.length.get(); ++idx) {
                           force_value(sym, seq.values.lookup(idx)->force());
                       }
                   },
                   [&](const typename value_type::tuple& tup)
                   {
                       for (auto* elem : tup.elements) {
                           force_value(sym, elem->force());
                       }
                   },
                   [&](const typename value_type::record& rec)
                   {
                       for (const auto& [name, field] : rec.fields) {
                           force_value(sym, field->force());
                       }
                   },
                   [&](const typename value_type::error& err) { throw eval_error(err.kind, err.message); },
                   [](const auto& /*leaf*/) {},
               },
               val.data);
}

// Number of leading stream elements rendered by inspect.
constexpr index_type stream_preview = 5;

namespace detail
{
// A finite bit sequence renders the same whether or not it was packed.
template<backend Sym>
auto bits_string(const Sym& sym, const typename generic_value<Sym>::seq& seq) -> std::string
{
    if (const auto& word = seq.values.packed_word()) {
        return sym.word_string(*word);
    }
    std::vector<typename Sym::bit_type> bits;
    for (index_type idx = 0; idx < seq.length.get(); ++idx) {
        bits.push_back(from_bit(seq.values.lookup(idx)->force()));
    }
    if (const auto word = sym.pack_word(bits)) {
        return sym.word_string(*word);
    }
    std::vector<std::string> strs;
    for (const auto& bit : bits) {
        strs.push_back(sym.bit_string(bit));
    }
    return fmt::format("[{}]", fmt::join(strs, ", "));
}
}  // namespace detail

// Renders a value, forcing as much of it as is shown.
template<backend Sym>
auto inspect(const Sym& sym, const generic_value<Sym>& val) -> std::string
{
    using value_type = generic_value<Sym>;
    return std::visit(
        overloaded {
            [&](const typename value_type::bit& bit) { return sym.bit_string(bit.value); },
            [&](const typename value_type::integer& integer) { return sym.integer_string(integer.value); },
            [&](const typename value_type::word& word) { return sym.word_string(word.value); },
            [&](const typename value_type::seq& seq)
            {
                if (seq.length.is_finite() && seq.element.is(tvalue::kind::bit)) {
                    return detail::bits_string(sym, seq);
                }
                const auto shown = seq.length.is_inf() ? stream_preview : seq.length.get();
                std::vector<std::string> elems;
                for (index_type idx = 0; idx < shown; ++idx) {
                    elems.push_back(inspect(sym, seq.values.lookup(idx)->force()));
                }
                if (seq.length.is_inf()) {
                    elems.emplace_back("...");
                }
                return fmt::format("[{}]", fmt::join(elems, ", "));
            },
            [&](const typename value_type::tuple& tup)
            {
                std::vector<std::string> elems;
                for (auto* elem : tup.elements) {
                    elems.push_back(inspect(sym, elem->force()));
                }
                return fmt::format("({})", fmt::join(elems, ", "));
            },
            [&](const typename value_type::record& rec)
            {
                std::vector<std::string> fields;
                for (const auto& [name, field] : rec.fields) {
                    fields.push_back(fmt::format("{} = {}", name, inspect(sym, field->force())));
                }
                return fmt::format("{{{}}}", fmt::join(fields, ", "));
            },
            [](const typename value_type::function&) { return std::string {"<function>"}; },
            [](const typename value_type::poly&) { return std::string {"<polymorphic value>"}; },
            [](const typename value_type::num_poly&) { return std::string {"<polymorphic value>"}; },
            [](const typename value_type::error& err) -> std::string { throw eval_error(err.kind, err.message); },
        },
        val.data);
}
