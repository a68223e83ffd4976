#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/selector.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "error.hpp"
#include "value_ops.hpp"

namespace
{
[[noreturn]] void set_sel_mismatch(const tvalue& type, const selector& sel, const std::string& msg)
{
    eval_panic("evaluator::eval_set_sel", {msg, fmt::format("Selector: {}", sel.string()), fmt::format("Type: {}", type)});
}

// Compares the container against the shape the type checker recorded on the
// selector, if any.
void check_size(std::string_view where, const selector& sel, std::size_t actual)
{
    if (sel.size && *sel.size != actual) {
        eval_panic(where,
                   {fmt::format("selector {} expects a container of size {}", sel.string(), *sel.size),
                    fmt::format("actual size: {}", actual)});
    }
}

void check_fields(std::string_view where, const selector& sel, std::vector<std::string> actual)
{
    if (!sel.field_names) {
        return;
    }
    auto expected = *sel.field_names;
    std::sort(expected.begin(), expected.end());
    std::sort(actual.begin(), actual.end());
    if (expected != actual) {
        eval_panic(where,
                   {fmt::format("selector {} expects fields {}", sel.string(), expected),
                    fmt::format("actual fields: {}", actual)});
    }
}
}  // namespace

template<backend Sym>
auto evaluator<Sym>::eval_sel(const value_type& val, const selector& sel) const -> lazy
{
    switch (sel.k) {
        case selector::kind::tuple: {
            if (!std::holds_alternative<typename value_type::tuple>(val.data) && !is_error(val)) {
                eval_panic("evaluator::eval_sel", {"Unexpected value in tuple selection", sel.string()});
            }
            const auto& elems = from_tuple(val);
            check_size("evaluator::eval_sel", sel, elems.size());
            if (sel.index >= elems.size()) {
                eval_panic("evaluator::eval_sel",
                           {fmt::format("tuple index {} out of range for arity {}", sel.index, elems.size())});
            }
            return elems[sel.index];
        }
        case selector::kind::record: {
            if (!std::holds_alternative<typename value_type::record>(val.data) && !is_error(val)) {
                eval_panic("evaluator::eval_sel", {"Unexpected value in record selection", sel.string()});
            }
            const auto& fields = from_record(val);
            std::vector<std::string> names;
            std::transform(
                fields.begin(), fields.end(), std::back_inserter(names), [](const auto& field) { return field.first; });
            check_fields("evaluator::eval_sel", sel, names);
            const auto itr = fields.find(sel.field);
            if (itr == fields.end()) {
                eval_panic("evaluator::eval_sel",
                           {fmt::format("record has no field `{}`", sel.field), fmt::format("fields: {}", names)});
            }
            return itr->second;
        }
        case selector::kind::list: {
            if (const auto* word = std::get_if<typename value_type::word>(&val.data)) {
                check_size("evaluator::eval_sel", sel, m_sym.word_len(word->value));
                if (sel.index >= m_sym.word_len(word->value)) {
                    eval_panic("evaluator::eval_sel",
                               {fmt::format("index {} out of range for a word of width {}",
                                            sel.index,
                                            m_sym.word_len(word->value))});
                }
                return ready_value(m_sym, make_bit<Sym>(m_sym.word_bit(word->value, sel.index)));
            }
            if (!std::holds_alternative<typename value_type::seq>(val.data) && !is_error(val)) {
                eval_panic("evaluator::eval_sel", {"Unexpected value in list selection", sel.string()});
            }
            const auto& seq = value_as<typename value_type::seq>(val, "sequence");
            if (seq.length.is_finite()) {
                check_size("evaluator::eval_sel", sel, seq.length.get());
            }
            if (seq.length.is_finite() && sel.index >= seq.length.get()) {
                eval_panic("evaluator::eval_sel",
                           {fmt::format("index {} out of range for a sequence of length {}", sel.index, seq.length)});
            }
            return lookup_seq_map(seq.values, sel.index);
        }
    }
    eval_panic("evaluator::eval_sel", {"unknown selector", sel.string()});
}

// Every component other than the updated one is re-read from the original
// container when forced.
template<backend Sym>
auto evaluator<Sym>::eval_set_sel(const tvalue& type, lazy target, const selector& sel, lazy val) const
    -> value_type
{
    if (type.is(tvalue::kind::tuple) && sel.k == selector::kind::tuple) {
        if (sel.index >= type.elems.size()) {
            set_sel_mismatch(type, sel, "tuple index out of range");
        }
        check_size("evaluator::eval_set_sel", sel, type.elems.size());
        std::vector<lazy> elems;
        elems.reserve(type.elems.size());
        for (std::size_t idx = 0; idx < type.elems.size(); ++idx) {
            if (idx == sel.index) {
                elems.push_back(val);
                continue;
            }
            elems.push_back(delay_value(m_sym,
                                        [target, idx]()
                                        {
                                            const auto& orig = from_tuple(target->force());
                                            return orig.at(idx)->force();
                                        }));
        }
        return make_tuple<Sym>(std::move(elems));
    }

    if (type.is(tvalue::kind::record) && sel.k == selector::kind::record) {
        if (std::find(type.fields.begin(), type.fields.end(), sel.field) == type.fields.end()) {
            set_sel_mismatch(type, sel, fmt::format("record type has no field `{}`", sel.field));
        }
        check_fields("evaluator::eval_set_sel", sel, type.fields);
        std::map<std::string, lazy> fields;
        for (const auto& name : type.fields) {
            if (name == sel.field) {
                fields.emplace(name, val);
                continue;
            }
            fields.emplace(name,
                           delay_value(m_sym,
                                       [target, name, expected = type.fields]()
                                       {
                                           const auto& orig = from_record(target->force());
                                           const auto itr = orig.find(name);
                                           if (itr == orig.end()) {
                                               eval_panic("evaluator::eval_set_sel",
                                                          {"missing field!",
                                                           name,
                                                           fmt::format("Expected: {}", expected)});
                                           }
                                           return itr->second->force();
                                       }));
        }
        return make_record<Sym>(std::move(fields));
    }

    if ((type.is(tvalue::kind::seq) || type.is(tvalue::kind::stream)) && sel.k == selector::kind::list) {
        if (type.is(tvalue::kind::seq)) {
            check_size("evaluator::eval_set_sel", sel, type.len);
        }
        auto vals = delay_seq_map(m_sym, target);
        return make_seq<Sym>(type.length(), type.element(), update_seq_map(vals, sel.index, val));
    }

    set_sel_mismatch(type, sel, "type/selector mismatch");
}

template auto evaluator<concrete>::eval_sel(const value_type& val, const selector& sel) const -> lazy;
template auto evaluator<concrete>::eval_set_sel(const tvalue& type, lazy target, const selector& sel, lazy val) const
    -> value_type;
template auto evaluator<symbolic>::eval_sel(const value_type& val, const selector& sel) const -> lazy;
template auto evaluator<symbolic>::eval_set_sel(const tvalue& type, lazy target, const selector& sel, lazy val) const
    -> value_type;
