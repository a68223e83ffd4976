#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ast/type.hpp>
#include <eval/hole.hpp>
#include <eval/thunk.hpp>
#include <gc.hpp>

// Suspension primitives shared by the shipped backends. A backend may shadow
// these to change how computations are suspended.
struct lazy_backend
{
    template<typename V>
    auto delay(std::function<V()> comp, std::string label = {}) const -> thunk<V>*
    {
        return make<thunk<V>>(std::move(comp), std::move(label));
    }

    template<typename V>
    auto ready(V val) const -> thunk<V>*
    {
        return make<thunk<V>>(std::in_place, std::move(val));
    }

    template<typename V>
    auto declare_hole(std::string name, const schema* sig, std::string label) const -> hole<V>*
    {
        auto* hle = make<hole<V>>(std::move(name), sig, label);
        hle->set_read_handle(make<thunk<V>>([hle]() { return hle->read(); }, std::move(label)));
        return hle;
    }
};

// Bits, words and integers of a backend, plus the operations the evaluator and
// the prelude need on them. Words are big-endian: bit 0 is the most
// significant.
template<typename Sym>
concept backend = std::derived_from<Sym, lazy_backend>
    && requires(const Sym& sym,
                typename Sym::bit_type bit,
                typename Sym::word_type word,
                typename Sym::integer_type integer,
                const std::vector<typename Sym::bit_type>& bits,
                std::uint64_t index,
                std::int64_t literal) {
           { sym.bit_lit(true) } -> std::same_as<typename Sym::bit_type>;
           { sym.bit_as_lit(bit) } -> std::same_as<std::optional<bool>>;
           { sym.bit_complement(bit) } -> std::same_as<typename Sym::bit_type>;
           { sym.bit_and(bit, bit) } -> std::same_as<typename Sym::bit_type>;
           { sym.bit_or(bit, bit) } -> std::same_as<typename Sym::bit_type>;
           { sym.bit_eq(bit, bit) } -> std::same_as<typename Sym::bit_type>;
           { sym.ite_bit(bit, bit, bit) } -> std::same_as<typename Sym::bit_type>;
           { sym.bit_string(bit) } -> std::same_as<std::string>;

           { sym.word_lit(index, index) } -> std::same_as<typename Sym::word_type>;
           { sym.word_len(word) } -> std::same_as<std::uint64_t>;
           { sym.word_bit(word, index) } -> std::same_as<typename Sym::bit_type>;
           { sym.pack_word(bits) } -> std::same_as<std::optional<typename Sym::word_type>>;
           { sym.word_as_lit(word) } -> std::same_as<std::optional<std::uint64_t>>;
           { sym.ite_word(bit, word, word) } -> std::same_as<typename Sym::word_type>;
           { sym.word_string(word) } -> std::same_as<std::string>;

           { sym.integer_lit(literal) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_as_lit(integer) } -> std::same_as<std::optional<std::int64_t>>;
           { sym.integer_add(integer, integer) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_sub(integer, integer) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_mul(integer, integer) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_div(integer, integer) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_eq(integer, integer) } -> std::same_as<typename Sym::bit_type>;
           { sym.integer_lt(integer, integer) } -> std::same_as<typename Sym::bit_type>;
           { sym.ite_integer(bit, integer, integer) } -> std::same_as<typename Sym::integer_type>;
           { sym.integer_string(integer) } -> std::same_as<std::string>;
       };
