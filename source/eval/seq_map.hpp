#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <utility>

#include "thunk.hpp"

template<typename Sym>
struct generic_value;

template<typename Sym>
using lazy_value = thunk<generic_value<Sym>>*;

using index_type = std::uint64_t;

// Index-addressable collection of suspended values. Point updates are layered
// over the underlying rule and share every untouched entry with the original.
// A map built from a packed word remembers the word.
template<typename Sym>
class seq_map final
{
  public:
    using lazy = lazy_value<Sym>;
    using word_type = typename Sym::word_type;
    using lookup_fn = std::function<lazy(index_type)>;
    using update_map = std::map<index_type, lazy>;

    explicit seq_map(lookup_fn lookup)
        : m_lookup {std::move(lookup)}
    {
    }

    seq_map(lookup_fn lookup, word_type word)
        : m_lookup {std::move(lookup)}
        , m_word {std::move(word)}
    {
    }

    [[nodiscard]] auto lookup(index_type index) const -> lazy
    {
        if (m_updates) {
            if (const auto itr = m_updates->find(index); itr != m_updates->end()) {
                return itr->second;
            }
        }
        return m_lookup(index);
    }

    [[nodiscard]] auto update(index_type index, lazy val) const -> seq_map
    {
        auto updates = m_updates ? std::make_shared<update_map>(*m_updates) : std::make_shared<update_map>();
        (*updates)[index] = val;
        seq_map result {m_lookup};
        result.m_updates = std::move(updates);
        return result;
    }

    [[nodiscard]] auto packed_word() const -> const std::optional<word_type>& { return m_word; }

  private:
    lookup_fn m_lookup;
    std::shared_ptr<const update_map> m_updates;
    std::optional<word_type> m_word;
};
