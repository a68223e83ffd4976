#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "seq_map.hpp"
#include "type_value.hpp"

// Scoped bindings of names to suspended values and of type variables to
// types. Never changed after construction: binding yields a child scope that
// shadows its parent.
template<typename Sym>
struct environment final
{
    using lazy = lazy_value<Sym>;

    explicit environment(const environment* outer_env = nullptr);

    static auto empty() -> const environment*;

    [[nodiscard]] auto lookup_var(const std::string& name) const -> lazy;
    [[nodiscard]] auto lookup_type(const std::string& name) const -> const type_binding*;

    [[nodiscard]] auto bind_var_direct(const std::string& name, lazy val) const -> const environment*;
    [[nodiscard]] auto bind_vars(const std::vector<std::pair<std::string, lazy>>& vals) const -> const environment*;
    [[nodiscard]] auto bind_type(const std::string& name, type_binding binding) const -> const environment*;

    [[nodiscard]] auto type_bindings() const -> const type_env& { return *types; }

    void debug() const;

    std::unordered_map<std::string, lazy> store;
    std::shared_ptr<const type_env> types;
    const environment* outer {};
};
