#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "environment.hpp"

#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <fmt/format.h>
#include <gc.hpp>
#include <overloaded.hpp>

#include "value.hpp"

template<typename Sym>
environment<Sym>::environment(const environment* outer_env)
    : types {outer_env != nullptr ? outer_env->types : std::make_shared<const type_env>()}
    , outer(outer_env)
{
}

template<typename Sym>
auto environment<Sym>::empty() -> const environment*
{
    return make<environment>();
}

template<typename Sym>
auto environment<Sym>::lookup_var(const std::string& name) const -> lazy
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    return nullptr;
}

template<typename Sym>
auto environment<Sym>::lookup_type(const std::string& name) const -> const type_binding*
{
    if (const auto itr = types->find(name); itr != types->end()) {
        return &itr->second;
    }
    return nullptr;
}

template<typename Sym>
auto environment<Sym>::bind_var_direct(const std::string& name, lazy val) const -> const environment*
{
    auto* env = make<environment>(this);
    env->store[name] = val;
    return env;
}

template<typename Sym>
auto environment<Sym>::bind_vars(const std::vector<std::pair<std::string, lazy>>& vals) const -> const environment*
{
    auto* env = make<environment>(this);
    for (const auto& [name, val] : vals) {
        env->store[name] = val;
    }
    return env;
}

template<typename Sym>
auto environment<Sym>::bind_type(const std::string& name, type_binding binding) const -> const environment*
{
    auto* env = make<environment>(this);
    auto bindings = std::make_shared<type_env>(*types);
    (*bindings)[name] = std::move(binding);
    env->types = std::move(bindings);
    return env;
}

template<typename Sym>
void environment<Sym>::debug() const
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        for (const auto& [name, val] : ptr->store) {
            const auto* state = val->is_forced() ? "forced" : (val->is_failed() ? "failed" : "suspended");
            fmt::print(stderr, "[{}] = <{}>\n", name, state);
        }
    }
    for (const auto& [name, binding] : *types) {
        fmt::print(stderr,
                   "[{}] :: {}\n",
                   name,
                   std::visit(overloaded {[](const nat& num) { return fmt::format("{}", num); },
                                          [](const tvalue& type) { return type.string(); }},
                              binding));
    }
}

template struct environment<concrete>;
template struct environment<symbolic>;
