#pragma once

#include <string>
#include <utility>

#include <ast/type.hpp>
#include <fmt/format.h>

#include "error.hpp"
#include "thunk.hpp"

// Write-once placeholder standing for a recursively bound name while the
// bodies of its declaration group are being built.
template<typename V>
class hole final
{
  public:
    hole(std::string name, const schema* sig, std::string label)
        : m_name {std::move(name)}
        , m_signature {sig}
        , m_label {std::move(label)}
    {
    }

    [[nodiscard]] auto name() const -> const std::string& { return m_name; }

    [[nodiscard]] auto read_handle() const -> thunk<V>* { return m_read; }

    [[nodiscard]] auto is_filled() const -> bool { return m_target != nullptr; }

    // Returns false if the hole was already filled.
    [[nodiscard]] auto fill(thunk<V>* target) -> bool
    {
        if (m_target != nullptr) {
            return false;
        }
        m_target = target;
        // a read before the fill failed with a loop; later reads see the target
        if (m_read != nullptr) {
            m_read->rearm();
        }
        return true;
    }

    // Called once every hole of the group had its chance to be filled.
    void seal() { m_sealed = true; }

    auto read() -> V
    {
        if (m_target != nullptr) {
            return m_target->force();
        }
        if (m_sealed) {
            eval_panic("hole::read",
                       {fmt::format("recursive definition `{}` was never completed", m_name),
                        fmt::format("declared type: {}", m_signature != nullptr ? m_signature->string() : "?")});
        }
        throw eval_error(eval_error::kind::loop, m_label);
    }

    void set_read_handle(thunk<V>* read) { m_read = read; }

  private:
    std::string m_name;
    const schema* m_signature {};
    std::string m_label;
    thunk<V>* m_read {};
    thunk<V>* m_target {};
    bool m_sealed {};
};
