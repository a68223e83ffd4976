#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

// A suspended computation, evaluated at most once. A failure is cached like a
// value, so every later force fails the same way. Forcing a thunk from within
// its own computation is an unguarded recursion and raises a loop error.
template<typename V>
class thunk final
{
  public:
    using value_type = V;
    using computation = std::function<V()>;

    thunk(computation comp, std::string label)
        : m_compute {std::move(comp)}
        , m_label {std::move(label)}
    {
    }

    thunk(std::in_place_t /*tag*/, V val)
        : m_value {std::move(val)}
        , m_state {state::forced}
    {
    }

    auto force() -> const V&
    {
        switch (m_state) {
            case state::forced:
                return *m_value;
            case state::failed:
                std::rethrow_exception(m_error);
            case state::in_progress:
                throw eval_error(eval_error::kind::loop, m_label.empty() ? "<<loop>>" : m_label);
            case state::pending:
                break;
        }
        m_state = state::in_progress;
        try {
            m_value.emplace(m_compute());
        } catch (...) {
            m_error = std::current_exception();
            m_state = state::failed;
            throw;
        }
        m_state = state::forced;
        m_compute = nullptr;
        return *m_value;
    }

    [[nodiscard]] auto is_forced() const -> bool { return m_state == state::forced; }

    // Drops a cached failure so that the next force runs the computation again.
    void rearm()
    {
        if (m_state == state::failed) {
            m_state = state::pending;
            m_error = nullptr;
        }
    }

    [[nodiscard]] auto is_failed() const -> bool { return m_state == state::failed; }

    [[nodiscard]] auto label() const -> const std::string& { return m_label; }

  private:
    enum class state : std::uint8_t
    {
        pending,
        in_progress,
        forced,
        failed,
    };

    computation m_compute;
    std::optional<V> m_value;
    std::exception_ptr m_error;
    std::string m_label;
    state m_state {state::pending};
};
