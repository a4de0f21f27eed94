#pragma once

#include <utility>

// Runs a cleanup function when the scope exits unless dismissed first.
template <typename FunctionT>
class deferred {
public:
    explicit deferred(FunctionT&& function)
        : m_function(std::forward<FunctionT>(function)), m_armed(true) {}

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

    deferred(deferred&& other) noexcept
        : m_function(std::move(other.m_function)), m_armed(other.m_armed) {
        other.m_armed = false;
    }
    deferred& operator=(deferred&&) = delete;

    ~deferred() {
        if (m_armed)
            m_function();
    }

    // Keeps the cleanup from running, e.g. once the guarded work has been committed.
    void dismiss() {
        m_armed = false;
    }

private:
    FunctionT m_function;
    bool m_armed;
};

template <typename FunctionT>
auto make_deferred(FunctionT&& function) {
    return deferred<FunctionT>(std::forward<FunctionT>(function));
}

#define UNIQUE_VAR_NAME(prefix) UNIQUE_VAR_NAME_IMPL(prefix, __COUNTER__)
#define UNIQUE_VAR_NAME_IMPL(prefix, counter) prefix##counter

#define DEFER_IMPL(varname, content) auto varname = make_deferred([&]() { content })
#define DEFER(content) DEFER_IMPL(UNIQUE_VAR_NAME(__deferred_holder_), content)
