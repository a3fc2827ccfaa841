/*
 * scope_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DEQ_UTILS_SCOPE_GUARD_HPP
#define DEQ_UTILS_SCOPE_GUARD_HPP

#include <utility>

namespace deq::utils {

/**
 * @brief Runs a callable when leaving scope, including by exception.
 *
 * The callable must not throw.
 */
template <typename F>
class ScopeGuard {
public:
    explicit ScopeGuard(F fn) : fn_(std::move(fn)) {}
    ~ScopeGuard() {
        if (active_) {
            fn_();
        }
    }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { active_ = false; }

private:
    F fn_;
    bool active_{true};
};

}  // namespace deq::utils

#endif  // DEQ_UTILS_SCOPE_GUARD_HPP
