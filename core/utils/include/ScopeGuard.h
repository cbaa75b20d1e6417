#pragma once

/**
 * @file ScopeGuard.h
 * @brief Run a cleanup action when a scope exits
 *
 * Same ownership rules as a file-descriptor guard: move-only, released
 * explicitly with dismiss(), otherwise fired exactly once on destruction.
 */

#include <functional>
#include <utility>

namespace ChunkVault {

/**
 * Usage:
 * @code
 * ScopeGuard cleanup([&] { source.discard(); });
 * if (!step()) return;   // discard() runs here
 * ...
 * // and here, on normal exit or exception
 * @endcode
 */
class ScopeGuard {
public:
    ScopeGuard() noexcept = default;

    explicit ScopeGuard(std::function<void()> action) noexcept
        : action_(std::move(action)) {}

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    ScopeGuard(ScopeGuard&& other) noexcept : action_(std::move(other.action_)) {
        other.action_ = nullptr;
    }

    ScopeGuard& operator=(ScopeGuard&& other) noexcept {
        if (this != &other) {
            fire();
            action_ = std::move(other.action_);
            other.action_ = nullptr;
        }
        return *this;
    }

    ~ScopeGuard() {
        fire();
    }

    /// Drop the action without running it
    void dismiss() noexcept {
        action_ = nullptr;
    }

    /// Run the action now instead of at scope exit
    void fire() {
        if (action_) {
            auto action = std::move(action_);
            action_ = nullptr;
            action();
        }
    }

    bool active() const noexcept { return static_cast<bool>(action_); }

private:
    std::function<void()> action_;
};

} // namespace ChunkVault
