#pragma once

#include <chrono>
#include <cstdint>

namespace ChunkVault {

    /**
     * @brief Bounded attempts with capped exponential backoff and jitter.
     */
    struct RetryPolicy {
        int maxAttempts{3};
        std::chrono::milliseconds baseDelay{500};
        std::chrono::milliseconds maxDelay{8000};
        double jitter{0.2};   // +/- fraction applied to each delay

        /**
         * @brief Delay to wait after the given failed attempt (1-based).
         */
        std::chrono::milliseconds delayAfter(int attempt) const;

        bool exhausted(int attempt) const { return attempt >= maxAttempts; }
    };

} // namespace ChunkVault
