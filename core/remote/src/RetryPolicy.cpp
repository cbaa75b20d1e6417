#include "RetryPolicy.h"
#include <algorithm>
#include <random>

namespace ChunkVault {

    std::chrono::milliseconds RetryPolicy::delayAfter(int attempt) const {
        if (attempt < 1 || baseDelay.count() <= 0) {
            return std::chrono::milliseconds(0);
        }

        // base * 2^(attempt-1), shift capped to avoid overflow
        int shift = std::min(attempt - 1, 20);
        int64_t delay = baseDelay.count() * (int64_t(1) << shift);
        delay = std::min<int64_t>(delay, maxDelay.count());

        if (jitter > 0.0) {
            thread_local std::minstd_rand rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(-jitter, jitter);
            delay = static_cast<int64_t>(static_cast<double>(delay) * (1.0 + dist(rng)));
        }

        return std::chrono::milliseconds(std::max<int64_t>(delay, 0));
    }

} // namespace ChunkVault
