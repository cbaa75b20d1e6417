#pragma once

#include "IRemoteStore.h"
#include "ThreadPool.h"
#include <atomic>
#include <chrono>
#include <memory>

namespace ChunkVault {

    /**
     * @brief Runs remote calls under an explicit deadline on a fixed set
     * of workers.
     *
     * Each call holds shared ownership of its client and payload. On
     * expiry the caller gets REMOTE_TIMEOUT right away and the call is
     * abandoned: if it has not started it is skipped, otherwise its result
     * is discarded when it returns, and an object a late push created is
     * removed again. A stuck backend occupies at most workerCount threads;
     * calls queued behind it time out like any other. The destructor
     * waits for calls still running. A non-positive timeout runs the call
     * inline.
     */
    class TimedRemoteCall {
    public:
        explicit TimedRemoteCall(std::size_t workerCount);

        TimedRemoteCall(const TimedRemoteCall&) = delete;
        TimedRemoteCall& operator=(const TimedRemoteCall&) = delete;

        Result<std::string> push(std::shared_ptr<IRemoteStore> client,
                                 std::shared_ptr<const std::vector<uint8_t>> bytes,
                                 std::chrono::milliseconds timeout);

        Result<std::vector<uint8_t>> pull(std::shared_ptr<IRemoteStore> client,
                                          const std::string& remoteHandle,
                                          std::chrono::milliseconds timeout);

        std::size_t workerCount() const { return pool_.size(); }

        /**
         * @return calls that finished after their caller gave up
         */
        uint64_t lateResults() const { return lateResults_->load(); }

    private:
        std::shared_ptr<std::atomic<uint64_t>> lateResults_;
        ThreadPool pool_;   // last: joined before the counter goes away
    };

} // namespace ChunkVault
