#pragma once

#include "Result.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ChunkVault {

    /**
     * @brief Object-storage backend for opaque chunks.
     *
     * push fails with REMOTE_UNAVAILABLE or REMOTE_REJECTED; pull with
     * REMOTE_UNAVAILABLE or REMOTE_NOT_FOUND. remove is best-effort and
     * callers log rather than act on its errors.
     */
    class IRemoteStore {
    public:
        virtual ~IRemoteStore() = default;

        virtual Result<std::string> push(const std::vector<uint8_t>& bytes) = 0;
        virtual Result<std::vector<uint8_t>> pull(const std::string& remoteHandle) = 0;
        virtual VoidResult remove(const std::string& remoteHandle) = 0;

        virtual std::string getName() const = 0;
    };

    /**
     * @brief Builds a fresh, independent client for a single call.
     *
     * Factories capture configuration values only, so they can be carried
     * into the deferred streaming phase.
     */
    using RemoteStoreFactory = std::function<std::shared_ptr<IRemoteStore>()>;

} // namespace ChunkVault
