#pragma once

#include "IMetadataStore.h"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace ChunkVault {

    /**
     * @brief Read-only view over upload progress.
     *
     * Holds the last committed StatusSnapshot per running transfer as an
     * immutable shared value. publish() swaps the pointer after the
     * metadata store has committed; query() copies it out, so a reader
     * never sees status and counters from two different writes and never
     * waits on an upload. Tracking starts with the Initializing publish
     * and ends with the terminal one, after which the committed row in the
     * store answers. Transfers this process did not run are read from the
     * store as well.
     */
    class TransferStatusTracker {
    public:
        explicit TransferStatusTracker(std::shared_ptr<IMetadataStore> store);

        Result<StatusSnapshot> query(int64_t fileId) const;

        void publish(const StatusSnapshot& snapshot);

        /**
         * @brief Keep a terminal snapshot the store failed to record.
         *
         * Readers see it instead of the stale row until forget().
         */
        void publishUnrecorded(const StatusSnapshot& snapshot);

        void forget(int64_t fileId);

        /**
         * @return the snapshot held for fileId, without the store fallback
         */
        std::optional<StatusSnapshot> tracked(int64_t fileId) const;

        std::size_t trackedCount() const;

    private:
        std::shared_ptr<IMetadataStore> store_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<int64_t, std::shared_ptr<const StatusSnapshot>> latest_;
    };

} // namespace ChunkVault
