#pragma once

#include "DownloadStream.h"
#include "IMetadataStore.h"
#include <memory>

namespace ChunkVault {

    /**
     * @brief Two-phase download: prepare() reads the manifest while the
     * request is live, stream() runs later from the snapshot alone.
     */
    class DownloadReconstructor {
    public:
        explicit DownloadReconstructor(std::shared_ptr<IMetadataStore> store);

        /**
         * @brief Capture an immutable snapshot of a Completed transfer.
         * @return FILE_NOT_FOUND, or METADATA_INCONSISTENCY when the chunk
         *         list is not complete
         */
        Result<DownloadSnapshot> prepare(int64_t fileId) const;

        /**
         * @brief Build the deferred stream. Takes no store or request state.
         */
        static DownloadStream stream(DownloadSnapshot snapshot, RemoteStoreFactory remote,
                                     StreamOptions options = {},
                                     std::shared_ptr<TimedRemoteCall> calls = nullptr);

    private:
        std::shared_ptr<IMetadataStore> store_;
    };

} // namespace ChunkVault
