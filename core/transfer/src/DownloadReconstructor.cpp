#include "DownloadReconstructor.h"
#include "LoggerMacros.h"

namespace ChunkVault {

    DownloadReconstructor::DownloadReconstructor(std::shared_ptr<IMetadataStore> store)
        : store_(std::move(store)) {}

    Result<DownloadSnapshot> DownloadReconstructor::prepare(int64_t fileId) const {
        auto manifest = store_->loadManifest(fileId);
        if (manifest.isError()) {
            LOG_WARN_COMP("Cannot prepare download of file " + std::to_string(fileId) + ": " +
                          manifest.error().toString(), "DownloadReconstructor");
            return manifest.error();
        }

        FileManifest& loaded = manifest.value();
        DownloadSnapshot snapshot;
        snapshot.fileId = loaded.record.id;
        snapshot.filename = loaded.record.filename;
        snapshot.totalSize = loaded.record.totalSize;
        snapshot.fileHash = loaded.record.fileHash;
        snapshot.chunks = std::move(loaded.chunks);

        LOG_DEBUG_COMP_IF("Prepared download of file " + std::to_string(fileId) + ": " +
                          std::to_string(snapshot.chunks.size()) + " chunks, " +
                          std::to_string(snapshot.totalSize) + " bytes", "DownloadReconstructor");
        return snapshot;
    }

    DownloadStream DownloadReconstructor::stream(DownloadSnapshot snapshot, RemoteStoreFactory remote,
                                                 StreamOptions options, std::shared_ptr<TimedRemoteCall> calls) {
        return DownloadStream(std::move(snapshot), std::move(remote), std::move(options), std::move(calls));
    }

} // namespace ChunkVault
