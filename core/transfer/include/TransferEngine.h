#pragma once

#include "DownloadReconstructor.h"
#include "EngineOptions.h"
#include "IMetadataStore.h"
#include "IRemoteStore.h"
#include "TransferStatusTracker.h"
#include "UploadOrchestrator.h"
#include <memory>

namespace ChunkVault {

    /**
     * @brief Wires the metadata store, remote store, tracker, orchestrator
     * and reconstructor together behind one object.
     */
    class TransferEngine {
    public:
        TransferEngine(std::shared_ptr<IMetadataStore> store, RemoteStoreFactory remote, EngineOptions options);
        ~TransferEngine();

        TransferEngine(const TransferEngine&) = delete;
        TransferEngine& operator=(const TransferEngine&) = delete;

        /**
         * @brief SQLite metadata at databasePath, objects under remoteRoot.
         */
        static Result<std::unique_ptr<TransferEngine>> open(const EngineOptions& options);

        Result<int64_t> initiate(std::unique_ptr<ByteSource> source, const std::string& filename);
        Result<StatusSnapshot> status(int64_t fileId) const;

        Result<DownloadSnapshot> prepareDownload(int64_t fileId) const;

        /**
         * @brief Deferred stream for a prepared snapshot. Holds no reference
         * to this engine, so it may outlive it.
         */
        DownloadStream openStream(DownloadSnapshot snapshot) const;

        /**
         * @brief Delete a finished transfer and, best-effort, its remote chunks.
         * @return FILE_NOT_FOUND, or TRANSFER_IN_PROGRESS for a live upload
         */
        VoidResult remove(int64_t fileId);

        /**
         * @brief Fail every record left unfinished by an earlier process.
         *
         * Refused with TRANSFER_IN_PROGRESS while this engine has uploads
         * running. Other processes sharing the database are not checked.
         * @return number of records moved to Failed
         */
        Result<std::size_t> recoverInterrupted();

        Result<std::vector<FileRecord>> listFiles() const;
        Result<HealthSummary> health() const;

        UploadOrchestrator& uploads() { return *orchestrator_; }
        const EngineOptions& options() const { return options_; }

    private:
        std::shared_ptr<IMetadataStore> store_;
        RemoteStoreFactory remote_;
        EngineOptions options_;
        TransferStatusTracker tracker_;
        DownloadReconstructor reconstructor_;
        std::shared_ptr<TimedRemoteCall> calls_;   // shared with open streams
        std::unique_ptr<UploadOrchestrator> orchestrator_;
    };

} // namespace ChunkVault
