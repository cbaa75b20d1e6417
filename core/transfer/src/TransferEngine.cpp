#include "TransferEngine.h"
#include "DirectoryRemoteStore.h"
#include "LoggerMacros.h"
#include "SQLiteMetadataStore.h"
#include <algorithm>
#include <filesystem>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "TransferEngine";

        // Timed pulls for downloads, on top of one worker per possible push
        constexpr std::size_t STREAM_CALL_WORKERS = 4;

        std::size_t remoteCallWorkers(const UploadOptions& upload) {
            std::size_t pushes = std::max<std::size_t>(upload.parallelism, 1) *
                                 std::max<std::size_t>(upload.maxConcurrentUploads, 1);
            return pushes + STREAM_CALL_WORKERS;
        }
    }

    TransferEngine::TransferEngine(std::shared_ptr<IMetadataStore> store, RemoteStoreFactory remote,
                                   EngineOptions options)
        : store_(std::move(store)),
          remote_(std::move(remote)),
          options_(std::move(options)),
          tracker_(store_),
          reconstructor_(store_),
          calls_(std::make_shared<TimedRemoteCall>(remoteCallWorkers(options_.upload))),
          orchestrator_(std::make_unique<UploadOrchestrator>(store_, remote_, tracker_, options_.upload, calls_)) {}

    TransferEngine::~TransferEngine() {
        orchestrator_->shutdown();
    }

    Result<std::unique_ptr<TransferEngine>> TransferEngine::open(const EngineOptions& options) {
        std::error_code ec;
        std::filesystem::create_directories(options.remoteRoot, ec);
        if (ec) {
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE,
                       "Cannot create object root " + options.remoteRoot + ": " + ec.message(), COMPONENT);
        }

        auto store = SQLiteMetadataStore::open(options.databasePath);
        if (store.isError()) {
            return store.error();
        }

        return std::make_unique<TransferEngine>(store.value(), DirectoryRemoteStore::factory(options.remoteRoot),
                                                options);
    }

    Result<int64_t> TransferEngine::initiate(std::unique_ptr<ByteSource> source, const std::string& filename) {
        return orchestrator_->initiate(std::move(source), filename);
    }

    Result<StatusSnapshot> TransferEngine::status(int64_t fileId) const {
        return tracker_.query(fileId);
    }

    Result<DownloadSnapshot> TransferEngine::prepareDownload(int64_t fileId) const {
        return reconstructor_.prepare(fileId);
    }

    DownloadStream TransferEngine::openStream(DownloadSnapshot snapshot) const {
        return DownloadReconstructor::stream(std::move(snapshot), remote_, options_.stream, calls_);
    }

    VoidResult TransferEngine::remove(int64_t fileId) {
        auto record = store_->getFile(fileId);
        if (record.isError()) {
            return record.error();
        }
        if (!isTerminal(record.value().status)) {
            auto held = tracker_.tracked(fileId);
            if (!held || !isTerminal(held->status)) {
                LOG_WARN_COMP("Refusing to delete transfer " + std::to_string(fileId) + " while " +
                              toString(record.value().status), COMPONENT);
                return Err(Core::ErrorCode::TRANSFER_IN_PROGRESS,
                           "Transfer " + std::to_string(fileId) + " is still " + toString(record.value().status),
                           COMPONENT);
            }
            // The run ended but its terminal write was lost; record it before deleting
            auto settled = store_->updateStatus(fileId, held->status);
            if (settled.isError()) {
                return settled;
            }
            LOG_INFO_COMP_IF("Recorded held " + std::string(toString(held->status)) + " state of transfer " +
                             std::to_string(fileId), COMPONENT);
        }

        auto chunks = store_->listChunks(fileId);
        if (chunks.isError()) {
            return chunks.error();
        }

        std::size_t removed = 0;
        for (const auto& chunk : chunks.value()) {
            auto client = remote_();
            if (!client) {
                LOG_WARN_COMP("No remote client to delete chunk " + std::to_string(chunk.sequenceIndex), COMPONENT);
                continue;
            }
            auto deleted = client->remove(chunk.remoteHandle);
            if (deleted.isError()) {
                LOG_WARN_COMP("Could not delete chunk " + std::to_string(chunk.sequenceIndex) + " of transfer " +
                              std::to_string(fileId) + ": " + deleted.error().toString(), COMPONENT);
                continue;
            }
            ++removed;
        }

        auto result = store_->removeFile(fileId);
        if (result.isError()) {
            return result;
        }
        tracker_.forget(fileId);

        LOG_INFO_COMP_IF("Deleted transfer " + std::to_string(fileId) + " (" + std::to_string(removed) + "/" +
                         std::to_string(chunks.value().size()) + " remote chunks removed)", COMPONENT);
        return Ok();
    }

    Result<std::size_t> TransferEngine::recoverInterrupted() {
        std::size_t live = orchestrator_->running();
        if (live > 0) {
            return Err(Core::ErrorCode::TRANSFER_IN_PROGRESS,
                       std::to_string(live) + " uploads are still running", COMPONENT);
        }
        auto recovered = store_->failUnfinished();
        if (recovered.isError()) {
            return recovered;
        }
        LOG_INFO_COMP_IF("Recovered " + std::to_string(recovered.value()) + " interrupted transfers", COMPONENT);
        return recovered;
    }

    Result<std::vector<FileRecord>> TransferEngine::listFiles() const {
        return store_->listFiles();
    }

    Result<HealthSummary> TransferEngine::health() const {
        auto files = store_->listFiles();
        if (files.isError()) {
            return files.error();
        }

        HealthSummary summary;
        for (const auto& file : files.value()) {
            ++summary.totalFiles;
            summary.totalBytes += file.totalSize;
            if (file.status == TransferStatus::Completed) {
                ++summary.completedFiles;
            } else if (file.status == TransferStatus::Failed) {
                ++summary.failedFiles;
            }
        }
        return summary;
    }

} // namespace ChunkVault
