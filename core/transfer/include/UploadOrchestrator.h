#pragma once

#include "ByteSource.h"
#include "ChunkSplitter.h"
#include "IMetadataStore.h"
#include "IRemoteStore.h"
#include "RetryPolicy.h"
#include "ThreadPool.h"
#include "TimedRemoteCall.h"
#include "TransferStatusTracker.h"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ChunkVault {

    struct UploadOptions {
        uint64_t chunkSize{ChunkSplitter::DEFAULT_CHUNK_SIZE};
        RetryPolicy retry;                              // per chunk push
        std::size_t parallelism{1};                     // chunk pushes in flight per upload
        std::size_t maxConcurrentUploads{4};            // uploads running at once
        std::chrono::milliseconds remoteTimeout{120000};
        uint64_t maxFileSize{0};                        // 0 = unlimited
    };

    /**
     * @brief Drives a file through Initializing -> Chunking -> Uploading ->
     * Completed | Failed.
     *
     * initiate() registers the FileRecord and returns its id straight away;
     * the split/push/record loop runs on a worker. Each pushed chunk is
     * persisted (ChunkRef + uploadedCount) before its progress is published
     * to the tracker. The first chunk that cannot be pushed within the
     * retry budget, and any source or metadata failure, ends the run in
     * Failed with no further chunks attempted. Chunks already on the
     * remote are left there. The Failed write is retried under the push
     * retry policy; if the store still refuses it, the tracker holds the
     * failure in its place.
     *
     * The source is discarded when the run ends, whatever the outcome.
     */
    class UploadOrchestrator {
    public:
        UploadOrchestrator(std::shared_ptr<IMetadataStore> store,
                           RemoteStoreFactory remote,
                           TransferStatusTracker& tracker,
                           UploadOptions options = {},
                           std::shared_ptr<TimedRemoteCall> calls = nullptr);
        ~UploadOrchestrator();

        UploadOrchestrator(const UploadOrchestrator&) = delete;
        UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

        /**
         * @brief Register a transfer and start it in the background.
         * @return the new file id; FILE_TOO_LARGE or a storage error if
         *         nothing was started (the source is discarded either way)
         */
        Result<int64_t> initiate(std::unique_ptr<ByteSource> source, const std::string& filename);

        /**
         * @brief Block until the run for fileId ends or timeout passes.
         * @return true if the run is finished (or unknown to this instance)
         */
        bool wait(int64_t fileId, std::chrono::milliseconds timeout);

        void waitAll();

        /**
         * @return runs started by this instance that have not finished
         */
        std::size_t running();

        /**
         * @brief Refuse new uploads and let running ones finish.
         */
        void shutdown();

        const UploadOptions& options() const { return options_; }

        /**
         * @brief Last path component with unsafe characters replaced.
         */
        static std::string sanitizeFilename(const std::string& filename);

    private:
        struct PushOutcome {
            uint64_t sequenceIndex{0};
            std::string contentHash;
            uint64_t byteSize{0};
            Result<std::string> handle{std::string()};
        };

        void run(int64_t fileId, std::shared_ptr<ByteSource> source);
        bool uploadSequential(int64_t fileId, ChunkSplitter& splitter, uint64_t& uploaded);
        bool uploadWindowed(int64_t fileId, ChunkSplitter& splitter, uint64_t& uploaded);

        PushOutcome pushChunk(int64_t fileId, Chunk chunk);
        Result<std::string> pushWithRetry(int64_t fileId, uint64_t sequenceIndex,
                                          std::shared_ptr<const std::vector<uint8_t>> bytes);
        bool commitChunk(int64_t fileId, const PushOutcome& outcome, uint64_t chunkCount, uint64_t& uploaded);

        bool setStatus(int64_t fileId, TransferStatus status, uint64_t uploaded, uint64_t chunkCount,
                       const std::string& fileHash = "");
        void fail(int64_t fileId, uint64_t uploaded, uint64_t chunkCount, const Error& cause);

        void pruneFinished();

        std::shared_ptr<IMetadataStore> store_;
        RemoteStoreFactory remote_;
        TransferStatusTracker& tracker_;
        UploadOptions options_;
        std::shared_ptr<TimedRemoteCall> calls_;

        std::unique_ptr<ThreadPool> pushPool_;   // declared before runPool_: runs use it until they drain
        std::unique_ptr<ThreadPool> runPool_;

        std::mutex runsMutex_;
        std::unordered_map<int64_t, std::shared_future<void>> runs_;
        std::atomic<bool> accepting_{true};
    };

} // namespace ChunkVault
