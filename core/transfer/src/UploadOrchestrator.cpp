#include "UploadOrchestrator.h"
#include "LoggerMacros.h"
#include "ScopeGuard.h"
#include "TimedRemoteCall.h"
#include <algorithm>
#include <deque>
#include <optional>
#include <thread>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "UploadOrchestrator";

        std::string describe(int64_t fileId) {
            return "Transfer " + std::to_string(fileId);
        }
    }

    UploadOrchestrator::UploadOrchestrator(std::shared_ptr<IMetadataStore> store,
                                           RemoteStoreFactory remote,
                                           TransferStatusTracker& tracker,
                                           UploadOptions options,
                                           std::shared_ptr<TimedRemoteCall> calls)
        : store_(std::move(store)),
          remote_(std::move(remote)),
          tracker_(tracker),
          options_(std::move(options)),
          calls_(std::move(calls)) {
        if (options_.chunkSize == 0) {
            options_.chunkSize = ChunkSplitter::DEFAULT_CHUNK_SIZE;
        }
        if (options_.retry.maxAttempts < 1) {
            options_.retry.maxAttempts = 1;
        }
        options_.parallelism = std::max<std::size_t>(options_.parallelism, 1);
        options_.maxConcurrentUploads = std::max<std::size_t>(options_.maxConcurrentUploads, 1);
        if (!calls_) {
            calls_ = std::make_shared<TimedRemoteCall>(options_.parallelism * options_.maxConcurrentUploads);
        }

        if (options_.parallelism > 1) {
            pushPool_ = std::make_unique<ThreadPool>(options_.parallelism * options_.maxConcurrentUploads);
        }
        runPool_ = std::make_unique<ThreadPool>(options_.maxConcurrentUploads);
    }

    UploadOrchestrator::~UploadOrchestrator() {
        shutdown();
    }

    std::string UploadOrchestrator::sanitizeFilename(const std::string& filename) {
        std::string name = filename;
        auto slash = name.find_last_of("/\\");
        if (slash != std::string::npos) {
            name = name.substr(slash + 1);
        }

        for (char& c : name) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (uc < 0x20 || uc == 0x7f || c == '"' || c == '\'' || c == ':' || c == ';') {
                c = '_';
            }
        }

        if (name.empty() || name == "." || name == "..") {
            return "unnamed_file";
        }
        return name;
    }

    Result<int64_t> UploadOrchestrator::initiate(std::unique_ptr<ByteSource> source, const std::string& filename) {
        if (!source) {
            return Err(Core::ErrorCode::INTERNAL_ERROR, "No upload source", COMPONENT);
        }
        ScopeGuard discardOnReject([&source]() { source->discard(); });

        if (!accepting_) {
            return Err(Core::ErrorCode::INTERNAL_ERROR, "Uploads are shut down", COMPONENT);
        }

        uint64_t totalSize = source->size();
        if (options_.maxFileSize > 0 && totalSize > options_.maxFileSize) {
            LOG_WARN_COMP("Rejected " + filename + ": " + std::to_string(totalSize) + " bytes exceeds limit of " +
                          std::to_string(options_.maxFileSize), COMPONENT);
            return Err(Core::ErrorCode::FILE_TOO_LARGE,
                       std::to_string(totalSize) + " bytes exceeds the limit of " +
                       std::to_string(options_.maxFileSize), COMPONENT);
        }

        std::string name = sanitizeFilename(filename);
        uint64_t chunkCount = chunkCountFor(totalSize, options_.chunkSize);

        auto created = store_->createFile(name, totalSize, chunkCount);
        if (created.isError()) {
            LOG_ERROR_COMP("Could not register " + name + ": " + created.error().toString(), COMPONENT);
            return created;
        }
        int64_t fileId = created.value();

        tracker_.publish({fileId, TransferStatus::Initializing, 0, chunkCount});
        LOG_INFO_COMP_IF(describe(fileId) + " initiated: " + name + ", " + std::to_string(totalSize) + " bytes in " +
                         std::to_string(chunkCount) + " chunks", COMPONENT);

        discardOnReject.dismiss();
        std::shared_ptr<ByteSource> shared(std::move(source));

        pruneFinished();
        auto future = runPool_->enqueue([this, fileId, shared]() { run(fileId, shared); }).share();
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            runs_[fileId] = future;
        }
        return fileId;
    }

    void UploadOrchestrator::run(int64_t fileId, std::shared_ptr<ByteSource> source) {
        ScopeGuard release([source]() { source->discard(); });

        uint64_t totalSize = source->size();
        uint64_t chunkCount = chunkCountFor(totalSize, options_.chunkSize);
        uint64_t uploaded = 0;

        try {
            if (!setStatus(fileId, TransferStatus::Chunking, 0, chunkCount)) {
                fail(fileId, 0, chunkCount, Err(Core::ErrorCode::STORAGE_ERROR, "Could not enter chunking", COMPONENT));
                return;
            }

            SCOPED_TIMER_COMP(describe(fileId) + " upload", COMPONENT);
            ChunkSplitter splitter(*source, totalSize, options_.chunkSize);

            bool ok = options_.parallelism > 1
                ? uploadWindowed(fileId, splitter, uploaded)
                : uploadSequential(fileId, splitter, uploaded);
            if (!ok) {
                return;
            }

            if (uploaded != chunkCount) {
                fail(fileId, uploaded, chunkCount,
                     Err(Core::ErrorCode::INTERNAL_ERROR,
                         std::to_string(uploaded) + " of " + std::to_string(chunkCount) + " chunks uploaded", COMPONENT));
                return;
            }

            std::string fileHash = splitter.fileHash();
            if (!setStatus(fileId, TransferStatus::Completed, uploaded, chunkCount, fileHash)) {
                fail(fileId, uploaded, chunkCount,
                     Err(Core::ErrorCode::STORAGE_ERROR, "Could not mark transfer completed", COMPONENT));
            }
        } catch (const std::exception& e) {
            fail(fileId, uploaded, chunkCount,
                 Err(Core::ErrorCode::INTERNAL_ERROR, std::string("Upload aborted: ") + e.what(), COMPONENT));
        }
    }

    bool UploadOrchestrator::uploadSequential(int64_t fileId, ChunkSplitter& splitter, uint64_t& uploaded) {
        const uint64_t chunkCount = splitter.chunkCount();
        while (true) {
            auto next = splitter.next();
            if (next.isError()) {
                fail(fileId, uploaded, chunkCount, next.error());
                return false;
            }
            if (!next.value()) {
                return true;
            }

            PushOutcome outcome = pushChunk(fileId, std::move(*next.value()));
            if (outcome.handle.isError()) {
                fail(fileId, uploaded, chunkCount, outcome.handle.error());
                return false;
            }
            if (!commitChunk(fileId, outcome, chunkCount, uploaded)) {
                return false;
            }
        }
    }

    bool UploadOrchestrator::uploadWindowed(int64_t fileId, ChunkSplitter& splitter, uint64_t& uploaded) {
        const uint64_t chunkCount = splitter.chunkCount();
        std::deque<std::future<PushOutcome>> inflight;
        std::optional<Error> failure;

        while (!failure) {
            while (!failure && inflight.size() < options_.parallelism && !splitter.exhausted()) {
                auto next = splitter.next();
                if (next.isError()) {
                    failure = next.error();
                    break;
                }
                if (!next.value()) {
                    break;
                }
                auto chunk = std::make_shared<Chunk>(std::move(*next.value()));
                inflight.push_back(pushPool_->enqueue([this, fileId, chunk]() {
                    return pushChunk(fileId, std::move(*chunk));
                }));
            }
            if (failure || inflight.empty()) {
                break;
            }

            // Commit in sequence order; later pushes keep running meanwhile
            PushOutcome outcome = inflight.front().get();
            inflight.pop_front();
            if (outcome.handle.isError()) {
                failure = outcome.handle.error();
                break;
            }
            if (!commitChunk(fileId, outcome, chunkCount, uploaded)) {
                // commitChunk already failed the transfer
                for (auto& pending : inflight) {
                    pending.wait();
                }
                return false;
            }
        }

        if (!failure) {
            return true;
        }

        // Chunks already pushed stay recorded; nothing new is started
        for (auto& pending : inflight) {
            PushOutcome outcome = pending.get();
            if (outcome.handle.isOk()) {
                if (!commitChunk(fileId, outcome, chunkCount, uploaded)) {
                    return false;
                }
            }
        }
        fail(fileId, uploaded, chunkCount, *failure);
        return false;
    }

    UploadOrchestrator::PushOutcome UploadOrchestrator::pushChunk(int64_t fileId, Chunk chunk) {
        PushOutcome outcome;
        outcome.sequenceIndex = chunk.sequenceIndex;
        outcome.contentHash = std::move(chunk.contentHash);
        outcome.byteSize = chunk.bytes.size();
        auto bytes = std::make_shared<const std::vector<uint8_t>>(std::move(chunk.bytes));
        outcome.handle = pushWithRetry(fileId, outcome.sequenceIndex, std::move(bytes));
        return outcome;
    }

    Result<std::string> UploadOrchestrator::pushWithRetry(int64_t fileId, uint64_t sequenceIndex,
                                                          std::shared_ptr<const std::vector<uint8_t>> bytes) {
        const RetryPolicy& retry = options_.retry;
        std::string what = describe(fileId) + " chunk " + std::to_string(sequenceIndex);

        for (int attempt = 1; ; ++attempt) {
            auto client = remote_();
            Result<std::string> pushed = client
                ? calls_->push(client, bytes, options_.remoteTimeout)
                : Result<std::string>(Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "No remote client", COMPONENT));

            if (pushed.isOk()) {
                LOG_DEBUG_COMP_IF(what + " pushed as " + pushed.value() + " on attempt " + std::to_string(attempt),
                                  COMPONENT);
                return pushed;
            }

            const Error& error = pushed.error();
            if (!Core::isRetryable(error.errorCode())) {
                LOG_ERROR_COMP(what + " rejected permanently: " + error.toString(), COMPONENT);
                return pushed;
            }
            if (retry.exhausted(attempt)) {
                LOG_ERROR_COMP(what + " failed after " + std::to_string(attempt) + " attempts: " + error.toString(),
                               COMPONENT);
                return pushed;
            }

            auto delay = retry.delayAfter(attempt);
            LOG_WARN_COMP(what + " attempt " + std::to_string(attempt) + "/" + std::to_string(retry.maxAttempts) +
                          " failed (" + error.toString() + "), retrying in " + std::to_string(delay.count()) + " ms",
                          COMPONENT);
            std::this_thread::sleep_for(delay);
        }
    }

    bool UploadOrchestrator::commitChunk(int64_t fileId, const PushOutcome& outcome, uint64_t chunkCount,
                                         uint64_t& uploaded) {
        if (uploaded == 0 && !setStatus(fileId, TransferStatus::Uploading, 0, chunkCount)) {
            fail(fileId, uploaded, chunkCount,
                 Err(Core::ErrorCode::STORAGE_ERROR, "Could not enter uploading", COMPONENT));
            return false;
        }

        ChunkRef ref;
        ref.fileId = fileId;
        ref.sequenceIndex = outcome.sequenceIndex;
        ref.remoteHandle = outcome.handle.value();
        ref.contentHash = outcome.contentHash;
        ref.byteSize = outcome.byteSize;

        auto recorded = store_->recordChunk(ref);
        if (recorded.isError()) {
            fail(fileId, uploaded, chunkCount, recorded.error());
            return false;
        }

        ++uploaded;
        tracker_.publish({fileId, TransferStatus::Uploading, uploaded, chunkCount});
        return true;
    }

    bool UploadOrchestrator::setStatus(int64_t fileId, TransferStatus status, uint64_t uploaded, uint64_t chunkCount,
                                       const std::string& fileHash) {
        auto updated = store_->updateStatus(fileId, status, fileHash);
        if (updated.isError()) {
            LOG_ERROR_COMP(describe(fileId) + " could not move to " + toString(status) + ": " +
                           updated.error().toString(), COMPONENT);
            return false;
        }
        tracker_.publish({fileId, status, uploaded, chunkCount});
        LOG_INFO_COMP_IF(describe(fileId) + " -> " + toString(status) + " (" + std::to_string(uploaded) + "/" +
                         std::to_string(chunkCount) + ")", COMPONENT);
        return true;
    }

    void UploadOrchestrator::fail(int64_t fileId, uint64_t uploaded, uint64_t chunkCount, const Error& cause) {
        LOG_ERROR_COMP(describe(fileId) + " failed at " + std::to_string(uploaded) + "/" + std::to_string(chunkCount) +
                       ": " + cause.toString(), COMPONENT);
        const RetryPolicy& retry = options_.retry;
        for (int attempt = 1; ; ++attempt) {
            if (setStatus(fileId, TransferStatus::Failed, uploaded, chunkCount)) {
                return;
            }
            if (retry.exhausted(attempt)) {
                break;
            }
            std::this_thread::sleep_for(retry.delayAfter(attempt));
        }

        // Readers and delete see Failed; the stored row catches up on delete or failUnfinished()
        LOG_ERROR_COMP(describe(fileId) + " failure could not be recorded after " +
                       std::to_string(retry.maxAttempts) + " attempts", COMPONENT);
        tracker_.publishUnrecorded({fileId, TransferStatus::Failed, uploaded, chunkCount});
    }

    bool UploadOrchestrator::wait(int64_t fileId, std::chrono::milliseconds timeout) {
        std::shared_future<void> future;
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            auto it = runs_.find(fileId);
            if (it == runs_.end()) {
                return true;
            }
            future = it->second;
        }
        return future.wait_for(timeout) == std::future_status::ready;
    }

    void UploadOrchestrator::waitAll() {
        std::vector<std::shared_future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            for (const auto& entry : runs_) {
                pending.push_back(entry.second);
            }
        }
        for (auto& future : pending) {
            future.wait();
        }
    }

    std::size_t UploadOrchestrator::running() {
        pruneFinished();
        std::lock_guard<std::mutex> lock(runsMutex_);
        return runs_.size();
    }

    void UploadOrchestrator::shutdown() {
        if (accepting_.exchange(false)) {
            LOG_INFO_COMP_IF("Shutting down, waiting for running uploads", COMPONENT);
        }
        if (runPool_) {
            runPool_->shutdown();
        }
        if (pushPool_) {
            pushPool_->shutdown();
        }
    }

    void UploadOrchestrator::pruneFinished() {
        std::lock_guard<std::mutex> lock(runsMutex_);
        for (auto it = runs_.begin(); it != runs_.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it = runs_.erase(it);
            } else {
                ++it;
            }
        }
    }

} // namespace ChunkVault
