#include "DownloadStream.h"
#include "LoggerMacros.h"
#include "ScopeGuard.h"
#include <algorithm>
#include <thread>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "DownloadReconstructor";
    }

    DownloadStream::DownloadStream(DownloadSnapshot snapshot, RemoteStoreFactory remote, StreamOptions options,
                                   std::shared_ptr<TimedRemoteCall> calls)
        : snapshot_(std::move(snapshot)),
          remote_(std::move(remote)),
          options_(std::move(options)),
          calls_(std::move(calls)),
          fileHasher_(std::make_unique<SHA256::Hasher>()) {
        if (!calls_) {
            calls_ = std::make_shared<TimedRemoteCall>(1);
        }
        if (options_.blockSize == 0) {
            options_.blockSize = 512 * 1024;
        }
        if (options_.retry.maxAttempts < 1) {
            options_.retry.maxAttempts = 1;
        }
    }

    void DownloadStream::release() {
        std::vector<uint8_t>().swap(current_);
        offset_ = 0;
    }

    Result<std::optional<std::vector<uint8_t>>> DownloadStream::failWith(Error error) {
        release();
        failure_ = std::move(error);
        return *failure_;
    }

    Result<std::vector<uint8_t>> DownloadStream::pullChunk(const ChunkRef& ref) {
        std::string what = "File " + std::to_string(snapshot_.fileId) + " chunk " + std::to_string(ref.sequenceIndex);

        for (int attempt = 1; ; ++attempt) {
            if (token_.cancelled()) {
                return Err(Core::ErrorCode::STREAM_CANCELLED, "Download cancelled", COMPONENT);
            }

            auto client = remote_ ? remote_() : nullptr;
            Result<std::vector<uint8_t>> pulled = client
                ? calls_->pull(client, ref.remoteHandle, options_.remoteTimeout)
                : Result<std::vector<uint8_t>>(Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "No remote client", COMPONENT));

            if (pulled.isOk() || !Core::isRetryable(pulled.error().errorCode()) ||
                options_.retry.exhausted(attempt)) {
                if (pulled.isError()) {
                    LOG_ERROR_COMP(what + " could not be pulled: " + pulled.error().toString(), COMPONENT);
                }
                return pulled;
            }

            auto delay = options_.retry.delayAfter(attempt);
            LOG_WARN_COMP(what + " pull attempt " + std::to_string(attempt) + " failed (" +
                          pulled.error().toString() + "), retrying in " + std::to_string(delay.count()) + " ms",
                          COMPONENT);
            std::this_thread::sleep_for(delay);
        }
    }

    Result<std::optional<std::vector<uint8_t>>> DownloadStream::next() {
        if (failure_) {
            return *failure_;
        }
        if (done_) {
            return std::optional<std::vector<uint8_t>>{};
        }
        if (token_.cancelled()) {
            LOG_INFO_COMP_IF("Download of file " + std::to_string(snapshot_.fileId) + " cancelled after " +
                             std::to_string(emitted_) + " bytes", COMPONENT);
            return failWith(Err(Core::ErrorCode::STREAM_CANCELLED, "Download cancelled", COMPONENT));
        }

        if (offset_ >= current_.size()) {
            release();

            if (chunkIndex_ >= snapshot_.chunks.size()) {
                std::string actual = fileHasher_->finalize();
                if (options_.verifyFileHash && !snapshot_.fileHash.empty() && actual != snapshot_.fileHash) {
                    LOG_WARN_COMP("File " + std::to_string(snapshot_.fileId) + " whole-file hash " + actual +
                                  " does not match recorded " + snapshot_.fileHash, COMPONENT);
                    return failWith(Err(Core::ErrorCode::INTEGRITY_ERROR,
                                     "Whole-file hash mismatch for file " + std::to_string(snapshot_.fileId),
                                     COMPONENT));
                }
                done_ = true;
                LOG_DEBUG_COMP_IF("Download of file " + std::to_string(snapshot_.fileId) + " complete, " +
                                  std::to_string(emitted_) + " bytes", COMPONENT);
                return std::optional<std::vector<uint8_t>>{};
            }

            const ChunkRef& ref = snapshot_.chunks[chunkIndex_];
            auto pulled = pullChunk(ref);
            if (pulled.isError()) {
                return failWith(pulled.error());
            }

            std::vector<uint8_t>& bytes = pulled.value();
            if (bytes.size() != ref.byteSize) {
                LOG_ERROR_COMP("File " + std::to_string(snapshot_.fileId) + " chunk " +
                               std::to_string(ref.sequenceIndex) + " is " + std::to_string(bytes.size()) +
                               " bytes, expected " + std::to_string(ref.byteSize), COMPONENT);
                return failWith(Err(Core::ErrorCode::INTEGRITY_ERROR,
                                 "Size mismatch on chunk " + std::to_string(ref.sequenceIndex), COMPONENT));
            }
            std::string hash = SHA256::hashBytes(bytes);
            if (hash != ref.contentHash) {
                LOG_ERROR_COMP("File " + std::to_string(snapshot_.fileId) + " chunk " +
                               std::to_string(ref.sequenceIndex) + " hash " + hash + " does not match " +
                               ref.contentHash, COMPONENT);
                return failWith(Err(Core::ErrorCode::INTEGRITY_ERROR,
                                 "Hash mismatch on chunk " + std::to_string(ref.sequenceIndex), COMPONENT));
            }

            if (!fileHasher_->update(bytes)) {
                return failWith(Err(Core::ErrorCode::INTERNAL_ERROR, "Whole-file digest failed", COMPONENT));
            }
            current_ = std::move(bytes);
            offset_ = 0;
            ++chunkIndex_;
        }

        std::size_t length = std::min(options_.blockSize, current_.size() - offset_);
        auto first = current_.begin() + static_cast<std::ptrdiff_t>(offset_);
        std::vector<uint8_t> block(first, first + static_cast<std::ptrdiff_t>(length));
        offset_ += length;
        emitted_ += length;
        return std::optional<std::vector<uint8_t>>(std::move(block));
    }

    Result<uint64_t> DownloadStream::pipeTo(ByteSink& sink, const CancellationToken& token) {
        ScopeGuard cleanup([this]() { release(); });
        uint64_t written = 0;

        while (true) {
            if (token.cancelled()) {
                token_.cancel();
            }
            auto block = next();
            if (block.isError()) {
                return block.error();
            }
            if (!block.value()) {
                return written;
            }

            const std::vector<uint8_t>& bytes = *block.value();
            if (!sink.write(bytes.data(), bytes.size())) {
                LOG_INFO_COMP_IF("Client stopped reading file " + std::to_string(snapshot_.fileId) + " after " +
                                 std::to_string(written) + " bytes", COMPONENT);
                token_.cancel();
                return failWith(Err(Core::ErrorCode::STREAM_CANCELLED, "Sink closed", COMPONENT)).error();
            }
            written += bytes.size();
        }
    }

} // namespace ChunkVault
