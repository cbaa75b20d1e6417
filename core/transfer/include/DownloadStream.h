#pragma once

#include "IRemoteStore.h"
#include "RetryPolicy.h"
#include "SHA256.h"
#include "TimedRemoteCall.h"
#include "TransferTypes.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace ChunkVault {

    /**
     * @brief Everything needed to rebuild one file, copied out of the
     * metadata store. Plain data: no store, connection or request state.
     */
    struct DownloadSnapshot {
        int64_t fileId{0};
        std::string filename;
        uint64_t totalSize{0};
        std::string fileHash;
        std::vector<ChunkRef> chunks;   // sequenceIndex order, gap-free
    };

    struct StreamOptions {
        std::size_t blockSize{512 * 1024};
        std::chrono::milliseconds remoteTimeout{120000};
        RetryPolicy retry;              // per chunk pull
        bool verifyFileHash{true};
    };

    /**
     * @brief Receives streamed blocks. Returning false means the reader
     * has gone away; the stream stops pulling.
     */
    class ByteSink {
    public:
        virtual ~ByteSink() = default;
        virtual bool write(const uint8_t* data, std::size_t length) = 0;
    };

    /**
     * @brief Shared flag a client disconnect handler can set from any thread.
     */
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const { flag_->store(true); }
        bool cancelled() const { return flag_->load(); }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    /**
     * @brief Single-pass byte stream over a DownloadSnapshot.
     *
     * Chunks are pulled one at a time in sequence order through a fresh
     * remote client, checked against their recorded size and hash, and
     * handed out in blocks of at most blockSize bytes. Only one chunk is
     * held in memory. A failed check ends the stream with INTEGRITY_ERROR
     * before any byte of the bad chunk is emitted; any error is final and
     * every later next() repeats it.
     */
    class DownloadStream {
    public:
        /**
         * @param calls workers for timed pulls; a private single worker when null
         */
        DownloadStream(DownloadSnapshot snapshot, RemoteStoreFactory remote, StreamOptions options = {},
                       std::shared_ptr<TimedRemoteCall> calls = nullptr);

        DownloadStream(DownloadStream&&) = default;
        DownloadStream& operator=(DownloadStream&&) = default;
        DownloadStream(const DownloadStream&) = delete;
        DownloadStream& operator=(const DownloadStream&) = delete;

        /**
         * @return the next block, or an empty optional once every byte was emitted
         */
        Result<std::optional<std::vector<uint8_t>>> next();

        /**
         * @brief Drain the stream into sink.
         * @return bytes written; STREAM_CANCELLED if the sink refused a block
         *         or the token fired, otherwise the error that ended the stream
         */
        Result<uint64_t> pipeTo(ByteSink& sink, const CancellationToken& token = CancellationToken());

        void cancel() { token_.cancel(); }
        const CancellationToken& token() const { return token_; }

        uint64_t bytesEmitted() const { return emitted_; }
        uint64_t totalSize() const { return snapshot_.totalSize; }
        bool finished() const { return done_ || failure_.has_value(); }

        const DownloadSnapshot& snapshot() const { return snapshot_; }

    private:
        Result<std::vector<uint8_t>> pullChunk(const ChunkRef& ref);
        Result<std::optional<std::vector<uint8_t>>> failWith(Error error);
        void release();

        DownloadSnapshot snapshot_;
        RemoteStoreFactory remote_;
        StreamOptions options_;
        std::shared_ptr<TimedRemoteCall> calls_;
        CancellationToken token_;

        std::size_t chunkIndex_{0};
        std::vector<uint8_t> current_;
        std::size_t offset_{0};
        uint64_t emitted_{0};
        bool done_{false};
        std::optional<Error> failure_;
        std::unique_ptr<SHA256::Hasher> fileHasher_;
    };

} // namespace ChunkVault
