#include "TransferTypes.h"

namespace ChunkVault {

    namespace {
        int rank(TransferStatus status) {
            switch (status) {
                case TransferStatus::Initializing: return 0;
                case TransferStatus::Chunking: return 1;
                case TransferStatus::Uploading: return 2;
                case TransferStatus::Completed:
                case TransferStatus::Failed: return 3;
            }
            return 0;
        }
    }

    const char* toString(TransferStatus status) {
        switch (status) {
            case TransferStatus::Initializing: return "initializing";
            case TransferStatus::Chunking: return "chunking";
            case TransferStatus::Uploading: return "uploading";
            case TransferStatus::Completed: return "completed";
            case TransferStatus::Failed: return "failed";
        }
        return "unknown";
    }

    std::optional<TransferStatus> transferStatusFromString(const std::string& value) {
        if (value == "initializing") return TransferStatus::Initializing;
        if (value == "chunking") return TransferStatus::Chunking;
        if (value == "uploading") return TransferStatus::Uploading;
        if (value == "completed") return TransferStatus::Completed;
        if (value == "failed") return TransferStatus::Failed;
        return std::nullopt;
    }

    bool isTerminal(TransferStatus status) {
        return status == TransferStatus::Completed || status == TransferStatus::Failed;
    }

    bool canTransition(TransferStatus from, TransferStatus to) {
        if (isTerminal(from)) {
            return false;
        }
        return rank(to) > rank(from);
    }

    uint64_t chunkCountFor(uint64_t totalSize, uint64_t chunkSize) {
        if (chunkSize == 0 || totalSize == 0) {
            return 0;
        }
        return (totalSize + chunkSize - 1) / chunkSize;
    }

    uint64_t expectedChunkSize(uint64_t totalSize, uint64_t chunkSize, uint64_t index) {
        uint64_t count = chunkCountFor(totalSize, chunkSize);
        if (index >= count) {
            return 0;
        }
        if (index + 1 < count) {
            return chunkSize;
        }
        uint64_t remainder = totalSize % chunkSize;
        return remainder == 0 ? chunkSize : remainder;
    }

} // namespace ChunkVault
