#include "TransferStatusTracker.h"
#include "LoggerMacros.h"
#include <mutex>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "TransferStatusTracker";
    }

    TransferStatusTracker::TransferStatusTracker(std::shared_ptr<IMetadataStore> store)
        : store_(std::move(store)) {}

    Result<StatusSnapshot> TransferStatusTracker::query(int64_t fileId) const {
        std::shared_ptr<const StatusSnapshot> current;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = latest_.find(fileId);
            if (it != latest_.end()) {
                current = it->second;
            }
        }
        if (current) {
            return *current;
        }
        return store_->getStatus(fileId);
    }

    void TransferStatusTracker::publish(const StatusSnapshot& snapshot) {
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = latest_.find(snapshot.fileId);
            if (it == latest_.end()) {
                // Only a new run starts tracking; anything else is a late writer for a settled transfer
                if (snapshot.status != TransferStatus::Initializing) {
                    return;
                }
                latest_.emplace(snapshot.fileId, std::make_shared<const StatusSnapshot>(snapshot));
            } else {
                const StatusSnapshot& current = *it->second;
                // Never let a late writer move a transfer backwards
                bool sameState = current.status == snapshot.status;
                if (isTerminal(current.status) ||
                    (!sameState && !canTransition(current.status, snapshot.status)) ||
                    (sameState && current.uploadedCount > snapshot.uploadedCount)) {
                    return;
                }
                if (isTerminal(snapshot.status)) {
                    latest_.erase(it);   // the store already holds the terminal row
                } else {
                    it->second = std::make_shared<const StatusSnapshot>(snapshot);
                }
            }
        }
        LOG_DEBUG_COMP_IF("Transfer " + std::to_string(snapshot.fileId) + " " + toString(snapshot.status) + " " +
                          std::to_string(snapshot.uploadedCount) + "/" + std::to_string(snapshot.chunkCount),
                          COMPONENT);
    }

    void TransferStatusTracker::publishUnrecorded(const StatusSnapshot& snapshot) {
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto& slot = latest_[snapshot.fileId];
            if (slot && isTerminal(slot->status)) {
                return;
            }
            slot = std::make_shared<const StatusSnapshot>(snapshot);
        }
        LOG_WARN_COMP("Transfer " + std::to_string(snapshot.fileId) + " held as " + toString(snapshot.status) +
                      " without a stored record", COMPONENT);
    }

    void TransferStatusTracker::forget(int64_t fileId) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        latest_.erase(fileId);
    }

    std::optional<StatusSnapshot> TransferStatusTracker::tracked(int64_t fileId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = latest_.find(fileId);
        if (it == latest_.end()) {
            return std::nullopt;
        }
        return *it->second;
    }

    std::size_t TransferStatusTracker::trackedCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return latest_.size();
    }

} // namespace ChunkVault
