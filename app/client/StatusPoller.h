#pragma once

#include "Result.h"
#include "TransferTypes.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ChunkVault {

class TransferCommands;

/**
 * @brief One status reply as seen by a polling client.
 */
struct PolledStatus {
    std::string status;   // chunking, uploading, completed, failed
    uint64_t uploaded{0};
    uint64_t total{0};
};

/**
 * @brief How the poller reaches the server. Transport failures are
 * reported as errors; a well-formed "not found" reply is also an error.
 */
class IStatusTransport {
public:
    virtual ~IStatusTransport() = default;
    virtual Result<PolledStatus> fetch(int64_t fileId) = 0;
};

struct PollerOptions {
    std::chrono::milliseconds interval{1000};
    int failureBudget{10};   // consecutive failures tolerated
    int maxPolls{0};         // 0 = poll until an outcome
};

enum class PollOutcome {
    Completed,
    Failed,
    ConnectionLost,
    GaveUp            // maxPolls reached with the transfer still running
};

const char* toString(PollOutcome outcome);

struct PollReport {
    PollOutcome outcome{PollOutcome::GaveUp};
    PolledStatus last;             // last successful reply
    int polls{0};
    int consecutiveFailures{0};
    std::string lastError;
};

/**
 * @brief Client-side polling loop.
 *
 * Polls at a fixed interval until the transfer is completed or failed.
 * Consecutive transport failures beyond the budget end the loop with
 * ConnectionLost; this is a client decision and changes nothing on the
 * server. A successful reply resets the failure count.
 */
class StatusPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using ProgressCallback = std::function<void(const PolledStatus&)>;

    StatusPoller(IStatusTransport& transport, PollerOptions options, Sleeper sleeper = nullptr);

    PollReport poll(int64_t fileId, const ProgressCallback& onProgress = nullptr);

private:
    IStatusTransport& transport_;
    PollerOptions options_;
    Sleeper sleeper_;
};

/**
 * @brief In-process transport over TransferCommands::handleStatus.
 */
class CommandStatusTransport : public IStatusTransport {
public:
    explicit CommandStatusTransport(TransferCommands& commands) : commands_(commands) {}

    Result<PolledStatus> fetch(int64_t fileId) override;

private:
    TransferCommands& commands_;
};

} // namespace ChunkVault
