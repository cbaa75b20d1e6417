#include "StatusPoller.h"
#include "Logger.h"
#include "TransferCommands.h"
#include <thread>

namespace ChunkVault {

namespace {
    const char* COMPONENT = "StatusPoller";
}

const char* toString(PollOutcome outcome) {
    switch (outcome) {
        case PollOutcome::Completed: return "completed";
        case PollOutcome::Failed: return "failed";
        case PollOutcome::ConnectionLost: return "connection_lost";
        case PollOutcome::GaveUp: return "gave_up";
    }
    return "unknown";
}

StatusPoller::StatusPoller(IStatusTransport& transport, PollerOptions options, Sleeper sleeper)
    : transport_(transport), options_(options), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

PollReport StatusPoller::poll(int64_t fileId, const ProgressCallback& onProgress) {
    auto& logger = Logger::instance();
    PollReport report;

    while (options_.maxPolls <= 0 || report.polls < options_.maxPolls) {
        if (report.polls > 0) {
            sleeper_(options_.interval);
        }
        ++report.polls;

        auto reply = transport_.fetch(fileId);
        if (reply.isError()) {
            ++report.consecutiveFailures;
            report.lastError = reply.error().toString();
            logger.warn("Status poll " + std::to_string(report.polls) + " for file " + std::to_string(fileId) +
                        " failed (" + std::to_string(report.consecutiveFailures) + " in a row): " +
                        report.lastError, COMPONENT);
            if (report.consecutiveFailures > options_.failureBudget) {
                logger.error("Giving up on file " + std::to_string(fileId) + " after " +
                             std::to_string(report.consecutiveFailures) + " consecutive failures", COMPONENT);
                report.outcome = PollOutcome::ConnectionLost;
                return report;
            }
            continue;
        }

        report.consecutiveFailures = 0;
        report.last = reply.value();
        if (onProgress) {
            onProgress(report.last);
        }

        if (report.last.status == toString(TransferStatus::Completed)) {
            report.outcome = PollOutcome::Completed;
            return report;
        }
        if (report.last.status == toString(TransferStatus::Failed)) {
            report.outcome = PollOutcome::Failed;
            return report;
        }
    }

    report.outcome = PollOutcome::GaveUp;
    return report;
}

Result<PolledStatus> CommandStatusTransport::fetch(int64_t fileId) {
    Json::Value reply = commands_.handleStatus(fileId);
    if (!reply.get("success", false).asBool()) {
        std::string code = reply.get("code", "").asString();
        std::string message = reply.get("error", "status request failed").asString();
        auto errorCode = code == "FILE_NOT_FOUND" ? Core::ErrorCode::FILE_NOT_FOUND : Core::ErrorCode::CONNECTION_LOST;
        return Err(errorCode, message, COMPONENT);
    }

    PolledStatus status;
    status.status = reply.get("status", "").asString();
    status.uploaded = reply.get("uploaded", 0).asUInt64();
    status.total = reply.get("total", 0).asUInt64();
    return status;
}

} // namespace ChunkVault
