#pragma once

#include <json/json.h>
#include <string>
#include <unordered_map>

namespace ChunkVault {
namespace Core {

enum class ErrorCode : int {
    // Source errors (1000-1999)
    SOURCE_READ_ERROR = 1000,

    // Remote store errors (2000-2999)
    REMOTE_UNAVAILABLE = 2000,
    REMOTE_REJECTED = 2001,
    REMOTE_NOT_FOUND = 2002,
    REMOTE_TIMEOUT = 2003,

    // Integrity errors (3000-3999)
    INTEGRITY_ERROR = 3000,
    METADATA_INCONSISTENCY = 3001,

    // Transfer / client errors (4000-4999)
    FILE_NOT_FOUND = 4000,
    TRANSFER_IN_PROGRESS = 4001,
    CONNECTION_LOST = 4002,
    STREAM_CANCELLED = 4003,
    FILE_TOO_LARGE = 4004,

    // System errors (5000-5999)
    INTERNAL_ERROR = 5000,
    INVALID_CONFIGURATION = 5001,
    STORAGE_ERROR = 5002,

    SUCCESS = 0
};

/**
 * @brief Remote failures worth another attempt: the backend may recover.
 */
bool isRetryable(ErrorCode code);

class ErrorInfo {
public:
    ErrorCode code;
    std::string message;
    std::string details;

    ErrorInfo(ErrorCode code, const std::string& message, const std::string& details = "")
        : code(code), message(message), details(details) {}

    Json::Value toJson() const;
    static std::string getErrorCodeString(ErrorCode code);
};

class ErrorRegistry {
public:
    static std::string getMessage(ErrorCode code);
    static ErrorInfo createError(ErrorCode code, const std::string& details = "");

private:
    static const std::unordered_map<ErrorCode, std::string>& messages();
};

} // namespace Core
} // namespace ChunkVault
