#include "ErrorCodes.h"
#include <json/json.h>

namespace ChunkVault {
namespace Core {

bool isRetryable(ErrorCode code) {
    return code == ErrorCode::REMOTE_UNAVAILABLE || code == ErrorCode::REMOTE_TIMEOUT;
}

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> errorMessages = {
        {ErrorCode::SOURCE_READ_ERROR, "Upload source could not be read"},

        {ErrorCode::REMOTE_UNAVAILABLE, "Remote store unavailable"},
        {ErrorCode::REMOTE_REJECTED, "Remote store rejected the chunk"},
        {ErrorCode::REMOTE_NOT_FOUND, "Remote chunk not found"},
        {ErrorCode::REMOTE_TIMEOUT, "Remote store call timed out"},

        {ErrorCode::INTEGRITY_ERROR, "Chunk content hash mismatch"},
        {ErrorCode::METADATA_INCONSISTENCY, "File metadata is missing expected chunks"},

        {ErrorCode::FILE_NOT_FOUND, "File not found"},
        {ErrorCode::TRANSFER_IN_PROGRESS, "Transfer still in progress"},
        {ErrorCode::CONNECTION_LOST, "Connection lost"},
        {ErrorCode::STREAM_CANCELLED, "Stream cancelled by client"},
        {ErrorCode::FILE_TOO_LARGE, "File exceeds the configured size limit"},

        {ErrorCode::INTERNAL_ERROR, "Internal system error"},
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},
        {ErrorCode::STORAGE_ERROR, "Metadata store error"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return errorMessages;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& table = messages();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown error";
}

ErrorInfo ErrorRegistry::createError(ErrorCode code, const std::string& details) {
    return ErrorInfo(code, getMessage(code), details);
}

Json::Value ErrorInfo::toJson() const {
    Json::Value root(Json::objectValue);
    root["code"] = static_cast<int>(code);
    root["name"] = getErrorCodeString(code);
    root["message"] = message;
    root["details"] = details;
    return root;
}

std::string ErrorInfo::getErrorCodeString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SOURCE_READ_ERROR: return "SOURCE_READ_ERROR";

        case ErrorCode::REMOTE_UNAVAILABLE: return "REMOTE_UNAVAILABLE";
        case ErrorCode::REMOTE_REJECTED: return "REMOTE_REJECTED";
        case ErrorCode::REMOTE_NOT_FOUND: return "REMOTE_NOT_FOUND";
        case ErrorCode::REMOTE_TIMEOUT: return "REMOTE_TIMEOUT";

        case ErrorCode::INTEGRITY_ERROR: return "INTEGRITY_ERROR";
        case ErrorCode::METADATA_INCONSISTENCY: return "METADATA_INCONSISTENCY";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::TRANSFER_IN_PROGRESS: return "TRANSFER_IN_PROGRESS";
        case ErrorCode::CONNECTION_LOST: return "CONNECTION_LOST";
        case ErrorCode::STREAM_CANCELLED: return "STREAM_CANCELLED";
        case ErrorCode::FILE_TOO_LARGE: return "FILE_TOO_LARGE";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";

        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

} // namespace Core
} // namespace ChunkVault
