#include "TransferCommands.h"
#include "Logger.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace ChunkVault {

namespace {
    const char* COMPONENT = "TransferCommands";

    Json::Value recordToJson(const FileRecord& record) {
        Json::Value file(Json::objectValue);
        file["fileId"] = static_cast<Json::Int64>(record.id);
        file["filename"] = record.filename;
        file["size"] = static_cast<Json::UInt64>(record.totalSize);
        file["status"] = TransferCommands::statusLabel(record.status);
        file["uploaded"] = static_cast<Json::UInt64>(record.uploadedCount);
        file["total"] = static_cast<Json::UInt64>(record.chunkCount);
        file["createdAt"] = static_cast<Json::Int64>(record.createdAt);
        if (!record.fileHash.empty()) {
            file["hash"] = record.fileHash;
        }
        return file;
    }
}

std::string DownloadResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) {
            return value;
        }
    }
    return "";
}

TransferCommands::TransferCommands(TransferEngine& engine, std::string tempDir)
    : engine_(engine), tempDir_(std::move(tempDir)) {}

std::string TransferCommands::statusLabel(TransferStatus status) {
    if (status == TransferStatus::Initializing) {
        return toString(TransferStatus::Chunking);
    }
    return toString(status);
}

int TransferCommands::httpStatusFor(Core::ErrorCode code) {
    switch (code) {
        case Core::ErrorCode::FILE_NOT_FOUND:
            return 404;
        case Core::ErrorCode::TRANSFER_IN_PROGRESS:
        case Core::ErrorCode::METADATA_INCONSISTENCY:
        case Core::ErrorCode::SOURCE_READ_ERROR:
            return 400;
        case Core::ErrorCode::FILE_TOO_LARGE:
            return 413;
        case Core::ErrorCode::REMOTE_UNAVAILABLE:
        case Core::ErrorCode::REMOTE_TIMEOUT:
            return 503;
        default:
            return 500;
    }
}

Json::Value TransferCommands::errorResponse(const Error& error) {
    Core::ErrorInfo info = Core::ErrorRegistry::createError(error.errorCode(), error.message);
    Json::Value response(Json::objectValue);
    response["success"] = false;
    response["error"] = info.details;
    response["code"] = Core::ErrorInfo::getErrorCodeString(info.code);
    response["errorInfo"] = info.toJson();
    response["httpStatus"] = httpStatusFor(info.code);
    return response;
}

std::string TransferCommands::spoolPath() const {
    static std::atomic<uint64_t> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return (std::filesystem::path(tempDir_) /
            ("upload_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)) + ".part")).string();
}

Json::Value TransferCommands::startUpload(Result<std::unique_ptr<FileByteSource>> source, const std::string& filename) {
    if (source.isError()) {
        Logger::instance().error("Cannot read upload source: " + source.error().toString(), COMPONENT);
        return errorResponse(source.error());
    }

    auto started = engine_.initiate(std::move(source.value()), filename);
    if (started.isError()) {
        return errorResponse(started.error());
    }

    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["fileId"] = static_cast<Json::Int64>(started.value());
    return response;
}

Json::Value TransferCommands::handleInitiate(const std::vector<uint8_t>& body, const std::string& filename) {
    uint64_t limit = engine_.uploads().options().maxFileSize;
    if (limit > 0 && body.size() > limit) {
        Logger::instance().warn("Rejected " + filename + " before spooling: " + std::to_string(body.size()) +
                                " bytes exceeds limit of " + std::to_string(limit), COMPONENT);
        return errorResponse(Err(Core::ErrorCode::FILE_TOO_LARGE,
                                 std::to_string(body.size()) + " bytes exceeds the limit of " + std::to_string(limit),
                                 COMPONENT));
    }

    try {
        std::error_code ec;
        std::filesystem::create_directories(tempDir_, ec);
        if (ec) {
            return errorResponse(Err(Core::ErrorCode::INTERNAL_ERROR,
                                     "Cannot create temp dir " + tempDir_ + ": " + ec.message(), COMPONENT));
        }

        std::string path = spoolPath();
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
            if (!out) {
                out.close();
                std::filesystem::remove(path, ec);
                return errorResponse(Err(Core::ErrorCode::INTERNAL_ERROR, "Cannot spool upload to " + path, COMPONENT));
            }
        }

        auto source = FileByteSource::open(path, true);
        if (source.isError()) {
            std::filesystem::remove(path, ec);
        }
        return startUpload(std::move(source), filename);
    } catch (const std::exception& e) {
        Logger::instance().error("Initiate failed: " + std::string(e.what()), COMPONENT);
        return errorResponse(Err(Core::ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT));
    }
}

Json::Value TransferCommands::handleInitiateFile(const std::string& path) {
    try {
        return startUpload(FileByteSource::open(path, false), path);
    } catch (const std::exception& e) {
        Logger::instance().error("Initiate failed: " + std::string(e.what()), COMPONENT);
        return errorResponse(Err(Core::ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT));
    }
}

Json::Value TransferCommands::handleStatus(int64_t fileId) {
    auto snapshot = engine_.status(fileId);
    if (snapshot.isError()) {
        return errorResponse(snapshot.error());
    }

    const StatusSnapshot& current = snapshot.value();
    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["fileId"] = static_cast<Json::Int64>(fileId);
    response["status"] = statusLabel(current.status);
    response["uploaded"] = static_cast<Json::UInt64>(current.uploadedCount);
    response["total"] = static_cast<Json::UInt64>(current.chunkCount);
    return response;
}

DownloadResponse TransferCommands::handleDownload(int64_t fileId) {
    DownloadResponse response;

    auto snapshot = engine_.prepareDownload(fileId);
    if (snapshot.isError()) {
        response.statusCode = httpStatusFor(snapshot.error().errorCode());
        response.error = errorResponse(snapshot.error());
        return response;
    }

    DownloadSnapshot& prepared = snapshot.value();
    response.headers = {
        {"Content-Type", "application/octet-stream"},
        {"Content-Length", std::to_string(prepared.totalSize)},
        {"Content-Disposition", "attachment; filename=\"" + prepared.filename + "\""},
        {"Accept-Ranges", "none"},
        {"Cache-Control", "no-cache"},
    };

    Logger::instance().info("Download of file " + std::to_string(fileId) + " (" + prepared.filename + ", " +
                            std::to_string(prepared.totalSize) + " bytes) prepared", COMPONENT);
    response.stream.emplace(engine_.openStream(std::move(prepared)));
    return response;
}

Json::Value TransferCommands::handleDelete(int64_t fileId) {
    auto removed = engine_.remove(fileId);
    if (removed.isError()) {
        return errorResponse(removed.error());
    }

    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["fileId"] = static_cast<Json::Int64>(fileId);
    return response;
}

Json::Value TransferCommands::handleList() {
    auto files = engine_.listFiles();
    if (files.isError()) {
        return errorResponse(files.error());
    }

    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["files"] = Json::Value(Json::arrayValue);
    for (const auto& record : files.value()) {
        response["files"].append(recordToJson(record));
    }
    return response;
}

Json::Value TransferCommands::handleHealth() {
    auto health = engine_.health();
    if (health.isError()) {
        return errorResponse(health.error());
    }

    const HealthSummary& summary = health.value();
    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["totalFiles"] = static_cast<Json::UInt64>(summary.totalFiles);
    response["totalBytes"] = static_cast<Json::UInt64>(summary.totalBytes);
    response["completedFiles"] = static_cast<Json::UInt64>(summary.completedFiles);
    response["failedFiles"] = static_cast<Json::UInt64>(summary.failedFiles);
    return response;
}

Json::Value TransferCommands::handleRecover() {
    auto recovered = engine_.recoverInterrupted();
    if (recovered.isError()) {
        return errorResponse(recovered.error());
    }

    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["recovered"] = static_cast<Json::UInt64>(recovered.value());
    return response;
}

} // namespace ChunkVault
