#pragma once

#include "TransferEngine.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ChunkVault {

/**
 * @brief Download reply: headers plus a stream that runs after the
 * handler returns. The stream is built from a snapshot only.
 */
struct DownloadResponse {
    int statusCode{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<DownloadStream> stream;
    Json::Value error;   // set when statusCode != 200

    std::string header(const std::string& name) const;
};

/**
 * @brief Request/response contract of the transfer endpoints.
 *
 * Commands: initiate, status, download, delete, list, health, recover.
 * JSON replies carry "success"; failures add "error", "code",
 * "httpStatus" and the registry's "errorInfo" object.
 */
class TransferCommands {
public:
    TransferCommands(TransferEngine& engine, std::string tempDir);

    /**
     * @brief Spool a request body to tempDir and start its upload.
     * The spooled file is removed when the upload ends. A body over the
     * size limit is refused before anything is written.
     */
    Json::Value handleInitiate(const std::vector<uint8_t>& body, const std::string& filename);

    /**
     * @brief Upload a file already on disk; the file is left in place.
     */
    Json::Value handleInitiateFile(const std::string& path);

    Json::Value handleStatus(int64_t fileId);
    DownloadResponse handleDownload(int64_t fileId);
    Json::Value handleDelete(int64_t fileId);
    Json::Value handleList();
    Json::Value handleHealth();

    /**
     * @brief Fail records an earlier process left mid-upload.
     */
    Json::Value handleRecover();

    /**
     * @brief Status as clients see it: initializing reads as chunking.
     */
    static std::string statusLabel(TransferStatus status);

    static int httpStatusFor(Core::ErrorCode code);
    static Json::Value errorResponse(const Error& error);

private:
    TransferEngine& engine_;
    std::string tempDir_;

    Json::Value startUpload(Result<std::unique_ptr<FileByteSource>> source, const std::string& filename);
    std::string spoolPath() const;
};

} // namespace ChunkVault
