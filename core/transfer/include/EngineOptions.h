#pragma once

#include "Config.h"
#include "DownloadStream.h"
#include "UploadOrchestrator.h"
#include <chrono>
#include <string>

namespace ChunkVault {

    /**
     * @brief Engine-wide settings, read from a Config.
     */
    struct EngineOptions {
        UploadOptions upload;
        StreamOptions stream;

        std::chrono::milliseconds pollInterval{1000};
        int pollFailureBudget{10};

        std::string databasePath{"chunkvault.db"};
        std::string remoteRoot{"chunkvault_objects"};
        std::string tempDir{"chunkvault_tmp"};
        std::string logFile;
        std::string logLevel{"INFO"};

        /**
         * @brief Defaults overridden by any keys present in config.
         * @return INVALID_CONFIGURATION naming the first bad key
         */
        static Result<EngineOptions> fromConfig(const Config& config);

        /**
         * @brief Commented config file listing every key with its default.
         */
        static std::string configTemplate();
    };

} // namespace ChunkVault
