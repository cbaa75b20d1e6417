#include "EngineOptions.h"
#include <cctype>
#include <sstream>

namespace ChunkVault {

    namespace {
        bool isUnsigned(const std::string& value) {
            if (value.empty() || value.size() > 19) {
                return false;
            }
            for (char c : value) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
            }
            return true;
        }

        bool isPositive(const std::string& value) {
            return isUnsigned(value) && value.find_first_not_of('0') != std::string::npos;
        }

        bool isBool(const std::string& value) {
            return value == "true" || value == "false" || value == "1" || value == "0" ||
                   value == "yes" || value == "no";
        }

        bool isLogLevel(const std::string& value) {
            return value == "DEBUG" || value == "INFO" || value == "WARN" ||
                   value == "ERROR" || value == "CRITICAL";
        }

        bool fitsInt(const std::string& value) {
            return isUnsigned(value) && value.size() <= 9;
        }
    }

    Result<EngineOptions> EngineOptions::fromConfig(const Config& config) {
        auto positive = [](const std::string&, const std::string& v) { return isPositive(v); };
        auto positiveInt = [](const std::string&, const std::string& v) { return isPositive(v) && fitsInt(v); };
        auto unsignedValue = [](const std::string&, const std::string& v) { return isUnsigned(v); };
        auto unsignedInt = [](const std::string&, const std::string& v) { return isUnsigned(v) && fitsInt(v); };
        auto nonEmpty = [](const std::string&, const std::string& v) { return !v.empty(); };

        const std::unordered_map<std::string, Config::Validator> schema = {
            {"chunk_size_bytes", positive},
            {"max_push_attempts", positiveInt},
            {"retry_base_delay_ms", unsignedInt},
            {"retry_max_delay_ms", unsignedInt},
            {"upload_parallelism", positiveInt},
            {"max_concurrent_uploads", positiveInt},
            {"remote_timeout_ms", unsignedInt},
            {"stream_block_size", positive},
            {"verify_file_hash", [](const std::string&, const std::string& v) { return isBool(v); }},
            {"max_file_size_bytes", unsignedValue},
            {"poll_interval_ms", unsignedInt},
            {"poll_failure_budget", unsignedInt},
            {"database_path", nonEmpty},
            {"remote_root", nonEmpty},
            {"temp_dir", nonEmpty},
            {"log_level", [](const std::string&, const std::string& v) { return isLogLevel(v); }},
        };

        std::string badKey;
        if (!config.validate(schema, &badKey)) {
            return Err(Core::ErrorCode::INVALID_CONFIGURATION,
                       "Invalid value for " + badKey + ": '" + config.get(badKey) + "'", "Config");
        }

        EngineOptions options;
        UploadOptions& upload = options.upload;
        upload.chunkSize = config.getSize("chunk_size_bytes", upload.chunkSize);
        upload.retry.maxAttempts = config.getInt("max_push_attempts", upload.retry.maxAttempts);
        upload.retry.baseDelay = std::chrono::milliseconds(
            config.getInt("retry_base_delay_ms", static_cast<int>(upload.retry.baseDelay.count())));
        upload.retry.maxDelay = std::chrono::milliseconds(
            config.getInt("retry_max_delay_ms", static_cast<int>(upload.retry.maxDelay.count())));
        upload.parallelism = static_cast<std::size_t>(
            config.getInt("upload_parallelism", static_cast<int>(upload.parallelism)));
        upload.maxConcurrentUploads = static_cast<std::size_t>(
            config.getInt("max_concurrent_uploads", static_cast<int>(upload.maxConcurrentUploads)));
        upload.remoteTimeout = std::chrono::milliseconds(
            config.getInt("remote_timeout_ms", static_cast<int>(upload.remoteTimeout.count())));
        upload.maxFileSize = config.getSize("max_file_size_bytes", upload.maxFileSize);

        if (upload.retry.maxDelay < upload.retry.baseDelay) {
            return Err(Core::ErrorCode::INVALID_CONFIGURATION,
                       "retry_max_delay_ms must not be below retry_base_delay_ms", "Config");
        }

        StreamOptions& stream = options.stream;
        stream.blockSize = config.getSize("stream_block_size", stream.blockSize);
        stream.remoteTimeout = upload.remoteTimeout;
        stream.retry = upload.retry;
        stream.verifyFileHash = config.getBool("verify_file_hash", stream.verifyFileHash);

        options.pollInterval = std::chrono::milliseconds(
            config.getInt("poll_interval_ms", static_cast<int>(options.pollInterval.count())));
        options.pollFailureBudget = config.getInt("poll_failure_budget", options.pollFailureBudget);

        options.databasePath = config.get("database_path", options.databasePath);
        options.remoteRoot = config.get("remote_root", options.remoteRoot);
        options.tempDir = config.get("temp_dir", options.tempDir);
        options.logFile = config.get("log_file", options.logFile);
        options.logLevel = config.get("log_level", options.logLevel);

        return options;
    }

    std::string EngineOptions::configTemplate() {
        EngineOptions defaults;
        const UploadOptions& upload = defaults.upload;
        std::ostringstream out;
        out << "# ChunkVault configuration\n"
            << "# Lines starting with # are comments. Remove the # to override a default.\n\n"
            << "# Storage\n"
            << "database_path=" << defaults.databasePath << "\n"
            << "remote_root=" << defaults.remoteRoot << "\n"
            << "temp_dir=" << defaults.tempDir << "\n\n"
            << "# Chunking and upload\n"
            << "# chunk_size_bytes=" << upload.chunkSize << "\n"
            << "# max_file_size_bytes=0          # 0 = unlimited\n"
            << "# max_push_attempts=" << upload.retry.maxAttempts << "\n"
            << "# retry_base_delay_ms=" << upload.retry.baseDelay.count() << "\n"
            << "# retry_max_delay_ms=" << upload.retry.maxDelay.count() << "\n"
            << "# upload_parallelism=" << upload.parallelism << "\n"
            << "# max_concurrent_uploads=" << upload.maxConcurrentUploads << "\n"
            << "# remote_timeout_ms=" << upload.remoteTimeout.count() << "\n\n"
            << "# Download\n"
            << "# stream_block_size=" << defaults.stream.blockSize << "\n"
            << "# verify_file_hash=true\n\n"
            << "# Status polling (client)\n"
            << "# poll_interval_ms=" << defaults.pollInterval.count() << "\n"
            << "# poll_failure_budget=" << defaults.pollFailureBudget << "\n\n"
            << "# Logging\n"
            << "# log_file=chunkvault.log\n"
            << "log_level=" << defaults.logLevel << "\n";
        return out.str();
    }

} // namespace ChunkVault
