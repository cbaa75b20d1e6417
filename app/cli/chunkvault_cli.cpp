#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>
#include "Config.h"
#include "EngineOptions.h"
#include "Logger.h"
#include "StatusPoller.h"
#include "TransferCommands.h"
#include "TransferEngine.h"

using namespace ChunkVault;

namespace {

class FileSink : public ByteSink {
public:
    explicit FileSink(const std::string& path) : out_(path, std::ios::binary | std::ios::trunc) {}

    bool isOpen() const { return out_.is_open(); }

    bool write(const uint8_t* data, std::size_t length) override {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
        return static_cast<bool>(out_);
    }

    void close() { out_.close(); }

private:
    std::ofstream out_;
};

void printUsage(const char* program) {
    std::cout << "ChunkVault - chunked file transfer engine" << std::endl;
    std::cout << "\nUsage: " << program << " [OPTIONS] <COMMAND> [ARGS]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  upload <PATH> [--wait]     Upload a file; --wait polls until it finishes" << std::endl;
    std::cout << "  status <ID>                Show transfer status" << std::endl;
    std::cout << "  download <ID> <OUT>        Rebuild a completed file into OUT" << std::endl;
    std::cout << "  delete <ID>                Delete a finished transfer and its chunks" << std::endl;
    std::cout << "  list                       List transfers, newest first" << std::endl;
    std::cout << "  health                     Summary of all transfers" << std::endl;
    std::cout << "  recover                    Fail transfers left unfinished by a stopped process" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <PATH>            Config file (default: chunkvault.conf)" << std::endl;
    std::cout << "  --verbose                  Log at DEBUG level" << std::endl;
    std::cout << "  --help                     Show this help message" << std::endl;
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

bool parseId(const std::string& text, int64_t& id) {
    try {
        std::size_t used = 0;
        id = std::stoll(text, &used);
        return used == text.size() && id > 0;
    } catch (const std::exception&) {
        return false;
    }
}

int exitCodeFor(const Json::Value& response) {
    return response.get("success", false).asBool() ? 0 : 1;
}

int runDownload(TransferCommands& commands, int64_t fileId, const std::string& outPath) {
    auto& logger = Logger::instance();
    DownloadResponse response = commands.handleDownload(fileId);
    if (response.statusCode != 200 || !response.stream) {
        printJson(response.error);
        return 1;
    }

    FileSink sink(outPath);
    if (!sink.isOpen()) {
        logger.error("Cannot open " + outPath + " for writing", "CLI");
        return 1;
    }

    auto written = response.stream->pipeTo(sink);
    sink.close();
    if (written.isError()) {
        logger.error("Download of file " + std::to_string(fileId) + " aborted after " +
                     std::to_string(response.stream->bytesEmitted()) + " of " +
                     response.header("Content-Length") + " bytes: " + written.error().toString(), "CLI");
        std::error_code ec;
        std::filesystem::remove(outPath, ec);
        return 1;
    }

    std::cout << "Wrote " << written.value() << " bytes to " << outPath << std::endl;
    return 0;
}

int runUpload(TransferCommands& commands, const EngineOptions& options, const std::string& path, bool wait) {
    Json::Value started = commands.handleInitiateFile(path);
    printJson(started);
    if (!started.get("success", false).asBool() || !wait) {
        return exitCodeFor(started);
    }

    CommandStatusTransport transport(commands);
    PollerOptions pollerOptions;
    pollerOptions.interval = options.pollInterval;
    pollerOptions.failureBudget = options.pollFailureBudget;
    StatusPoller poller(transport, pollerOptions);

    auto report = poller.poll(started["fileId"].asInt64(), [](const PolledStatus& status) {
        std::cout << status.status << " " << status.uploaded << "/" << status.total << std::endl;
    });

    std::cout << "Result: " << toString(report.outcome) << std::endl;
    return report.outcome == PollOutcome::Completed ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("CLI");
    logger.setLevel(LogLevel::INFO);

    std::string configPath = "chunkvault.conf";
    bool verbose = false;
    bool wait = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--wait") {
            wait = true;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // --- Configuration ---
    Config fileConfig;
    if (!fileConfig.loadFromFile(configPath)) {
        std::ofstream templateFile(configPath);
        if (templateFile.is_open()) {
            templateFile << EngineOptions::configTemplate();
            templateFile.close();
            logger.info("Wrote default configuration to " + configPath, "CLI");
        }
        if (!fileConfig.loadFromFile(configPath)) {
            logger.warn("No usable config at " + configPath + ", using defaults", "CLI");
        }
    }

    auto options = EngineOptions::fromConfig(fileConfig);
    if (options.isError()) {
        logger.error(options.error().toString(), "CLI");
        return 1;
    }

    // --- Logging ---
    logger.setLevel(verbose ? LogLevel::DEBUG : logLevelFromString(options.value().logLevel));
    if (!options.value().logFile.empty()) {
        logger.setLogFile(options.value().logFile);
        logger.setMaxFileSize(50);
    }

    // --- Engine ---
    auto engine = TransferEngine::open(options.value());
    if (engine.isError()) {
        logger.critical("Failed to open transfer engine: " + engine.error().toString(), "CLI");
        return 1;
    }
    TransferCommands commands(*engine.value(), options.value().tempDir);

    const std::string& command = positional[0];
    int64_t fileId = 0;

    if (command == "upload" && positional.size() == 2) {
        return runUpload(commands, options.value(), positional[1], wait);
    }
    if (command == "status" && positional.size() == 2 && parseId(positional[1], fileId)) {
        Json::Value response = commands.handleStatus(fileId);
        printJson(response);
        return exitCodeFor(response);
    }
    if (command == "download" && positional.size() == 3 && parseId(positional[1], fileId)) {
        return runDownload(commands, fileId, positional[2]);
    }
    if (command == "delete" && positional.size() == 2 && parseId(positional[1], fileId)) {
        Json::Value response = commands.handleDelete(fileId);
        printJson(response);
        return exitCodeFor(response);
    }
    if (command == "list" && positional.size() == 1) {
        Json::Value response = commands.handleList();
        printJson(response);
        return exitCodeFor(response);
    }
    if (command == "health" && positional.size() == 1) {
        Json::Value response = commands.handleHealth();
        printJson(response);
        return exitCodeFor(response);
    }

    if (command == "recover" && positional.size() == 1) {
        Json::Value response = commands.handleRecover();
        printJson(response);
        return exitCodeFor(response);
    }

    std::cerr << "Unknown or malformed command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
