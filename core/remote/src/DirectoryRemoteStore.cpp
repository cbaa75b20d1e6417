#include "DirectoryRemoteStore.h"
#include "Logger.h"
#include <openssl/rand.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace ChunkVault {

    namespace fs = std::filesystem;

    namespace {
        const char* COMPONENT = "DirectoryRemoteStore";

        Result<std::string> generateHandle() {
            unsigned char raw[DirectoryRemoteStore::HANDLE_BYTES];
            if (RAND_bytes(raw, sizeof(raw)) != 1) {
                return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Failed to generate object handle", COMPONENT);
            }
            std::ostringstream ss;
            for (unsigned char byte : raw) {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            return ss.str();
        }
    }

    DirectoryRemoteStore::DirectoryRemoteStore(fs::path root)
        : root_(std::move(root)) {}

    RemoteStoreFactory DirectoryRemoteStore::factory(std::string root) {
        return [root]() -> std::shared_ptr<IRemoteStore> {
            return std::make_shared<DirectoryRemoteStore>(root);
        };
    }

    bool DirectoryRemoteStore::isValidHandle(const std::string& remoteHandle) {
        if (remoteHandle.size() != HANDLE_BYTES * 2) {
            return false;
        }
        for (char c : remoteHandle) {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex) {
                return false;
            }
        }
        return true;
    }

    fs::path DirectoryRemoteStore::objectPath(const std::string& remoteHandle) const {
        return root_ / remoteHandle.substr(0, 2) / remoteHandle;
    }

    VoidResult DirectoryRemoteStore::checkRoot() const {
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE,
                       "Store root is not reachable: " + root_.string(), COMPONENT);
        }
        return Ok();
    }

    Result<std::string> DirectoryRemoteStore::push(const std::vector<uint8_t>& bytes) {
        if (bytes.empty()) {
            return Err(Core::ErrorCode::REMOTE_REJECTED, "Refusing to store an empty object", COMPONENT);
        }
        auto reachable = checkRoot();
        if (reachable.isError()) {
            return reachable.error();
        }

        auto handle = generateHandle();
        if (handle.isError()) {
            return handle.error();
        }
        const std::string& name = handle.value();

        fs::path target = objectPath(name);
        fs::path temp = target;
        temp += ".tmp";

        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE,
                       "Cannot create shard directory: " + ec.message(), COMPONENT);
        }

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Cannot open " + temp.string(), COMPONENT);
            }
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                fs::remove(temp, ec);
                return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Short write to " + temp.string(), COMPONENT);
            }
        }

        fs::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Cannot publish object: " + ec.message(), COMPONENT);
        }

        Logger::instance().debug("Stored " + std::to_string(bytes.size()) + " bytes as " + name, COMPONENT);
        return name;
    }

    Result<std::vector<uint8_t>> DirectoryRemoteStore::pull(const std::string& remoteHandle) {
        if (!isValidHandle(remoteHandle)) {
            return Err(Core::ErrorCode::REMOTE_NOT_FOUND, "Malformed handle: " + remoteHandle, COMPONENT);
        }
        auto reachable = checkRoot();
        if (reachable.isError()) {
            return reachable.error();
        }

        fs::path path = objectPath(remoteHandle);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return Err(Core::ErrorCode::REMOTE_NOT_FOUND, "No object " + remoteHandle, COMPONENT);
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Cannot open object " + remoteHandle, COMPONENT);
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, "Read failed for object " + remoteHandle, COMPONENT);
        }
        return bytes;
    }

    VoidResult DirectoryRemoteStore::remove(const std::string& remoteHandle) {
        if (!isValidHandle(remoteHandle)) {
            return Err(Core::ErrorCode::REMOTE_NOT_FOUND, "Malformed handle: " + remoteHandle, COMPONENT);
        }
        auto reachable = checkRoot();
        if (reachable.isError()) {
            return reachable;
        }

        std::error_code ec;
        if (!fs::remove(objectPath(remoteHandle), ec)) {
            if (ec) {
                return Err(Core::ErrorCode::REMOTE_UNAVAILABLE,
                           "Cannot remove " + remoteHandle + ": " + ec.message(), COMPONENT);
            }
            return Err(Core::ErrorCode::REMOTE_NOT_FOUND, "No object " + remoteHandle, COMPONENT);
        }
        return Ok();
    }

} // namespace ChunkVault
