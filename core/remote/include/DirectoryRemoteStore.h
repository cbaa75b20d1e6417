#pragma once

#include "IRemoteStore.h"
#include <filesystem>

namespace ChunkVault {

    /**
     * @brief Object store rooted at a local (or mounted) directory.
     *
     * Objects are named by a random 128-bit hex handle and sharded by the
     * handle's first two characters: <root>/ab/ab12...
     * Writes land under a temporary name and are renamed into place, so a
     * handle is never visible before its bytes are complete.
     */
    class DirectoryRemoteStore : public IRemoteStore {
    public:
        static constexpr std::size_t HANDLE_BYTES = 16;

        explicit DirectoryRemoteStore(std::filesystem::path root);

        Result<std::string> push(const std::vector<uint8_t>& bytes) override;
        Result<std::vector<uint8_t>> pull(const std::string& remoteHandle) override;
        VoidResult remove(const std::string& remoteHandle) override;

        std::string getName() const override { return "DirectoryRemoteStore"; }

        /**
         * @brief Factory that builds a fresh client for root on every call.
         */
        static RemoteStoreFactory factory(std::string root);

        /**
         * @brief True for a 32 character lowercase hex handle.
         */
        static bool isValidHandle(const std::string& remoteHandle);

    private:
        std::filesystem::path root_;

        std::filesystem::path objectPath(const std::string& remoteHandle) const;
        VoidResult checkRoot() const;
    };

} // namespace ChunkVault
