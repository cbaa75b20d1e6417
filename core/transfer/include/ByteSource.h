#pragma once

#include "Result.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace ChunkVault {

    /**
     * @brief Readable upload source of known size.
     *
     * A source is read front to back exactly once. discard() releases any
     * backing resource and may be called more than once.
     */
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        virtual uint64_t size() const = 0;

        /**
         * @brief Read up to length bytes into buffer.
         * @return bytes read; 0 only at end of source
         */
        virtual Result<std::size_t> read(uint8_t* buffer, std::size_t length) = 0;

        virtual void discard() = 0;

        virtual std::string name() const = 0;
    };

    /**
     * @brief Source backed by a file on disk.
     *
     * An owned file (a spooled request body) is deleted by discard(); a
     * borrowed one (a path given on the command line) is only closed.
     */
    class FileByteSource : public ByteSource {
    public:
        static Result<std::unique_ptr<FileByteSource>> open(const std::string& path, bool ownsFile);

        ~FileByteSource() override;

        uint64_t size() const override { return size_; }
        Result<std::size_t> read(uint8_t* buffer, std::size_t length) override;
        void discard() override;
        std::string name() const override { return path_; }

        bool ownsFile() const { return ownsFile_; }

    private:
        FileByteSource(std::string path, uint64_t size, bool ownsFile);

        std::string path_;
        uint64_t size_;
        bool ownsFile_;
        bool discarded_{false};
        std::ifstream stream_;
    };

    class MemoryByteSource : public ByteSource {
    public:
        explicit MemoryByteSource(std::vector<uint8_t> data, std::string name = "memory");

        uint64_t size() const override { return data_.size(); }
        Result<std::size_t> read(uint8_t* buffer, std::size_t length) override;
        void discard() override;
        std::string name() const override { return name_; }

        bool discarded() const { return discarded_; }

    private:
        std::vector<uint8_t> data_;
        std::string name_;
        std::size_t offset_{0};
        bool discarded_{false};
    };

} // namespace ChunkVault
