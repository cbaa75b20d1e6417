#include "ByteSource.h"
#include "Logger.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <memory>

namespace ChunkVault {

    namespace fs = std::filesystem;

    Result<std::unique_ptr<FileByteSource>> FileByteSource::open(const std::string& path, bool ownsFile) {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "Cannot stat " + path + ": " + ec.message(), "ByteSource");
        }

        std::unique_ptr<FileByteSource> source(new FileByteSource(path, static_cast<uint64_t>(size), ownsFile));
        if (!source->stream_.is_open()) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "Cannot open " + path, "ByteSource");
        }
        return source;
    }

    FileByteSource::FileByteSource(std::string path, uint64_t size, bool ownsFile)
        : path_(std::move(path)), size_(size), ownsFile_(ownsFile),
          stream_(path_, std::ios::binary) {}

    FileByteSource::~FileByteSource() {
        discard();
    }

    Result<std::size_t> FileByteSource::read(uint8_t* buffer, std::size_t length) {
        if (discarded_) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "Source already discarded: " + path_, "ByteSource");
        }
        stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
        if (stream_.bad()) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "Read failed: " + path_, "ByteSource");
        }
        return static_cast<std::size_t>(stream_.gcount());
    }

    void FileByteSource::discard() {
        if (discarded_) {
            return;
        }
        discarded_ = true;
        stream_.close();
        if (ownsFile_) {
            std::error_code ec;
            if (!fs::remove(path_, ec) && ec) {
                Logger::instance().warn("Could not remove temporary upload " + path_ + ": " + ec.message(),
                                        "ByteSource");
            }
        }
    }

    MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data, std::string name)
        : data_(std::move(data)), name_(std::move(name)) {}

    Result<std::size_t> MemoryByteSource::read(uint8_t* buffer, std::size_t length) {
        if (discarded_) {
            return Err(Core::ErrorCode::SOURCE_READ_ERROR, "Source already discarded: " + name_, "ByteSource");
        }
        std::size_t count = std::min(length, data_.size() - offset_);
        if (count > 0) {
            std::memcpy(buffer, data_.data() + offset_, count);
            offset_ += count;
        }
        return count;
    }

    void MemoryByteSource::discard() {
        discarded_ = true;
    }

} // namespace ChunkVault
