#pragma once

#include "peerdrop/transfer/transfer_types.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

namespace peerdrop::transfer {

// The file an uploader serves. Reads are positional so one source can back
// several sessions on the same io_context.
class FileSource {
public:
    virtual ~FileSource() = default;
    
    virtual const FileInfo& info() const = 0;
    
    // Reads up to max_bytes starting at offset. `data` comes back shorter
    // than max_bytes only at end of file.
    virtual TransferResult read(std::uint64_t offset, std::size_t max_bytes,
                                std::vector<std::uint8_t>& data) = 0;
};

class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::vector<std::uint8_t> content,
                     std::string mime_type = DEFAULT_MIME_TYPE);
    
    const FileInfo& info() const override { return info_; }
    TransferResult read(std::uint64_t offset, std::size_t max_bytes,
                        std::vector<std::uint8_t>& data) override;

private:
    FileInfo info_;
    std::vector<std::uint8_t> content_;
};

class DiskFileSource : public FileSource {
public:
    explicit DiskFileSource(std::filesystem::path path);
    
    // Must succeed before the source is handed to a session.
    TransferResult open();
    bool is_open() const { return stream_.is_open(); }
    
    const FileInfo& info() const override { return info_; }
    TransferResult read(std::uint64_t offset, std::size_t max_bytes,
                        std::vector<std::uint8_t>& data) override;
    
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    FileInfo info_;
    std::ifstream stream_;
};

}
