#include "peerdrop/transfer/file_source.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>

namespace peerdrop::transfer {

MemoryFileSource::MemoryFileSource(std::string name, std::vector<std::uint8_t> content,
                                   std::string mime_type)
    : content_(std::move(content)) {
    info_.name = std::move(name);
    info_.size = content_.size();
    info_.mime_type = std::move(mime_type);
}

TransferResult MemoryFileSource::read(std::uint64_t offset, std::size_t max_bytes,
                                      std::vector<std::uint8_t>& data) {
    if (offset > content_.size()) {
        return TransferResult(TransferError::INVALID_ARGUMENT,
                              "Read offset " + std::to_string(offset) + " beyond end of file");
    }
    
    auto count = std::min<std::uint64_t>(max_bytes, content_.size() - offset);
    data.assign(content_.begin() + offset, content_.begin() + offset + count);
    return TransferResult(TransferError::SUCCESS);
}

DiskFileSource::DiskFileSource(std::filesystem::path path)
    : path_(std::move(path)) {
}

TransferResult DiskFileSource::open() {
    if (!core::utils::FileUtils::is_file(path_)) {
        return TransferResult(TransferError::FILE_ERROR, "Not a regular file: " + path_.string());
    }
    
    auto size = core::utils::FileUtils::file_size(path_);
    if (!size) {
        return TransferResult(TransferError::FILE_ERROR, "Cannot determine size of " + path_.string());
    }
    
    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        return TransferResult(TransferError::FILE_ERROR, "Cannot open " + path_.string());
    }
    
    info_.name = path_.filename().string();
    info_.size = *size;
    info_.mime_type = core::utils::FileUtils::guess_mime_type(path_);
    
    LOG_INFO("Opened {} ({}, {})", info_.name,
             core::utils::StringUtils::format_bytes(info_.size), info_.mime_type);
    return TransferResult(TransferError::SUCCESS);
}

TransferResult DiskFileSource::read(std::uint64_t offset, std::size_t max_bytes,
                                    std::vector<std::uint8_t>& data) {
    if (!stream_.is_open()) {
        return TransferResult(TransferError::FILE_ERROR, "File is not open");
    }
    if (offset > info_.size) {
        return TransferResult(TransferError::INVALID_ARGUMENT,
                              "Read offset " + std::to_string(offset) + " beyond end of file");
    }
    
    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(max_bytes, info_.size - offset));
    data.resize(count);
    if (count == 0) {
        return TransferResult(TransferError::SUCCESS);
    }
    
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    stream_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    
    if (stream_.gcount() != static_cast<std::streamsize>(count)) {
        data.clear();
        return TransferResult(TransferError::FILE_ERROR,
                              "Short read from " + path_.string() + " at offset " + std::to_string(offset));
    }
    
    return TransferResult(TransferError::SUCCESS);
}

}
