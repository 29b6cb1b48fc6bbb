#include "byte_source.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace voicelink {
namespace voice {

std::size_t ByteSource::read_full(uint8_t* buffer, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        const std::size_t n = read(buffer + total, len - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

MemoryByteSource::MemoryByteSource(std::shared_ptr<const std::vector<uint8_t>> data, uint64_t offset)
    : data_(std::move(data)), position_(0) {
    if (!data_) {
        data_ = std::make_shared<const std::vector<uint8_t>>();
    }
    position_ = std::min<uint64_t>(offset, data_->size());
}

std::size_t MemoryByteSource::read(uint8_t* buffer, std::size_t len) {
    const uint64_t remaining = data_->size() - position_;
    const std::size_t n = static_cast<std::size_t>(std::min<uint64_t>(remaining, len));
    if (n > 0) {
        std::memcpy(buffer, data_->data() + position_, n);
        position_ += n;
    }
    return n;
}

bool MemoryByteSource::seek(uint64_t offset) {
    if (offset > data_->size()) {
        return false;
    }
    position_ = offset;
    return true;
}

FileByteSource::FileByteSource(const std::string& path)
    : file_(path, std::ios::binary), path_(path) {
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open audio file: " + path);
    }
}

std::size_t FileByteSource::read(uint8_t* buffer, std::size_t len) {
    file_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
    const std::streamsize n = file_.gcount();
    if (n <= 0) {
        return 0;
    }
    position_ += static_cast<uint64_t>(n);
    return static_cast<std::size_t>(n);
}

bool FileByteSource::seek(uint64_t offset) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_) {
        file_.clear();
        return false;
    }
    position_ = offset;
    return true;
}

StreamByteSource::StreamByteSource(ReadFn read_fn) : read_fn_(std::move(read_fn)) {}

std::size_t StreamByteSource::read(uint8_t* buffer, std::size_t len) {
    if (!read_fn_) {
        return 0;
    }
    const std::size_t n = read_fn_(buffer, len);
    position_ += n;
    return n;
}

} // namespace voice
} // namespace voicelink
