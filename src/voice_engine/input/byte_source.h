/**
 * @file byte_source.h
 * @brief Byte readers backing an `Input`.
 */
#ifndef VOICELINK_BYTE_SOURCE_H
#define VOICELINK_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @class ByteSource
 * @brief A readable, optionally seekable stream of bytes.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Reads up to `len` bytes.
     * @return Bytes read; 0 at end of stream.
     */
    virtual std::size_t read(uint8_t* buffer, std::size_t len) = 0;

    virtual bool is_seekable() const = 0;

    /** @brief Moves to an absolute offset. */
    virtual bool seek(uint64_t offset) = 0;

    virtual uint64_t position() const = 0;

    /** @brief Fills `len` bytes unless the stream ends first. */
    std::size_t read_full(uint8_t* buffer, std::size_t len);
};

/**
 * @class MemoryByteSource
 * @brief Reads from shared immutable bytes; many readers may share one buffer.
 */
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::shared_ptr<const std::vector<uint8_t>> data, uint64_t offset = 0);

    std::size_t read(uint8_t* buffer, std::size_t len) override;
    bool is_seekable() const override { return true; }
    bool seek(uint64_t offset) override;
    uint64_t position() const override { return position_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
    uint64_t position_;
};

/**
 * @class FileByteSource
 * @brief Reads a file from disk.
 */
class FileByteSource : public ByteSource {
public:
    /** @throws std::runtime_error if the file cannot be opened. */
    explicit FileByteSource(const std::string& path);

    std::size_t read(uint8_t* buffer, std::size_t len) override;
    bool is_seekable() const override { return true; }
    bool seek(uint64_t offset) override;
    uint64_t position() const override { return position_; }

private:
    std::ifstream file_;
    std::string path_;
    uint64_t position_ = 0;
};

/**
 * @class StreamByteSource
 * @brief Forward-only bytes pulled from a callback, such as a child process pipe.
 * @details The callback returns 0 at end of stream. Never seekable.
 */
class StreamByteSource : public ByteSource {
public:
    using ReadFn = std::function<std::size_t(uint8_t*, std::size_t)>;

    explicit StreamByteSource(ReadFn read_fn);

    std::size_t read(uint8_t* buffer, std::size_t len) override;
    bool is_seekable() const override { return false; }
    bool seek(uint64_t) override { return false; }
    uint64_t position() const override { return position_; }

private:
    ReadFn read_fn_;
    uint64_t position_ = 0;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_BYTE_SOURCE_H
