#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bdf::filestream {

constexpr std::size_t kDefaultChunkSize = 65536;  // 64KB chunks

// Forward-only byte source. Read returns fewer than `size` bytes only when
// the source is exhausted; failures throw.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t Read(std::uint8_t* buffer, std::size_t size) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void Write(const std::uint8_t* data, std::size_t size) = 0;
    virtual void Flush() = 0;

    void Write(const std::vector<std::uint8_t>& data) {
        Write(data.data(), data.size());
    }
};

template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileReader : public ByteSource {
public:
    explicit BufferedFileReader(const std::filesystem::path& path)
        : path_(path), input_(path, std::ios::binary) {
        if (!input_) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }
    }

    std::size_t Read(std::uint8_t* buffer, std::size_t size) override {
        std::size_t copied = 0;
        while (copied < size) {
            if (pos_ == filled_ && !Refill()) {
                break;
            }
            std::size_t to_copy = std::min(filled_ - pos_, size - copied);
            std::memcpy(buffer + copied, chunk_.data() + pos_, to_copy);
            pos_ += to_copy;
            copied += to_copy;
        }
        bytes_read_ += copied;
        return copied;
    }

    std::size_t BytesRead() const noexcept { return bytes_read_; }

private:
    bool Refill() {
        if (input_.eof()) {
            return false;
        }
        input_.read(reinterpret_cast<char*>(chunk_.data()), static_cast<std::streamsize>(chunk_.size()));
        if (input_.bad()) {
            throw std::runtime_error("Failed to read file: " + path_.string());
        }
        pos_ = 0;
        filled_ = static_cast<std::size_t>(input_.gcount());
        return filled_ > 0;
    }

    std::filesystem::path path_;
    std::ifstream input_;
    std::array<std::uint8_t, ChunkSize> chunk_;
    std::size_t pos_ = 0;
    std::size_t filled_ = 0;
    std::size_t bytes_read_ = 0;
};

// Buffered data reaches the file only through Flush().
template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileWriter : public ByteSink {
public:
    explicit BufferedFileWriter(const std::filesystem::path& path)
        : path_(path), output_(path, std::ios::binary | std::ios::trunc) {
        if (!output_) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
    }

    using ByteSink::Write;

    void Write(const std::uint8_t* data, std::size_t size) override {
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t available = chunk_.size() - buffer_pos_;
            std::size_t to_copy = std::min(available, size - offset);

            std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
            buffer_pos_ += to_copy;
            offset += to_copy;

            if (buffer_pos_ == chunk_.size()) {
                FlushBuffer();
            }
        }
        bytes_written_ += size;
    }

    void Flush() override {
        FlushBuffer();
        output_.flush();
        if (!output_) {
            throw std::runtime_error("Failed to flush file: " + path_.string());
        }
    }

    std::size_t BytesWritten() const noexcept { return bytes_written_; }

private:
    void FlushBuffer() {
        if (buffer_pos_ == 0) {
            return;
        }
        output_.write(reinterpret_cast<const char*>(chunk_.data()),
                      static_cast<std::streamsize>(buffer_pos_));
        if (!output_) {
            throw std::runtime_error("Failed to write to file: " + path_.string());
        }
        buffer_pos_ = 0;
    }

    std::filesystem::path path_;
    std::ofstream output_;
    std::array<std::uint8_t, ChunkSize> chunk_;
    std::size_t buffer_pos_ = 0;
    std::size_t bytes_written_ = 0;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    std::size_t Read(std::uint8_t* buffer, std::size_t size) override {
        std::size_t to_copy = std::min(size, data_.size() - pos_);
        if (to_copy > 0) {
            std::memcpy(buffer, data_.data() + pos_, to_copy);
            pos_ += to_copy;
        }
        return to_copy;
    }

    std::size_t Remaining() const noexcept { return data_.size() - pos_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t pos_ = 0;
};

class MemorySink : public ByteSink {
public:
    using ByteSink::Write;

    void Write(const std::uint8_t* data, std::size_t size) override {
        data_.insert(data_.end(), data, data + size);
    }

    void Flush() override { ++flush_count_; }

    const std::vector<std::uint8_t>& data() const noexcept { return data_; }
    std::size_t flush_count() const noexcept { return flush_count_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t flush_count_ = 0;
};

}  // namespace bdf::filestream
