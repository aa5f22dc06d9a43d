#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "../utils/error_handler.hpp"

// An abstract destination for exported text
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    virtual void Write(std::string_view data) = 0;

    // flush everything; further writes are a logic error
    virtual void Close() = 0;

    // uncompressed bytes passed to Write
    [[nodiscard]] virtual uint64_t BytesWritten() const = 0;

    // bytes that ended up in the destination, equals BytesWritten for uncompressed sinks
    [[nodiscard]] virtual uint64_t BytesOnDisk() const = 0;
};

class StringSink final : public IOutputSink {
public:
    void Write(std::string_view data) override {
        if (closed_) {
            ErrorHandler::HandleLogicError("StringSink: write after close");
            return;
        }
        buffer_.append(data);
    }

    void Close() override { closed_ = true; }

    [[nodiscard]] uint64_t BytesWritten() const override { return buffer_.size(); }
    [[nodiscard]] uint64_t BytesOnDisk() const override { return buffer_.size(); }

    [[nodiscard]] const std::string &str() const { return buffer_; }

private:
    std::string buffer_;
    bool closed_ = false;
};

class FileSink final : public IOutputSink {
public:
    explicit FileSink(const std::filesystem::path &file_path)
        : file_path_(file_path), out_(file_path, std::ios::binary) {
        if (!out_) {
            ErrorHandler::HandleIOError("Cannot open output file " + file_path.string());
        }
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void Write(std::string_view data) override {
        if (closed_) {
            ErrorHandler::HandleLogicError("FileSink: write after close of " + file_path_.string());
            return;
        }
        out_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!out_) {
            ErrorHandler::HandleIOError("Write failed on " + file_path_.string());
            return;
        }
        bytes_written_ += data.size();
    }

    void Close() override {
        if (closed_) return;
        closed_ = true;
        out_.close();
        if (out_.fail()) {
            ErrorHandler::HandleIOError("Closing " + file_path_.string() + " failed");
        }
    }

    [[nodiscard]] uint64_t BytesWritten() const override { return bytes_written_; }
    [[nodiscard]] uint64_t BytesOnDisk() const override { return bytes_written_; }

private:
    const std::filesystem::path file_path_;
    std::ofstream out_;
    uint64_t bytes_written_ = 0;
    bool closed_ = false;
};
