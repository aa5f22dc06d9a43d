#pragma once

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <lz4frame.h>

#include "output_sink.hpp"

// input is handed to LZ4F_compressUpdate in pieces of at most this size
constexpr size_t LZ4_SINK_CHUNK_SIZE = 64 * 1024;

// Writes a standard LZ4 frame (.lz4) that the lz4 command line tool can read
class LZ4FrameSink final : public IOutputSink {
public:
    explicit LZ4FrameSink(const std::filesystem::path &file_path)
        : file_path_(file_path), out_(file_path, std::ios::binary) {
        if (!out_) {
            ErrorHandler::HandleIOError("Cannot open output file " + file_path.string());
            return;
        }

        std::memset(&preferences_, 0, sizeof(preferences_));
        preferences_.frameInfo.blockSizeID = LZ4F_max64KB;
        preferences_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;

        const LZ4F_errorCode_t ctx_error = LZ4F_createCompressionContext(&context_, LZ4F_VERSION);
        if (LZ4F_isError(ctx_error)) {
            context_ = nullptr;
            ErrorHandler::HandleRuntimeError(std::string("LZ4F_createCompressionContext failed: ") +
                                             LZ4F_getErrorName(ctx_error));
            return;
        }

        // the bound of one chunk also covers the frame header and a final flush
        compression_buffer_.resize(std::max<size_t>(LZ4F_compressBound(LZ4_SINK_CHUNK_SIZE, &preferences_),
                                                    LZ4F_HEADER_SIZE_MAX));

        const size_t header_size = LZ4F_compressBegin(context_, compression_buffer_.data(),
                                                      compression_buffer_.size(), &preferences_);
        if (CheckLZ4Result(header_size, "LZ4F_compressBegin")) {
            FlushBuffer(header_size);
        }
    }

    ~LZ4FrameSink() override {
        if (context_ != nullptr) {
            LZ4F_freeCompressionContext(context_);
        }
    }

    LZ4FrameSink(const LZ4FrameSink &) = delete;
    LZ4FrameSink &operator=(const LZ4FrameSink &) = delete;

    void Write(std::string_view data) override {
        if (closed_) {
            ErrorHandler::HandleLogicError("LZ4FrameSink: write after close of " + file_path_.string());
            return;
        }
        if (context_ == nullptr) {
            ErrorHandler::HandleRuntimeError("LZ4FrameSink: no compression context for " + file_path_.string());
            return;
        }

        while (!data.empty()) {
            const size_t chunk_size = std::min(data.size(), LZ4_SINK_CHUNK_SIZE);
            const size_t compressed_size = LZ4F_compressUpdate(context_,
                                                               compression_buffer_.data(), compression_buffer_.size(),
                                                               data.data(), chunk_size, nullptr);
            if (!CheckLZ4Result(compressed_size, "LZ4F_compressUpdate")) {
                return;
            }
            FlushBuffer(compressed_size);
            bytes_written_ += chunk_size;
            data.remove_prefix(chunk_size);
        }
    }

    void Close() override {
        if (closed_) return;
        closed_ = true;

        if (context_ != nullptr) {
            const size_t end_size = LZ4F_compressEnd(context_, compression_buffer_.data(),
                                                     compression_buffer_.size(), nullptr);
            if (CheckLZ4Result(end_size, "LZ4F_compressEnd")) {
                FlushBuffer(end_size);
            }
        }

        out_.close();
        if (out_.fail()) {
            ErrorHandler::HandleIOError("Closing " + file_path_.string() + " failed");
        }
    }

    [[nodiscard]] uint64_t BytesWritten() const override { return bytes_written_; }
    [[nodiscard]] uint64_t BytesOnDisk() const override { return bytes_on_disk_; }

private:
    bool CheckLZ4Result(const size_t result, const char *operation) {
        if (LZ4F_isError(result)) {
            ErrorHandler::HandleRuntimeError(std::string(operation) + " failed for " + file_path_.string() + ": " +
                                             LZ4F_getErrorName(result));
            return false;
        }
        return true;
    }

    void FlushBuffer(const size_t n_bytes) {
        if (n_bytes == 0) return;
        out_.write(compression_buffer_.data(), static_cast<std::streamsize>(n_bytes));
        if (!out_) {
            ErrorHandler::HandleIOError("Write failed on " + file_path_.string());
            return;
        }
        bytes_on_disk_ += n_bytes;
    }

    const std::filesystem::path file_path_;
    std::ofstream out_;
    LZ4F_preferences_t preferences_{};
    LZ4F_cctx *context_ = nullptr;
    std::vector<char> compression_buffer_;

    uint64_t bytes_written_ = 0;
    uint64_t bytes_on_disk_ = 0;
    bool closed_ = false;
};
