/**
 * @file upload_source.cpp
 * @brief Built-in upload sources
 */

#include "kcenon/curl_transfer/transfer/upload_source.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace kcenon::curl_transfer {

memory_upload_source::memory_upload_source(std::vector<std::byte> data)
    : data_(std::move(data)) {}

auto memory_upload_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = std::min(buffer.size(), data_.size() - offset_);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, count);
        offset_ += count;
    }
    return count;
}

auto memory_upload_source::rewind() -> result<void> {
    offset_ = 0;
    return {};
}

auto memory_upload_source::size() const -> std::optional<uint64_t> {
    return static_cast<uint64_t>(data_.size());
}

stream_upload_source::stream_upload_source(std::unique_ptr<std::istream> stream,
                                           std::optional<uint64_t> size)
    : stream_(std::move(stream)), size_(size) {
    if (stream_) {
        start_ = stream_->tellg();
        seekable_ = start_ != std::streampos(-1);
        if (!seekable_) {
            stream_->clear();
        }
    }
}

auto stream_upload_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!stream_) {
        return unexpected{error{error_code::source_read_failed, "no stream attached"}};
    }
    if (buffer.empty() || stream_->eof()) {
        return std::size_t{0};
    }

    stream_->read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    auto count = stream_->gcount();
    if (stream_->bad()) {
        return unexpected{error{error_code::source_read_failed, "stream read failed"}};
    }
    return static_cast<std::size_t>(count);
}

auto stream_upload_source::can_rewind() const -> bool {
    return stream_ && seekable_;
}

auto stream_upload_source::rewind() -> result<void> {
    if (!can_rewind()) {
        return unexpected{error{error_code::source_not_rewindable}};
    }
    stream_->clear();
    stream_->seekg(start_);
    if (stream_->fail()) {
        return unexpected{error{error_code::source_rewind_failed, "stream seek failed"}};
    }
    return {};
}

auto restart_upload(upload_source* source) -> result<void> {
    if (source == nullptr) {
        return {};
    }
    if (!source->can_rewind()) {
        return unexpected{error{error_code::source_not_rewindable}};
    }
    return source->rewind();
}

}  // namespace kcenon::curl_transfer
