/**
 * @file upload_source.h
 * @brief Pull-style producers of upload bodies
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_UPLOAD_SOURCE_H
#define KCENON_CURL_TRANSFER_TRANSFER_UPLOAD_SOURCE_H

#include "kcenon/curl_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::curl_transfer {

/**
 * @brief Supplies the request body while a transfer runs
 *
 * read() is called on the scheduler thread whenever the engine needs more
 * bytes. Returning 0 signals the end of the body. rewind() is requested
 * only when the engine must resend the body from the beginning, for
 * example after an authentication round trip.
 */
class upload_source {
public:
    virtual ~upload_source() = default;

    /**
     * @brief Fill up to buffer.size() bytes
     * @return Number of bytes written, 0 at end of body
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto can_rewind() const -> bool { return false; }

    /**
     * @brief Restart the body from its first byte
     */
    [[nodiscard]] virtual auto rewind() -> result<void> {
        return unexpected{error{error_code::source_not_rewindable}};
    }

    /**
     * @brief Total body size if known in advance
     */
    [[nodiscard]] virtual auto size() const -> std::optional<uint64_t> { return std::nullopt; }
};

/**
 * @brief Upload source over an owned byte buffer
 */
class memory_upload_source : public upload_source {
public:
    explicit memory_upload_source(std::vector<std::byte> data);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto can_rewind() const -> bool override { return true; }
    [[nodiscard]] auto rewind() -> result<void> override;
    [[nodiscard]] auto size() const -> std::optional<uint64_t> override;

private:
    std::vector<std::byte> data_;
    std::size_t offset_ = 0;
};

/**
 * @brief Upload source over a std::istream
 *
 * Rewindable when the stream supports seeking. The stream is owned by the
 * source.
 */
class stream_upload_source : public upload_source {
public:
    explicit stream_upload_source(std::unique_ptr<std::istream> stream,
                                  std::optional<uint64_t> size = std::nullopt);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto can_rewind() const -> bool override;
    [[nodiscard]] auto rewind() -> result<void> override;
    [[nodiscard]] auto size() const -> std::optional<uint64_t> override { return size_; }

private:
    std::unique_ptr<std::istream> stream_;
    std::optional<uint64_t> size_;
    std::streampos start_;
    bool seekable_ = false;
};

/**
 * @brief Restart a body so the engine can send it again
 *
 * A null source stands for an empty body and always succeeds.
 *
 * @return source_not_rewindable when the source cannot restart, or the
 *         error returned by rewind()
 */
[[nodiscard]] auto restart_upload(upload_source* source) -> result<void>;

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_UPLOAD_SOURCE_H
