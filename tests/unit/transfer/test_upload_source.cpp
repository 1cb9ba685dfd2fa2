/**
 * @file test_upload_source.cpp
 * @brief Unit tests for upload sources and body restarts
 */

#include <gtest/gtest.h>

#include <kcenon/curl_transfer/core/transfer_error.h>
#include <kcenon/curl_transfer/transfer/upload_source.h>

#include <algorithm>
#include <array>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::curl_transfer::test {

namespace {

auto bytes_of(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

auto as_string(std::span<const std::byte> data) -> std::string {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

/**
 * @brief Source that produces a fixed text once and cannot restart
 */
class one_shot_source : public upload_source {
public:
    explicit one_shot_source(std::string text) : text_(std::move(text)) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto count = std::min(buffer.size(), text_.size() - offset_);
        for (std::size_t i = 0; i < count; ++i) {
            buffer[i] = static_cast<std::byte>(text_[offset_ + i]);
        }
        offset_ += count;
        return count;
    }

private:
    std::string text_;
    std::size_t offset_ = 0;
};

}  // namespace

// =============================================================================
// memory_upload_source
// =============================================================================

TEST(MemoryUploadSourceTest, ReadsInChunksUntilEnd) {
    memory_upload_source source(bytes_of("hello world"));
    std::array<std::byte, 5> buffer{};

    auto first = source.read(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 5u);
    EXPECT_EQ(as_string(std::span<const std::byte>(buffer.data(), 5)), "hello");

    auto second = source.read(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(as_string(std::span<const std::byte>(buffer.data(), second.value())), " worl");

    auto third = source.read(buffer);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third.value(), 1u);

    auto end = source.read(buffer);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end.value(), 0u);
}

TEST(MemoryUploadSourceTest, ReportsSizeAndRewinds) {
    memory_upload_source source(bytes_of("abc"));
    EXPECT_EQ(source.size(), 3u);
    EXPECT_TRUE(source.can_rewind());

    std::array<std::byte, 8> buffer{};
    ASSERT_EQ(source.read(buffer).value(), 3u);
    ASSERT_EQ(source.read(buffer).value(), 0u);

    ASSERT_TRUE(source.rewind().has_value());
    EXPECT_EQ(source.read(buffer).value(), 3u);
}

TEST(MemoryUploadSourceTest, EmptyBody) {
    memory_upload_source source(std::vector<std::byte>{});
    std::array<std::byte, 4> buffer{};

    EXPECT_EQ(source.size(), 0u);
    EXPECT_EQ(source.read(buffer).value(), 0u);
}

// =============================================================================
// stream_upload_source
// =============================================================================

TEST(StreamUploadSourceTest, ReadsStringStream) {
    stream_upload_source source(std::make_unique<std::istringstream>("streamed body"), 13);
    std::array<std::byte, 64> buffer{};

    EXPECT_EQ(source.size(), 13u);

    auto read = source.read(buffer);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(as_string(std::span<const std::byte>(buffer.data(), read.value())),
              "streamed body");

    auto end = source.read(buffer);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end.value(), 0u);
}

TEST(StreamUploadSourceTest, SeekableStreamRewinds) {
    auto stream = std::make_unique<std::istringstream>("0123456789");
    stream->seekg(4);
    stream_upload_source source(std::move(stream));
    std::array<std::byte, 3> buffer{};

    ASSERT_TRUE(source.can_rewind());
    ASSERT_EQ(source.read(buffer).value(), 3u);
    EXPECT_EQ(as_string(buffer), "456");

    ASSERT_TRUE(source.rewind().has_value());
    ASSERT_EQ(source.read(buffer).value(), 3u);
    EXPECT_EQ(as_string(buffer), "456");
}

TEST(StreamUploadSourceTest, UnknownSizeByDefault) {
    stream_upload_source source(std::make_unique<std::istringstream>("x"));
    EXPECT_FALSE(source.size().has_value());
}

TEST(StreamUploadSourceTest, MissingStreamFailsToRead) {
    stream_upload_source source(nullptr);
    std::array<std::byte, 4> buffer{};

    auto read = source.read(buffer);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, error_code::source_read_failed);
    EXPECT_FALSE(source.can_rewind());
}

// =============================================================================
// restart_upload
// =============================================================================

TEST(RestartUploadTest, NullSourceAlwaysSucceeds) {
    EXPECT_TRUE(restart_upload(nullptr).has_value());
}

TEST(RestartUploadTest, RewindableSourceStartsOver) {
    memory_upload_source source(bytes_of("again"));
    std::array<std::byte, 16> buffer{};
    ASSERT_EQ(source.read(buffer).value(), 5u);

    ASSERT_TRUE(restart_upload(&source).has_value());
    EXPECT_EQ(source.read(buffer).value(), 5u);
}

TEST(RestartUploadTest, NonRewindableSourceFails) {
    one_shot_source source("once");
    std::array<std::byte, 16> buffer{};
    ASSERT_EQ(source.read(buffer).value(), 4u);

    auto restarted = restart_upload(&source);
    ASSERT_FALSE(restarted.has_value());
    EXPECT_EQ(restarted.error().code, error_code::source_not_rewindable);

    // Surfaced to the delegate as a usage failure, not an engine one
    auto failure = transfer_error::usage(restarted.error().message);
    EXPECT_EQ(failure.kind(), error_kind::usage);
    EXPECT_EQ(failure.message(), "upload source cannot rewind");
}

}  // namespace kcenon::curl_transfer::test
