/**
 * @file host_key.cpp
 * @brief Host key encoding and fingerprints
 */

#include "kcenon/curl_transfer/transfer/host_key.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <utility>

namespace kcenon::curl_transfer {

namespace {

auto encode_base64(const unsigned char* data, std::size_t size) -> std::string {
    if (size == 0) {
        return {};
    }
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(size));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

}  // namespace

host_key::host_key(std::vector<std::byte> blob, host_key_type type)
    : blob_(std::move(blob)), type_(type) {}

auto host_key::from_base64(std::string_view text, host_key_type type) -> result<host_key> {
    std::string input(text);
    input.erase(std::remove_if(input.begin(), input.end(),
                               [](char c) { return c == '\n' || c == '\r' || c == ' '; }),
                input.end());
    if (input.empty() || input.size() % 4 != 0) {
        return unexpected{error{error_code::invalid_argument, "host key is not valid base64"}};
    }

    std::vector<std::byte> decoded(input.size() / 4 * 3);
    int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                 reinterpret_cast<const unsigned char*>(input.data()),
                                 static_cast<int>(input.size()));
    if (length < 0) {
        return unexpected{error{error_code::invalid_argument, "host key is not valid base64"}};
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    auto padding = static_cast<std::size_t>(std::count(input.end() - 2, input.end(), '='));
    decoded.resize(static_cast<std::size_t>(length) - padding);
    return host_key(std::move(decoded), type);
}

auto host_key::to_base64() const -> std::string {
    return encode_base64(reinterpret_cast<const unsigned char*>(blob_.data()), blob_.size());
}

auto host_key::sha256_fingerprint() const -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_size = 0;
    if (EVP_Digest(blob_.data(), blob_.size(), digest.data(), &digest_size, EVP_sha256(),
                   nullptr) != 1) {
        return {};
    }

    std::string encoded = encode_base64(digest.data(), digest_size);
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return "SHA256:" + encoded;
}

}  // namespace kcenon::curl_transfer
