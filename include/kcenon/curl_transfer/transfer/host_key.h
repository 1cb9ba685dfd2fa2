/**
 * @file host_key.h
 * @brief Host identity keys and the known-hosts decision types
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_HOST_KEY_H
#define KCENON_CURL_TRANSFER_TRANSFER_HOST_KEY_H

#include "kcenon/curl_transfer/core/types.h"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::curl_transfer {

/**
 * @brief Algorithm of a host key
 */
enum class host_key_type {
    unknown,
    rsa1,
    rsa,
    dss,
    ecdsa,
    ed25519
};

[[nodiscard]] constexpr auto to_string(host_key_type type) noexcept -> const char* {
    switch (type) {
        case host_key_type::unknown: return "unknown";
        case host_key_type::rsa1: return "rsa1";
        case host_key_type::rsa: return "ssh-rsa";
        case host_key_type::dss: return "ssh-dss";
        case host_key_type::ecdsa: return "ecdsa";
        case host_key_type::ed25519: return "ssh-ed25519";
        default: return "unknown";
    }
}

/**
 * @brief Result of comparing a presented key with the known-hosts entry
 */
enum class host_key_match {
    match,           ///< Known key present and identical
    mismatch,        ///< Known key present and different
    missing,         ///< Known-hosts file has no entry for the host
    no_known_hosts   ///< No known-hosts file configured for the transfer
};

[[nodiscard]] constexpr auto to_string(host_key_match match) noexcept -> const char* {
    switch (match) {
        case host_key_match::match: return "match";
        case host_key_match::mismatch: return "mismatch";
        case host_key_match::missing: return "missing";
        case host_key_match::no_known_hosts: return "no_known_hosts";
        default: return "unknown";
    }
}

/**
 * @brief Decision returned for a host key check
 */
enum class host_key_disposition {
    accept,              ///< Accept for this connection only
    accept_and_persist,  ///< Accept and append to the known-hosts file
    reject               ///< Reject, the transfer fails
};

[[nodiscard]] constexpr auto to_string(host_key_disposition disposition) noexcept
    -> const char* {
    switch (disposition) {
        case host_key_disposition::accept: return "accept";
        case host_key_disposition::accept_and_persist: return "accept_and_persist";
        case host_key_disposition::reject: return "reject";
        default: return "unknown";
    }
}

/**
 * @brief Policy used when the delegate does not decide
 *
 * Only an exact match is accepted.
 */
[[nodiscard]] constexpr auto default_host_key_disposition(host_key_match match) noexcept
    -> host_key_disposition {
    return match == host_key_match::match ? host_key_disposition::accept
                                          : host_key_disposition::reject;
}

/**
 * @brief A host public key blob
 */
class host_key {
public:
    host_key() = default;
    host_key(std::vector<std::byte> blob, host_key_type type);

    /**
     * @brief Build from the base64 form used in known-hosts files
     * @return The key, or invalid_argument if the text is not valid base64
     */
    [[nodiscard]] static auto from_base64(std::string_view text, host_key_type type)
        -> result<host_key>;

    [[nodiscard]] auto blob() const noexcept -> std::span<const std::byte> { return blob_; }
    [[nodiscard]] auto type() const noexcept -> host_key_type { return type_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return blob_.empty(); }

    [[nodiscard]] auto to_base64() const -> std::string;

    /**
     * @brief OpenSSH style fingerprint, "SHA256:" followed by unpadded base64
     */
    [[nodiscard]] auto sha256_fingerprint() const -> std::string;

    [[nodiscard]] auto operator==(const host_key& other) const -> bool = default;

private:
    std::vector<std::byte> blob_;
    host_key_type type_ = host_key_type::unknown;
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_HOST_KEY_H
