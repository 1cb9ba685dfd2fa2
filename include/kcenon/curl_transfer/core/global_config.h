/**
 * @file global_config.h
 * @brief Process-wide proxy settings consulted when a handle is created
 */

#ifndef KCENON_CURL_TRANSFER_CORE_GLOBAL_CONFIG_H
#define KCENON_CURL_TRANSFER_CORE_GLOBAL_CONFIG_H

#include <mutex>
#include <optional>
#include <string>

namespace kcenon::curl_transfer {

/**
 * @brief Snapshot of the global proxy configuration
 */
struct proxy_settings {
    bool allows_proxy = true;
    std::optional<std::string> user_password;  ///< "user:password" for the proxy
};

/**
 * @brief Process-wide configuration
 *
 * Handles copy the settings at construction time; changing them later does
 * not affect handles that already exist.
 *
 * @note Thread-safe.
 */
class global_config {
public:
    [[nodiscard]] static auto instance() -> global_config&;

    /**
     * @brief Set "user:password" credentials sent to proxies
     * @param user_password Credentials, or an empty string to clear them
     */
    void set_proxy_user_password(const std::string& user_password);

    /**
     * @brief Allow or forbid proxies
     *
     * When false, handles ignore proxy environment variables.
     */
    void set_allows_proxy(bool allows);

    [[nodiscard]] auto proxy() const -> proxy_settings;

    /**
     * @brief Restore defaults (proxies allowed, no credentials)
     */
    void reset();

private:
    global_config() = default;

    mutable std::mutex mutex_;
    proxy_settings proxy_;
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_CORE_GLOBAL_CONFIG_H
