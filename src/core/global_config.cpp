/**
 * @file global_config.cpp
 * @brief Process-wide proxy settings
 */

#include "kcenon/curl_transfer/core/global_config.h"

namespace kcenon::curl_transfer {

auto global_config::instance() -> global_config& {
    static global_config config;
    return config;
}

void global_config::set_proxy_user_password(const std::string& user_password) {
    std::lock_guard lock(mutex_);
    if (user_password.empty()) {
        proxy_.user_password.reset();
    } else {
        proxy_.user_password = user_password;
    }
}

void global_config::set_allows_proxy(bool allows) {
    std::lock_guard lock(mutex_);
    proxy_.allows_proxy = allows;
}

auto global_config::proxy() const -> proxy_settings {
    std::lock_guard lock(mutex_);
    return proxy_;
}

void global_config::reset() {
    std::lock_guard lock(mutex_);
    proxy_ = proxy_settings{};
}

}  // namespace kcenon::curl_transfer
