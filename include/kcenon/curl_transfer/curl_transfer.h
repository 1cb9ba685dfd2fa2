/**
 * @file curl_transfer.h
 * @brief Main header for the curl_transfer library
 * @version 0.1.0
 *
 * Include this header to access all transfer functionality.
 *
 * @code
 * #include <kcenon/curl_transfer/curl_transfer.h>
 *
 * using namespace kcenon::curl_transfer;
 *
 * class printer : public transfer_delegate {
 * public:
 *     void on_data_received(transfer_handle&, std::span<const std::byte> data) override {
 *         std::fwrite(data.data(), 1, data.size(), stdout);
 *     }
 * };
 *
 * auto sched = scheduler::create();
 * auto handle = transfer_handle::create(transfer_request{"ftp://example.com/readme.txt"},
 *                                       std::make_shared<printer>());
 * if (sched && handle) {
 *     auto started = sched.value()->start(handle.value());
 * }
 * @endcode
 */

#ifndef KCENON_CURL_TRANSFER_CURL_TRANSFER_H
#define KCENON_CURL_TRANSFER_CURL_TRANSFER_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/curl_transfer/core/global_config.h"
#include "kcenon/curl_transfer/core/transfer_error.h"
#include "kcenon/curl_transfer/core/types.h"

// Transfers
#include "kcenon/curl_transfer/transfer/host_key.h"
#include "kcenon/curl_transfer/transfer/scheduler.h"
#include "kcenon/curl_transfer/transfer/transfer_delegate.h"
#include "kcenon/curl_transfer/transfer/transfer_handle.h"
#include "kcenon/curl_transfer/transfer/transfer_request.h"
#include "kcenon/curl_transfer/transfer/transfer_response.h"
#include "kcenon/curl_transfer/transfer/transfer_types.h"
#include "kcenon/curl_transfer/transfer/upload_source.h"

namespace kcenon::curl_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_CURL_TRANSFER_H
