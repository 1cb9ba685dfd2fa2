/**
 * @file transfer_delegate.h
 * @brief Callback interface receiving transfer events
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_DELEGATE_H
#define KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_DELEGATE_H

#include "kcenon/curl_transfer/core/transfer_error.h"
#include "kcenon/curl_transfer/transfer/host_key.h"
#include "kcenon/curl_transfer/transfer/transfer_response.h"
#include "kcenon/curl_transfer/transfer/transfer_types.h"

#include <cstddef>
#include <span>
#include <string_view>

namespace kcenon::curl_transfer {

class transfer_handle;

/**
 * @brief Receiver of transfer events
 *
 * All callbacks run on the thread driving the transfer: the scheduler's
 * thread, or the caller's thread under perform_synchronously(). They must
 * not block for long.
 *
 * Order for one handle:
 * - on_response_received for a header section, before body data it precedes
 * - on_data_received / on_will_send_body as bytes flow
 * - exactly one of on_finished or on_failed, last
 *
 * Only on_data_received is mandatory.
 */
class transfer_delegate {
public:
    virtual ~transfer_delegate() = default;

    virtual void on_data_received(transfer_handle& handle, std::span<const std::byte> data) = 0;

    virtual void on_response_received([[maybe_unused]] transfer_handle& handle,
                                      [[maybe_unused]] const transfer_response& response) {}

    virtual void on_finished([[maybe_unused]] transfer_handle& handle) {}

    virtual void on_failed([[maybe_unused]] transfer_handle& handle,
                           [[maybe_unused]] const transfer_error& error) {}

    /**
     * @brief Decide whether a server's host key is trusted
     * @param found Key presented by the server
     * @param known Key recorded in the known-hosts file, nullptr if none
     * @param match Comparison result
     */
    virtual auto on_host_fingerprint([[maybe_unused]] transfer_handle& handle,
                                     [[maybe_unused]] const host_key& found,
                                     [[maybe_unused]] const host_key* known,
                                     host_key_match match) -> host_key_disposition {
        return default_host_key_disposition(match);
    }

    /**
     * @brief Called after each read from the upload source, including the final 0
     */
    virtual void on_will_send_body([[maybe_unused]] transfer_handle& handle,
                                   [[maybe_unused]] std::size_t bytes) {}

    virtual void on_debug_info([[maybe_unused]] transfer_handle& handle,
                               [[maybe_unused]] std::string_view text,
                               [[maybe_unused]] debug_info_type type) {}
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_DELEGATE_H
