/**
 * @file transfer_handle.h
 * @brief A single transfer and its lifecycle
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_HANDLE_H
#define KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_HANDLE_H

#include "kcenon/curl_transfer/core/transfer_error.h"
#include "kcenon/curl_transfer/core/types.h"
#include "kcenon/curl_transfer/transfer/transfer_delegate.h"
#include "kcenon/curl_transfer/transfer/transfer_request.h"
#include "kcenon/curl_transfer/transfer/transfer_types.h"
#include "kcenon/curl_transfer/transfer/upload_source.h"

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::curl_transfer {

namespace detail {
class poll_loop;
struct handle_callbacks;
}  // namespace detail

/**
 * @brief One transfer, from creation to its terminal notification
 *
 * A handle is created from a transfer_request and then driven by a
 * scheduler (or perform_synchronously()). It reports through its delegate:
 * every header section as a transfer_response, body bytes as they arrive,
 * upload progress, and exactly one of on_finished / on_failed.
 *
 * A handle can be started once. The error, response code and FTP entry
 * path are meaningful after state() returns handle_state::completed.
 *
 * @code
 * auto handle = transfer_handle::create(transfer_request{"file:///etc/hosts"}, delegate);
 * if (handle) {
 *     sched->start(handle.value());
 * }
 * @endcode
 */
class transfer_handle : public std::enable_shared_from_this<transfer_handle> {
public:
    /**
     * @brief Create a handle
     * @param request Request to translate into engine options
     * @param delegate Event receiver, required
     * @param user Credential sent to the server, if any
     * @return The handle, or missing_delegate / invalid_url / engine_* errors.
     *         invalid_argument for SFTP/SCP without a known_hosts file when
     *         CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION is 0.
     */
    [[nodiscard]] static auto create(transfer_request request,
                                     std::shared_ptr<transfer_delegate> delegate,
                                     std::optional<credential> user = std::nullopt)
        -> result<std::shared_ptr<transfer_handle>>;

    ~transfer_handle();

    transfer_handle(const transfer_handle&) = delete;
    transfer_handle& operator=(const transfer_handle&) = delete;
    transfer_handle(transfer_handle&&) = delete;
    transfer_handle& operator=(transfer_handle&&) = delete;

    /**
     * @brief Request cancellation
     *
     * Moves running to canceling and wakes the driving loop. Has no effect
     * in any other state. Callable from any thread, including from inside a
     * delegate callback. The delegate then receives on_failed with a
     * cancelled error.
     */
    void cancel();

    [[nodiscard]] auto state() const noexcept -> handle_state {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto is_completed() const noexcept -> bool {
        return state() == handle_state::completed;
    }

    /**
     * @brief Failure that completed the handle, empty on success or while running
     */
    [[nodiscard]] auto error() const -> const std::optional<transfer_error>& { return error_; }

    [[nodiscard]] auto url() const -> const std::string& { return url_; }

    /**
     * @brief Process-unique identifier, used in log entries
     */
    [[nodiscard]] auto id() const noexcept -> uint64_t { return id_; }

    /**
     * @brief Last response code reported by the engine, 0 if none
     */
    [[nodiscard]] auto response_code() const noexcept -> long {
        return response_code_.load(std::memory_order_acquire);
    }

    /**
     * @brief Directory the FTP server placed the session in at login
     *
     * Empty before completion and for non-FTP transfers.
     */
    [[nodiscard]] auto initial_ftp_path() const -> const std::string& {
        return initial_ftp_path_;
    }

    [[nodiscard]] auto has_credential() const noexcept -> bool { return user_.has_value(); }

private:
    friend class detail::poll_loop;
    friend struct detail::handle_callbacks;

    transfer_handle(std::string url,
                    std::shared_ptr<transfer_delegate> delegate,
                    std::optional<credential> user);

    [[nodiscard]] auto configure(transfer_request& request) -> result<void>;

    [[nodiscard]] auto easy() const noexcept -> CURL* { return easy_; }

    /**
     * @brief Claim the handle for a loop; false if it was started before
     */
    [[nodiscard]] auto mark_started(std::weak_ptr<detail::poll_loop> loop) -> bool;

    void detach_loop();

    [[nodiscard]] auto is_canceling() const noexcept -> bool {
        return state() == handle_state::canceling;
    }

    /**
     * @brief Terminal transition after the engine reported a result
     */
    void complete(CURLcode code);

    /**
     * @brief Terminal transition with an error that did not come from the engine
     */
    void complete_with(transfer_error failure);

    void finish(std::optional<transfer_error> failure);

    void flush_header_section(long fallback_status);

    void record_usage_error(std::string message);

    CURL* easy_ = nullptr;
    std::string url_;
    std::optional<credential> user_;
    uint64_t id_;

    std::atomic<handle_state> state_{handle_state::running};
    std::atomic<bool> started_{false};
    std::atomic<long> response_code_{0};

    std::mutex loop_mutex_;
    std::weak_ptr<detail::poll_loop> loop_;

    // Touched only by the driving thread
    std::shared_ptr<transfer_delegate> delegate_;
    std::unique_ptr<upload_source> source_;
    std::vector<curl_slist*> aux_lists_;
    std::vector<std::string> header_lines_;
    std::array<char, CURL_ERROR_SIZE> error_buffer_{};
    std::optional<transfer_error> pending_error_;
    std::optional<transfer_error> error_;
    std::string initial_ftp_path_;
    std::optional<std::string> known_hosts_path_;
    bool verbose_ = false;
    uint64_t bytes_received_ = 0;
    uint64_t bytes_sent_ = 0;
    std::chrono::steady_clock::time_point started_at_;
};

/**
 * @brief Version string of the underlying protocol engine
 */
[[nodiscard]] auto engine_version() -> std::string;

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_HANDLE_H
