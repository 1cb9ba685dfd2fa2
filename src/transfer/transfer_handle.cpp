/**
 * @file transfer_handle.cpp
 * @brief Transfer handle state machine and engine callbacks
 */

#include "kcenon/curl_transfer/transfer/transfer_handle.h"

#include "kcenon/curl_transfer/config/feature_flags.h"
#include "kcenon/curl_transfer/core/global_config.h"
#include "kcenon/curl_transfer/core/logging.h"

#include "poll_loop.h"
#include "request_options.h"

#include <cstdio>
#include <exception>
#include <span>
#include <string_view>
#include <utility>

namespace kcenon::curl_transfer {

namespace {

std::atomic<uint64_t> next_handle_id{1};

auto current_response_code(CURL* easy) -> long {
    long code = 0;
    if (curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) {
        return 0;
    }
    return code;
}

auto to_host_key_type(int type) -> host_key_type {
    switch (type) {
        case CURLKHTYPE_RSA1: return host_key_type::rsa1;
        case CURLKHTYPE_RSA: return host_key_type::rsa;
        case CURLKHTYPE_DSS: return host_key_type::dss;
        case CURLKHTYPE_ECDSA: return host_key_type::ecdsa;
        case CURLKHTYPE_ED25519: return host_key_type::ed25519;
        default: return host_key_type::unknown;
    }
}

auto to_host_key_match(curl_khmatch match) -> host_key_match {
    switch (match) {
        case CURLKHMATCH_OK: return host_key_match::match;
        case CURLKHMATCH_MISMATCH: return host_key_match::mismatch;
        default: return host_key_match::missing;
    }
}

auto to_debug_info_type(curl_infotype type) -> std::optional<debug_info_type> {
    switch (type) {
        case CURLINFO_TEXT: return debug_info_type::text;
        case CURLINFO_HEADER_IN: return debug_info_type::header_in;
        case CURLINFO_HEADER_OUT: return debug_info_type::header_out;
        case CURLINFO_DATA_IN: return debug_info_type::data_in;
        case CURLINFO_DATA_OUT: return debug_info_type::data_out;
        case CURLINFO_SSL_DATA_IN: return debug_info_type::ssl_data_in;
        case CURLINFO_SSL_DATA_OUT: return debug_info_type::ssl_data_out;
        default: return std::nullopt;
    }
}

// libcurl passes either base64 text (len == 0) or the raw blob
auto to_host_key(const curl_khkey& key) -> std::optional<host_key> {
    auto type = to_host_key_type(key.keytype);
    if (key.key == nullptr) {
        return std::nullopt;
    }
    if (key.len == 0) {
        auto decoded = host_key::from_base64(key.key, type);
        if (!decoded) {
            return std::nullopt;
        }
        return decoded.value();
    }
    const auto* first = reinterpret_cast<const std::byte*>(key.key);
    return host_key(std::vector<std::byte>(first, first + key.len), type);
}

}  // namespace

namespace detail {

/**
 * @brief C callbacks installed on the easy handle
 *
 * Every entry point is noexcept. A delegate exception is logged and turned
 * into an abort code, so the transfer fails with the engine's error.
 */
struct handle_callbacks {
    static auto on_header(char* buffer, std::size_t size, std::size_t count, void* user) noexcept
        -> std::size_t {
        auto* self = static_cast<transfer_handle*>(user);
        const std::size_t length = size * count;
        if (self->is_canceling()) {
            return 0;
        }

        try {
            std::string_view line(buffer, length);
            if (line == "\r\n" || line == "\n") {
                self->flush_header_section(current_response_code(self->easy_));
            } else {
                self->header_lines_.emplace_back(line);
            }
        } catch (const std::exception& e) {
            report_exception(*self, "header", e);
            return 0;
        }
        return length;
    }

    static auto on_write(char* buffer, std::size_t size, std::size_t count, void* user) noexcept
        -> std::size_t {
        auto* self = static_cast<transfer_handle*>(user);
        const std::size_t length = size * count;
        if (self->is_canceling()) {
            return 0;
        }

        try {
            // A section without a blank-line terminator ends at the first body byte
            self->flush_header_section(current_response_code(self->easy_));
            if (self->is_canceling()) {
                return 0;
            }

            self->bytes_received_ += length;
            self->delegate_->on_data_received(
                *self, std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer), length));
        } catch (const std::exception& e) {
            report_exception(*self, "data", e);
            return 0;
        }
        return self->is_canceling() ? 0 : length;
    }

    static auto on_read(char* buffer, std::size_t size, std::size_t count, void* user) noexcept
        -> std::size_t {
        auto* self = static_cast<transfer_handle*>(user);
        if (self->is_canceling()) {
            return CURL_READFUNC_ABORT;
        }

        try {
            std::size_t produced = 0;
            if (self->source_) {
                auto read = self->source_->read(
                    std::span<std::byte>(reinterpret_cast<std::byte*>(buffer), size * count));
                if (!read) {
                    self->record_usage_error("upload source failed: " + read.error().message);
                    return CURL_READFUNC_ABORT;
                }
                produced = read.value();
            }

            self->bytes_sent_ += produced;
            self->delegate_->on_will_send_body(*self, produced);
            if (self->is_canceling()) {
                return CURL_READFUNC_ABORT;
            }
            return produced;
        } catch (const std::exception& e) {
            report_exception(*self, "upload", e);
            return CURL_READFUNC_ABORT;
        }
    }

    static auto on_seek(void* user, curl_off_t offset, int origin) noexcept -> int {
        auto* self = static_cast<transfer_handle*>(user);
        if (origin != SEEK_SET || offset != 0) {
            // Lets the engine skip forward by reading instead
            return CURL_SEEKFUNC_CANTSEEK;
        }

        try {
            auto restarted = restart_upload(self->source_.get());
            if (!restarted) {
                self->record_usage_error("upload body cannot be resent: " +
                                         restarted.error().message);
                return CURL_SEEKFUNC_FAIL;
            }
            CT_LOG_DEBUG(log_category::upload,
                         "Upload body rewound for handle " + std::to_string(self->id_));
        } catch (const std::exception& e) {
            report_exception(*self, "rewind", e);
            return CURL_SEEKFUNC_FAIL;
        }
        return CURL_SEEKFUNC_OK;
    }

    static auto on_debug(CURL*, curl_infotype type, char* data, std::size_t size, void* user) noexcept
        -> int {
        auto* self = static_cast<transfer_handle*>(user);
        auto info_type = to_debug_info_type(type);
        if (!info_type || !self->delegate_) {
            return 0;
        }

        try {
            self->delegate_->on_debug_info(*self, std::string_view(data, size), *info_type);
        } catch (const std::exception& e) {
            report_exception(*self, "debug", e);
        }
        return 0;
    }

    static auto on_known_host_key(CURL*,
                                  const curl_khkey* known,
                                  const curl_khkey* found,
                                  curl_khmatch match,
                                  void* user) noexcept -> int {
        auto* self = static_cast<transfer_handle*>(user);
        try {
            std::optional<host_key> found_key = found ? to_host_key(*found) : std::nullopt;
            std::optional<host_key> known_key = known ? to_host_key(*known) : std::nullopt;
            if (!found_key) {
                CT_LOG_WARN(log_category::host_key, "Server presented an unreadable host key");
                return CURLKHSTAT_REJECT;
            }

            auto disposition = decide_host_key(*self, *found_key,
                                               known_key ? &*known_key : nullptr,
                                               to_host_key_match(match));
            switch (disposition) {
                case host_key_disposition::accept: return CURLKHSTAT_FINE;
                case host_key_disposition::accept_and_persist: return CURLKHSTAT_FINE_ADD_TO_FILE;
                case host_key_disposition::reject: return CURLKHSTAT_REJECT;
            }
        } catch (const std::exception& e) {
            report_exception(*self, "host key", e);
        }
        return CURLKHSTAT_REJECT;
    }

    static auto on_unverified_host_key(void* user, int type, const char* key, std::size_t length) noexcept
        -> int {
        auto* self = static_cast<transfer_handle*>(user);
        try {
            const auto* first = reinterpret_cast<const std::byte*>(key);
            host_key found(std::vector<std::byte>(first, first + length), to_host_key_type(type));

            auto disposition = decide_host_key(*self, found, nullptr, host_key_match::no_known_hosts);
            if (disposition == host_key_disposition::accept_and_persist) {
                CT_LOG_WARN(log_category::host_key,
                            "No known_hosts file configured, host key accepted without saving");
            }
            return disposition == host_key_disposition::reject ? CURLKHMATCH_MISMATCH
                                                               : CURLKHMATCH_OK;
        } catch (const std::exception& e) {
            report_exception(*self, "host key", e);
        }
        return CURLKHMATCH_MISMATCH;
    }

private:
    static auto decide_host_key(transfer_handle& self,
                                const host_key& found,
                                const host_key* known,
                                host_key_match match) -> host_key_disposition {
        auto disposition = self.delegate_
                               ? self.delegate_->on_host_fingerprint(self, found, known, match)
                               : default_host_key_disposition(match);

        transfer_log_context ctx;
        ctx.handle_id = self.id_;
        ctx.url = self.url_;
        CT_LOG_INFO_CTX(log_category::host_key,
                        std::string("Host key ") + to_string(found.type()) + " " +
                            found.sha256_fingerprint() + " " + to_string(match) + " -> " +
                            to_string(disposition),
                        ctx);
        return disposition;
    }

    static void report_exception(const transfer_handle& self,
                                 const char* stage,
                                 const std::exception& e) {
        transfer_log_context ctx;
        ctx.handle_id = self.id_;
        ctx.url = self.url_;
        CT_LOG_ERROR_CTX(log_category::handle,
                         std::string("Delegate threw during ") + stage + " callback: " + e.what(),
                         ctx);
    }
};

}  // namespace detail

auto transfer_handle::create(transfer_request request,
                             std::shared_ptr<transfer_delegate> delegate,
                             std::optional<credential> user)
    -> result<std::shared_ptr<transfer_handle>> {
    if (!delegate) {
        return unexpected{curl_transfer::error{error_code::missing_delegate}};
    }
    if (request.url.empty()) {
        return unexpected{curl_transfer::error{error_code::invalid_url, "url is empty"}};
    }
    if (auto init = detail::ensure_engine_initialized(); !init) {
        return unexpected{init.error()};
    }

    auto handle = std::shared_ptr<transfer_handle>(
        new transfer_handle(request.url, std::move(delegate), std::move(user)));
    if (handle->easy_ == nullptr) {
        return unexpected{
            curl_transfer::error{error_code::engine_init_failed, "curl_easy_init failed"}};
    }

    if (auto configured = handle->configure(request); !configured) {
        return unexpected{configured.error()};
    }
    return handle;
}

transfer_handle::transfer_handle(std::string url,
                                 std::shared_ptr<transfer_delegate> delegate,
                                 std::optional<credential> user)
    : easy_(curl_easy_init()),
      url_(std::move(url)),
      user_(std::move(user)),
      id_(next_handle_id.fetch_add(1, std::memory_order_relaxed)),
      delegate_(std::move(delegate)) {}

transfer_handle::~transfer_handle() {
    if (easy_ != nullptr) {
        curl_easy_cleanup(easy_);
    }
    // The easy handle may reference these until it is cleaned up
    for (auto* list : aux_lists_) {
        curl_slist_free_all(list);
    }
}

auto transfer_handle::configure(transfer_request& request) -> result<void> {
    // The request must still own its body here: it decides the upload mode
    auto mode = detail::select_body_mode(request);
    std::optional<uint64_t> body_size;
    if (request.body_source) {
        body_size = request.body_source->size();
    } else if (mode != detail::body_mode::none) {
        body_size = request.body.size();
    }

    auto applied = detail::apply_request_options(easy_, request, body_size, user_,
                                                 global_config::instance().proxy(), aux_lists_);
    if (!applied) {
        return applied;
    }

    if (request.body_source) {
        source_ = std::move(request.body_source);
    } else if (!request.body.empty()) {
        source_ = std::make_unique<memory_upload_source>(std::move(request.body));
    }

    verbose_ = request.options.verbose;
    known_hosts_path_ = request.options.known_hosts_path;

    using callbacks = detail::handle_callbacks;
    detail::option_writer writer(easy_);
    writer.set(CURLOPT_ERRORBUFFER, error_buffer_.data(), "CURLOPT_ERRORBUFFER");
    writer.set(CURLOPT_HEADERFUNCTION, static_cast<curl_write_callback>(&callbacks::on_header),
               "CURLOPT_HEADERFUNCTION");
    writer.set(CURLOPT_HEADERDATA, static_cast<void*>(this), "CURLOPT_HEADERDATA");
    writer.set(CURLOPT_WRITEFUNCTION, static_cast<curl_write_callback>(&callbacks::on_write),
               "CURLOPT_WRITEFUNCTION");
    writer.set(CURLOPT_WRITEDATA, static_cast<void*>(this), "CURLOPT_WRITEDATA");

    if (mode != detail::body_mode::none) {
        writer.set(CURLOPT_READFUNCTION, static_cast<curl_read_callback>(&callbacks::on_read),
                   "CURLOPT_READFUNCTION");
        writer.set(CURLOPT_READDATA, static_cast<void*>(this), "CURLOPT_READDATA");
        writer.set(CURLOPT_SEEKFUNCTION, static_cast<curl_seek_callback>(&callbacks::on_seek),
                   "CURLOPT_SEEKFUNCTION");
        writer.set(CURLOPT_SEEKDATA, static_cast<void*>(this), "CURLOPT_SEEKDATA");
    }

    if (verbose_) {
        writer.set(CURLOPT_DEBUGFUNCTION, static_cast<curl_debug_callback>(&callbacks::on_debug),
                   "CURLOPT_DEBUGFUNCTION");
        writer.set(CURLOPT_DEBUGDATA, static_cast<void*>(this), "CURLOPT_DEBUGDATA");
    }

    if (detail::uses_ssh_host_key(url_)) {
        if (known_hosts_path_) {
            writer.set(CURLOPT_SSH_KEYFUNCTION,
                       static_cast<curl_sshkeycallback>(&callbacks::on_known_host_key),
                       "CURLOPT_SSH_KEYFUNCTION");
            writer.set(CURLOPT_SSH_KEYDATA, static_cast<void*>(this), "CURLOPT_SSH_KEYDATA");
        } else {
#if CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION
            writer.set(CURLOPT_SSH_HOSTKEYFUNCTION,
                       static_cast<curl_sshhostkeycallback>(&callbacks::on_unverified_host_key),
                       "CURLOPT_SSH_HOSTKEYFUNCTION");
            writer.set(CURLOPT_SSH_HOSTKEYDATA, static_cast<void*>(this),
                       "CURLOPT_SSH_HOSTKEYDATA");
#else
            // libcurl would accept any server key
            return unexpected{curl_transfer::error{
                error_code::invalid_argument,
                "SSH transfers need options.known_hosts_path with this libcurl"}};
#endif
        }
    }

    return writer.finish();
}

void transfer_handle::cancel() {
    auto expected = handle_state::running;
    if (!state_.compare_exchange_strong(expected, handle_state::canceling,
                                        std::memory_order_acq_rel)) {
        return;
    }

    CT_LOG_DEBUG(log_category::handle, "Cancel requested for handle " + std::to_string(id_));

    std::shared_ptr<detail::poll_loop> loop;
    {
        std::lock_guard lock(loop_mutex_);
        loop = loop_.lock();
    }
    if (loop) {
        loop->wakeup();
    }
}

auto transfer_handle::mark_started(std::weak_ptr<detail::poll_loop> loop) -> bool {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    std::lock_guard lock(loop_mutex_);
    loop_ = std::move(loop);
    started_at_ = std::chrono::steady_clock::now();
    return true;
}

void transfer_handle::detach_loop() {
    std::lock_guard lock(loop_mutex_);
    loop_.reset();
}

void transfer_handle::complete(CURLcode code) {
    const long status = current_response_code(easy_);

    if (is_canceling()) {
        finish(transfer_error::cancelled());
        return;
    }
    if (pending_error_) {
        finish(std::move(pending_error_));
        return;
    }
    if (code != CURLE_OK) {
        finish(transfer_error::from_engine(code, std::string_view(error_buffer_.data())));
        return;
    }

    // Sections never terminated by a blank line, e.g. FTP replies
    try {
        flush_header_section(status);
    } catch (const std::exception& e) {
        transfer_log_context ctx;
        ctx.handle_id = id_;
        ctx.url = url_;
        CT_LOG_ERROR_CTX(log_category::handle,
                         std::string("Delegate threw during header callback: ") + e.what(), ctx);
        finish(transfer_error::from_engine(CURLE_WRITE_ERROR));
        return;
    }
    if (is_canceling()) {
        finish(transfer_error::cancelled());
        return;
    }
    finish(std::nullopt);
}

void transfer_handle::complete_with(transfer_error failure) {
    if (is_canceling() && !failure.is_cancelled()) {
        finish(transfer_error::cancelled());
        return;
    }
    finish(std::move(failure));
}

void transfer_handle::finish(std::optional<transfer_error> failure) {
    if (state() == handle_state::completed) {
        return;
    }

    const long status = current_response_code(easy_);
    response_code_.store(status, std::memory_order_release);

    char* entry_path = nullptr;
    if (curl_easy_getinfo(easy_, CURLINFO_FTP_ENTRY_PATH, &entry_path) == CURLE_OK &&
        entry_path != nullptr) {
        initial_ftp_path_ = entry_path;
    }

    if (failure) {
        if (status != 0) {
            failure->with_response_code(status);
        }
        failure->with_failing_url(url_);
    }
    error_ = std::move(failure);
    header_lines_.clear();

    state_.store(handle_state::completed, std::memory_order_release);

    transfer_log_context ctx;
    ctx.handle_id = id_;
    ctx.url = url_;
    ctx.bytes_received = bytes_received_;
    ctx.bytes_sent = bytes_sent_;
    if (status != 0) {
        ctx.response_code = status;
    }
    if (started_.load(std::memory_order_acquire)) {
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_at_)
                .count());
    }

    auto delegate = std::move(delegate_);
    try {
        if (error_) {
            ctx.native_code = error_->native_code();
            ctx.error_domain = to_string(error_->domain());
            ctx.error_message = error_->message();
            if (error_->is_cancelled()) {
                CT_LOG_INFO_CTX(log_category::handle, "Transfer cancelled", ctx);
            } else {
                CT_LOG_WARN_CTX(log_category::handle, "Transfer failed", ctx);
            }
            delegate->on_failed(*this, *error_);
        } else {
            CT_LOG_INFO_CTX(log_category::handle, "Transfer finished", ctx);
            delegate->on_finished(*this);
        }
    } catch (const std::exception& e) {
        CT_LOG_ERROR_CTX(log_category::handle,
                         std::string("Delegate threw from terminal callback: ") + e.what(), ctx);
    }

    source_.reset();
}

void transfer_handle::flush_header_section(long fallback_status) {
    if (header_lines_.empty()) {
        return;
    }

    auto response = response_builder::build(url_, header_lines_, fallback_status);
    header_lines_.clear();
    if (response.status_code() != 0) {
        response_code_.store(response.status_code(), std::memory_order_release);
    }

    transfer_log_context ctx;
    ctx.handle_id = id_;
    ctx.url = url_;
    ctx.response_code = response.status_code();
    CT_LOG_DEBUG_CTX(log_category::handle, "Response received", ctx);

    if (delegate_) {
        delegate_->on_response_received(*this, response);
    }
}

void transfer_handle::record_usage_error(std::string message) {
    CT_LOG_WARN(log_category::upload, message);
    if (!pending_error_) {
        pending_error_ = transfer_error::usage(std::move(message));
    }
}

auto engine_version() -> std::string {
    return curl_version();
}

}  // namespace kcenon::curl_transfer
