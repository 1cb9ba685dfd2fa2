/**
 * @file poll_loop.cpp
 * @brief Multi-handle polling loop
 */

#include "poll_loop.h"

#include "kcenon/curl_transfer/core/logging.h"

#include <string>
#include <utility>
#include <vector>

namespace kcenon::curl_transfer::detail {

auto ensure_engine_initialized() -> result<void> {
    static const CURLcode init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_code != CURLE_OK) {
        return unexpected{error{error_code::engine_init_failed,
                                std::string("curl_global_init: ") +
                                    curl_easy_strerror(init_code)}};
    }
    return {};
}

auto poll_loop::create() -> result<std::shared_ptr<poll_loop>> {
    if (auto init = ensure_engine_initialized(); !init) {
        return unexpected{init.error()};
    }

    CURLSH* share = curl_share_init();
    if (share == nullptr) {
        return unexpected{error{error_code::shared_state_init_failed, "curl_share_init failed"}};
    }

    for (auto data : {CURL_LOCK_DATA_DNS, CURL_LOCK_DATA_SSL_SESSION}) {
        CURLSHcode code = curl_share_setopt(share, CURLSHOPT_SHARE, data);
        if (code != CURLSHE_OK) {
            auto failure = transfer_error::from_shared_state(code);
            curl_share_cleanup(share);
            return unexpected{error{error_code::shared_state_init_failed, failure.to_string()}};
        }
    }

    CURLM* multi = curl_multi_init();
    if (multi == nullptr) {
        curl_share_cleanup(share);
        return unexpected{error{error_code::scheduler_init_failed, "curl_multi_init failed"}};
    }

    return std::shared_ptr<poll_loop>(new poll_loop(multi, share));
}

poll_loop::poll_loop(CURLM* multi, CURLSH* share) : multi_(multi), share_(share) {}

poll_loop::~poll_loop() {
    close();
    curl_multi_cleanup(multi_);
    curl_share_cleanup(share_);
}

auto poll_loop::enqueue(std::shared_ptr<transfer_handle> handle) -> result<void> {
    if (!handle) {
        return unexpected{error{error_code::invalid_argument, "handle is null"}};
    }

    {
        std::lock_guard lock(pending_mutex_);
        if (closed_) {
            return unexpected{error{error_code::scheduler_stopped}};
        }
        if (!handle->mark_started(weak_from_this())) {
            return unexpected{error{error_code::already_started}};
        }
        pending_.push_back(std::move(handle));
        in_flight_.fetch_add(1, std::memory_order_acq_rel);
    }

    wakeup();
    return {};
}

void poll_loop::wakeup() {
    CURLMcode code = curl_multi_wakeup(multi_);
    if (code != CURLM_OK) {
        CT_LOG_WARN(log_category::scheduler,
                    "wakeup failed: " + transfer_error::from_scheduler(code).to_string());
    }
}

void poll_loop::run_once(std::chrono::milliseconds max_wait) {
    admit_pending();
    sweep_cancelled();

    int running = 0;
    CURLMcode code = curl_multi_perform(multi_, &running);
    if (code != CURLM_OK) {
        fail_all(transfer_error::from_scheduler(code));
        return;
    }

    drain_completions();
    sweep_cancelled();

    {
        std::lock_guard lock(pending_mutex_);
        if (!pending_.empty()) {
            return;
        }
    }

    code = curl_multi_poll(multi_, nullptr, 0, static_cast<int>(max_wait.count()), nullptr);
    if (code != CURLM_OK) {
        fail_all(transfer_error::from_scheduler(code));
    }
}

void poll_loop::close() {
    std::deque<std::shared_ptr<transfer_handle>> queued;
    {
        std::lock_guard lock(pending_mutex_);
        closed_ = true;
        queued.swap(pending_);
    }

    for (auto& handle : queued) {
        handle->cancel();
        handle->complete_with(transfer_error::cancelled());
        settle(handle);
    }

    auto active = std::move(active_);
    active_.clear();
    for (auto& [easy, handle] : active) {
        handle->cancel();
        detach(easy);
        handle->complete_with(transfer_error::cancelled());
        settle(handle);
    }
}

void poll_loop::admit_pending() {
    std::deque<std::shared_ptr<transfer_handle>> admitted;
    {
        std::lock_guard lock(pending_mutex_);
        admitted.swap(pending_);
    }

    for (auto& handle : admitted) {
        if (handle->is_canceling()) {
            // Cancelled before the engine saw it
            handle->complete_with(transfer_error::cancelled());
            settle(handle);
            continue;
        }

        CURL* easy = handle->easy();
        CURLcode attached = curl_easy_setopt(easy, CURLOPT_SHARE, share_);
        if (attached == CURLE_OK) {
            attached = curl_easy_setopt(easy, CURLOPT_PRIVATE, handle.get());
        }
        if (attached != CURLE_OK) {
            handle->complete_with(transfer_error::from_engine(attached));
            settle(handle);
            continue;
        }

        CURLMcode code = curl_multi_add_handle(multi_, easy);
        if (code != CURLM_OK) {
            release_share(easy);
            handle->complete_with(transfer_error::from_scheduler(code));
            settle(handle);
            continue;
        }

        transfer_log_context ctx;
        ctx.handle_id = handle->id();
        ctx.url = handle->url();

        active_.emplace(easy, std::move(handle));

        ctx.active_transfers = active_.size();
        CT_LOG_DEBUG_CTX(log_category::scheduler, "Transfer admitted", ctx);
    }
}

void poll_loop::sweep_cancelled() {
    std::vector<std::shared_ptr<transfer_handle>> cancelled;
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second->is_canceling()) {
            detach(it->first);
            cancelled.push_back(std::move(it->second));
            it = active_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& handle : cancelled) {
        handle->complete_with(transfer_error::cancelled());
        settle(handle);
    }
}

void poll_loop::drain_completions() {
    int remaining = 0;
    while (CURLMsg* message = curl_multi_info_read(multi_, &remaining)) {
        if (message->msg != CURLMSG_DONE) {
            continue;
        }

        // The message is invalidated by curl_multi_remove_handle
        CURL* easy = message->easy_handle;
        CURLcode result = message->data.result;

        auto it = active_.find(easy);
        if (it == active_.end()) {
            continue;
        }
        auto handle = std::move(it->second);
        active_.erase(it);

        detach(easy);
        handle->complete(result);
        settle(handle);
    }
}

void poll_loop::fail_all(const transfer_error& failure) {
    CT_LOG_ERROR(log_category::scheduler, "Scheduler failure: " + failure.to_string());

    auto active = std::move(active_);
    active_.clear();
    for (auto& [easy, handle] : active) {
        detach(easy);
        handle->complete_with(failure);
        settle(handle);
    }
}

void poll_loop::detach(CURL* easy) {
    CURLMcode code = curl_multi_remove_handle(multi_, easy);
    if (code != CURLM_OK) {
        CT_LOG_WARN(log_category::scheduler,
                    "remove failed: " + transfer_error::from_scheduler(code).to_string());
    }
    release_share(easy);
}

void poll_loop::release_share(CURL* easy) {
    CURLcode code = curl_easy_setopt(easy, CURLOPT_SHARE, static_cast<CURLSH*>(nullptr));
    if (code != CURLE_OK) {
        CT_LOG_WARN(log_category::scheduler,
                    "share release failed: " + transfer_error::from_engine(code).to_string());
    }
}

void poll_loop::settle(const std::shared_ptr<transfer_handle>& handle) {
    handle->detach_loop();
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
}

}  // namespace kcenon::curl_transfer::detail
