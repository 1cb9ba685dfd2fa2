/**
 * @file poll_loop.h
 * @brief Multi-handle polling loop shared by scheduler and synchronous transfers
 *
 * Internal header.
 */

#ifndef KCENON_CURL_TRANSFER_SRC_TRANSFER_POLL_LOOP_H
#define KCENON_CURL_TRANSFER_SRC_TRANSFER_POLL_LOOP_H

#include "kcenon/curl_transfer/core/transfer_error.h"
#include "kcenon/curl_transfer/core/types.h"
#include "kcenon/curl_transfer/transfer/transfer_handle.h"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace kcenon::curl_transfer::detail {

/**
 * @brief Run curl_global_init once per process
 */
[[nodiscard]] auto ensure_engine_initialized() -> result<void>;

/**
 * @brief Drives a set of transfer handles through one multi handle
 *
 * enqueue(), wakeup() and in_flight() may be called from any thread.
 * run_once() and close() must be called from the single driving thread;
 * every delegate callback happens inside them.
 */
class poll_loop : public std::enable_shared_from_this<poll_loop> {
public:
    [[nodiscard]] static auto create() -> result<std::shared_ptr<poll_loop>>;

    ~poll_loop();

    poll_loop(const poll_loop&) = delete;
    poll_loop& operator=(const poll_loop&) = delete;

    /**
     * @brief Queue a handle for admission on the next iteration
     * @return already_started if the handle was started before,
     *         scheduler_stopped after close()
     */
    [[nodiscard]] auto enqueue(std::shared_ptr<transfer_handle> handle) -> result<void>;

    /**
     * @brief Interrupt a blocking poll
     */
    void wakeup();

    /**
     * @brief One iteration: admit, sweep cancels, perform, drain, sweep, poll
     * @param max_wait Upper bound for the idle wait
     */
    void run_once(std::chrono::milliseconds max_wait);

    /**
     * @brief Refuse new handles and cancel all queued and active ones
     *
     * Every handle still in flight receives its cancelled failure before
     * this returns.
     */
    void close();

    /**
     * @brief Handles started and not yet completed
     */
    [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    poll_loop(CURLM* multi, CURLSH* share);

    void admit_pending();
    void sweep_cancelled();
    void drain_completions();
    void fail_all(const transfer_error& failure);

    void detach(CURL* easy);
    void release_share(CURL* easy);
    void settle(const std::shared_ptr<transfer_handle>& handle);

    CURLM* multi_;
    CURLSH* share_;

    std::mutex pending_mutex_;
    std::deque<std::shared_ptr<transfer_handle>> pending_;
    bool closed_ = false;

    // Driving thread only
    std::unordered_map<CURL*, std::shared_ptr<transfer_handle>> active_;

    std::atomic<std::size_t> in_flight_{0};
};

}  // namespace kcenon::curl_transfer::detail

#endif  // KCENON_CURL_TRANSFER_SRC_TRANSFER_POLL_LOOP_H
