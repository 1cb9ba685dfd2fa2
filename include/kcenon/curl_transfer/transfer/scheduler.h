/**
 * @file scheduler.h
 * @brief Drives many transfers concurrently on a background thread
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_SCHEDULER_H
#define KCENON_CURL_TRANSFER_TRANSFER_SCHEDULER_H

#include "kcenon/curl_transfer/core/types.h"
#include "kcenon/curl_transfer/transfer/transfer_handle.h"

#include <chrono>
#include <cstddef>
#include <memory>

namespace kcenon::curl_transfer {

/**
 * @brief Scheduler configuration
 */
struct scheduler_config {
    /// Upper bound for one idle wait of the polling thread
    std::chrono::milliseconds poll_interval{1000};
};

/**
 * @brief Owns one polling thread that drives all started handles
 *
 * Delegate callbacks of every handle run on the scheduler's thread.
 *
 * @code
 * auto sched = scheduler::create();
 * if (!sched) {
 *     return;
 * }
 * auto handle = transfer_handle::create(transfer_request{"https://example.com/"}, delegate);
 * if (handle) {
 *     auto started = sched.value()->start(handle.value());
 * }
 * @endcode
 */
class scheduler {
public:
    /**
     * @brief Create a scheduler and start its thread
     * @return The scheduler, or engine / scheduler / shared state init errors
     */
    [[nodiscard]] static auto create(scheduler_config config = {})
        -> result<std::shared_ptr<scheduler>>;

    /**
     * @brief Stops the scheduler (see shutdown())
     */
    ~scheduler();

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    /**
     * @brief Begin driving a handle
     *
     * Thread-safe. A handle already cancelled when it is admitted completes
     * with a cancelled failure without touching the network.
     *
     * @return already_started if the handle was started before,
     *         scheduler_stopped after shutdown()
     */
    [[nodiscard]] auto start(std::shared_ptr<transfer_handle> handle) -> result<void>;

    /**
     * @brief Handles started and not yet completed
     */
    [[nodiscard]] auto active_count() const -> std::size_t;

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Cancel all remaining transfers and join the thread
     *
     * Every transfer still in flight receives its cancelled failure before
     * this returns. From a delegate callback it only stops the thread, and
     * the remaining transfers are cancelled after the callback returns.
     * Idempotent.
     */
    void shutdown();

private:
    scheduler();

    struct impl;
    std::shared_ptr<impl> impl_;
};

/**
 * @brief Drive one handle to completion on the calling thread
 *
 * Delivers the same callbacks in the same order as a scheduler would, on
 * the caller's thread. Another thread may cancel() the handle to make this
 * return early.
 *
 * @return already_started if the handle was started before, or setup errors
 */
[[nodiscard]] auto perform_synchronously(const std::shared_ptr<transfer_handle>& handle)
    -> result<void>;

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_SCHEDULER_H
