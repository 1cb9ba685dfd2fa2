/**
 * @file scheduler.cpp
 * @brief Background polling thread and the synchronous entry point
 */

#include "kcenon/curl_transfer/transfer/scheduler.h"

#include "kcenon/curl_transfer/core/logging.h"

#include "poll_loop.h"

#include <atomic>
#include <mutex>
#include <thread>

namespace kcenon::curl_transfer {

struct scheduler::impl {
    scheduler_config config;
    std::shared_ptr<detail::poll_loop> loop;
    std::thread worker;
    std::atomic<bool> stop_requested{false};
    std::mutex shutdown_mutex;

    void run() {
        CT_LOG_DEBUG(log_category::scheduler, "Scheduler thread started");
        while (!stop_requested.load(std::memory_order_acquire)) {
            loop->run_once(config.poll_interval);
        }
        loop->close();
        CT_LOG_DEBUG(log_category::scheduler, "Scheduler thread stopped");
    }
};

scheduler::scheduler() : impl_(std::make_shared<impl>()) {}

scheduler::~scheduler() {
    shutdown();
}

auto scheduler::create(scheduler_config config) -> result<std::shared_ptr<scheduler>> {
    get_logger().initialize();

    auto loop = detail::poll_loop::create();
    if (!loop) {
        CT_LOG_ERROR(log_category::scheduler,
                     "Failed to create scheduler: " + loop.error().message);
        return unexpected{loop.error()};
    }

    auto sched = std::shared_ptr<scheduler>(new scheduler());
    sched->impl_->config = config;
    sched->impl_->loop = std::move(loop.value());
    // The thread shares the state so a scheduler released from a callback outlives its loop
    sched->impl_->worker = std::thread([state = sched->impl_] { state->run(); });

    CT_LOG_INFO(log_category::scheduler, "Scheduler created");
    return sched;
}

auto scheduler::start(std::shared_ptr<transfer_handle> handle) -> result<void> {
    if (impl_->stop_requested.load(std::memory_order_acquire)) {
        return unexpected{error{error_code::scheduler_stopped}};
    }
    return impl_->loop->enqueue(std::move(handle));
}

auto scheduler::active_count() const -> std::size_t {
    return impl_->loop->in_flight();
}

auto scheduler::is_running() const -> bool {
    return !impl_->stop_requested.load(std::memory_order_acquire);
}

void scheduler::shutdown() {
    std::lock_guard lock(impl_->shutdown_mutex);
    if (!impl_->worker.joinable()) {
        return;
    }

    impl_->stop_requested.store(true, std::memory_order_release);
    impl_->loop->wakeup();
    if (impl_->worker.get_id() == std::this_thread::get_id()) {
        // Called from a delegate; the loop stops once the callback returns
        impl_->worker.detach();
        CT_LOG_INFO(log_category::scheduler, "Scheduler stopping from its own thread");
        return;
    }
    impl_->worker.join();

    CT_LOG_INFO(log_category::scheduler, "Scheduler shut down");
}

auto perform_synchronously(const std::shared_ptr<transfer_handle>& handle) -> result<void> {
    if (!handle) {
        return unexpected{error{error_code::invalid_argument, "handle is null"}};
    }

    auto loop = detail::poll_loop::create();
    if (!loop) {
        return unexpected{loop.error()};
    }

    auto& driver = loop.value();
    if (auto queued = driver->enqueue(handle); !queued) {
        return queued;
    }

    while (!handle->is_completed()) {
        driver->run_once(std::chrono::milliseconds(100));
    }
    return {};
}

}  // namespace kcenon::curl_transfer
