/**
 * @file test_cancellation.cpp
 * @brief Integration tests for cancellation and scheduler lifecycle
 */

#include "test_fixtures.h"

#include <algorithm>
#include <stdexcept>

namespace kcenon::curl_transfer::test {

class CancellationTest : public SchedulerFixture {
protected:
    auto slow_server() -> loopback_http_server& {
        server_ = std::make_unique<loopback_http_server>(loopback_http_server::trickle(20ms));
        EXPECT_TRUE(server_->start());
        return *server_;
    }

    void TearDown() override {
        SchedulerFixture::TearDown();
        if (server_) {
            server_->stop();
        }
    }

    std::unique_ptr<loopback_http_server> server_;
};

// =============================================================================
// Cancel
// =============================================================================

TEST_F(CancellationTest, CancelBeforeStartFailsOnceWithoutData) {
    auto path = create_text_file("unused.txt", "never delivered");
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = transfer_handle::create(transfer_request{file_url(path)}, delegate);
    ASSERT_TRUE(handle.has_value());
    handle.value()->cancel();
    ASSERT_TRUE(scheduler_->start(handle.value()).has_value());

    ASSERT_TRUE(delegate->wait_done());
    ASSERT_TRUE(wait_idle());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_TRUE(failure->is_cancelled());
    EXPECT_EQ(failure->domain(), error_domain::transfer);
    EXPECT_TRUE(delegate->data().empty());
    EXPECT_TRUE(delegate->responses().empty());
    EXPECT_EQ(delegate->terminal_count(), 1);
    EXPECT_TRUE(handle.value()->is_completed());
}

TEST_F(CancellationTest, CancelInsideDataCallbackStopsDelivery) {
    auto& server = slow_server();
    auto delegate = std::make_shared<recording_delegate>();
    delegate->data_hook = [](transfer_handle& handle, std::span<const std::byte>) {
        handle.cancel();
    };

    transfer_request request(server.url("/stream"));
    request.options.buffer_size = 1024;
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_TRUE(failure->is_cancelled());

    auto events = delegate->events();
    EXPECT_EQ(std::count(events.begin(), events.end(), "data"), 1);
    EXPECT_EQ(events.back(), "failed");
    EXPECT_EQ(delegate->terminal_count(), 1);
}

TEST_F(CancellationTest, CancelFromAnotherThread) {
    auto& server = slow_server();
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/stream")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_for_data(1));

    handle->cancel();
    ASSERT_TRUE(delegate->wait_done(2s));

    ASSERT_TRUE(delegate->failure().has_value());
    EXPECT_TRUE(delegate->failure()->is_cancelled());
    EXPECT_EQ(handle->state(), handle_state::completed);
    ASSERT_TRUE(handle->error().has_value());
    EXPECT_TRUE(handle->error()->is_cancelled());
    // The status line arrived before the cancel
    EXPECT_EQ(handle->error()->response_code(), 200);
}

TEST_F(CancellationTest, CancelAfterCompletionIsNoOp) {
    auto path = create_text_file("done.txt", "done");
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{file_url(path)}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());
    ASSERT_TRUE(wait_idle());

    handle->cancel();
    EXPECT_EQ(handle->state(), handle_state::completed);
    EXPECT_FALSE(handle->error().has_value());
    EXPECT_EQ(delegate->terminal_count(), 1);
}

TEST_F(CancellationTest, ThrowingDelegateAbortsTransfer) {
    auto& server = slow_server();
    auto delegate = std::make_shared<recording_delegate>();
    delegate->data_hook = [](transfer_handle&, std::span<const std::byte>) {
        throw std::runtime_error("consumer failed");
    };

    auto handle = start(transfer_request{server.url("/stream")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->domain(), error_domain::engine);
    EXPECT_EQ(failure->native_code(), static_cast<int>(CURLE_WRITE_ERROR));
}

// =============================================================================
// Scheduler lifecycle
// =============================================================================

TEST_F(CancellationTest, ShutdownCancelsInFlightTransfers) {
    auto& server = slow_server();
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/stream")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_for_data(1));

    scheduler_->shutdown();

    // Delivered before shutdown() returned
    EXPECT_EQ(delegate->terminal_count(), 1);
    ASSERT_TRUE(delegate->failure().has_value());
    EXPECT_TRUE(delegate->failure()->is_cancelled());
    EXPECT_TRUE(handle->is_completed());
    EXPECT_FALSE(scheduler_->is_running());
    EXPECT_EQ(scheduler_->active_count(), 0u);
}

TEST_F(CancellationTest, ShutdownIsIdempotent) {
    scheduler_->shutdown();
    scheduler_->shutdown();
    EXPECT_FALSE(scheduler_->is_running());
}

TEST_F(CancellationTest, StartAfterShutdownIsRejected) {
    auto path = create_text_file("late.txt", "late");
    auto delegate = std::make_shared<recording_delegate>();
    scheduler_->shutdown();

    auto handle = transfer_handle::create(transfer_request{file_url(path)}, delegate);
    ASSERT_TRUE(handle.has_value());

    auto started = scheduler_->start(handle.value());
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::scheduler_stopped);
    EXPECT_EQ(delegate->terminal_count(), 0);
    EXPECT_EQ(handle.value()->state(), handle_state::running);
}

TEST_F(CancellationTest, StartTwiceIsRejected) {
    auto path = create_text_file("twice.txt", "twice");
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = transfer_handle::create(transfer_request{file_url(path)}, delegate);
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(scheduler_->start(handle.value()).has_value());

    auto again = scheduler_->start(handle.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::already_started);

    ASSERT_TRUE(delegate->wait_done());
    EXPECT_EQ(delegate->terminal_count(), 1);
}

TEST_F(CancellationTest, NullHandleIsRejected) {
    auto started = scheduler_->start(nullptr);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::invalid_argument);
}

}  // namespace kcenon::curl_transfer::test
