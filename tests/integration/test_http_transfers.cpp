/**
 * @file test_http_transfers.cpp
 * @brief Integration tests against a loopback HTTP server
 */

#include "test_fixtures.h"

#include <algorithm>

namespace kcenon::curl_transfer::test {

class HttpTransferTest : public SchedulerFixture {
protected:
    auto serve(loopback_http_server::responder respond) -> loopback_http_server& {
        server_ = std::make_unique<loopback_http_server>(std::move(respond));
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
// Responses
// =============================================================================

TEST_F(HttpTransferTest, ResponseArrivesBeforeBody) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 5\r\n"
        "X-Server: loopback\r\n"
        "Connection: close\r\n"
        "\r\n"
        "hello"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/greeting")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished());
    EXPECT_EQ(delegate->data(), "hello");

    auto responses = delegate->responses();
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status_code(), 200);
    EXPECT_EQ(responses[0].header("content-type"), "text/plain");
    EXPECT_EQ(responses[0].header("X-Server"), "loopback");
    EXPECT_EQ(responses[0].content_length(), 5);
    EXPECT_EQ(responses[0].url(), server.url("/greeting"));

    auto events = delegate->events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front(), "response");
    EXPECT_EQ(events.back(), "finished");
    EXPECT_EQ(handle->response_code(), 200);
}

TEST_F(HttpTransferTest, ErrorStatusStillFinishes) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Length: 9\r\n"
        "Connection: close\r\n"
        "\r\n"
        "not found"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/missing")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    EXPECT_TRUE(delegate->finished());
    EXPECT_FALSE(delegate->failure().has_value());
    EXPECT_EQ(delegate->data(), "not found");
    ASSERT_EQ(delegate->responses().size(), 1u);
    EXPECT_EQ(delegate->responses()[0].status_code(), 404);
    EXPECT_EQ(handle->response_code(), 404);
}

TEST_F(HttpTransferTest, InterimAndFinalResponsesAreSeparate) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 100 Continue\r\n"
        "\r\n"
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 2\r\n"
        "Connection: close\r\n"
        "\r\n"
        "ok"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/continue")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished());
    auto responses = delegate->responses();
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].status_code(), 100);
    EXPECT_TRUE(responses[0].is_interim());
    EXPECT_EQ(responses[1].status_code(), 200);
    EXPECT_EQ(delegate->data(), "ok");
}

TEST_F(HttpTransferTest, RepeatedHeadersAreFolded) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\n"
        "Set-Cookie: a=1\r\n"
        "Set-Cookie: b=2\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/cookies")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_EQ(delegate->responses().size(), 1u);
    EXPECT_EQ(delegate->responses()[0].header("set-cookie"), "a=1, b=2");
}

TEST_F(HttpTransferTest, HeadRequestSkipsBody) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 1234\r\n"
        "Connection: close\r\n"
        "\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/resource"));
    request.method = "HEAD";
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished());
    EXPECT_TRUE(delegate->data().empty());
    ASSERT_EQ(delegate->responses().size(), 1u);
    EXPECT_EQ(delegate->responses()[0].content_length(), 1234);
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].method, "HEAD");
}

// =============================================================================
// Requests
// =============================================================================

TEST_F(HttpTransferTest, PostBodyAndHeadersReachServer) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 201 Created\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/items"));
    request.method = "POST";
    request.set_body("name=widget");
    request.add_header("Content-Type", "application/x-www-form-urlencoded");
    request.add_header("X-Trace", "abc123");
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished());
    ASSERT_EQ(server.requests().size(), 1u);
    auto received = server.requests()[0];
    EXPECT_EQ(received.method, "POST");
    EXPECT_EQ(received.target, "/items");
    EXPECT_EQ(received.body, "name=widget");
    EXPECT_EQ(received.header("X-Trace"), "abc123");
    EXPECT_EQ(received.header("Content-Type"), "application/x-www-form-urlencoded");

    auto sent = delegate->sent();
    ASSERT_FALSE(sent.empty());
    std::size_t total = 0;
    for (auto bytes : sent) {
        total += bytes;
    }
    EXPECT_EQ(total, 11u);
}

TEST_F(HttpTransferTest, PutUploadsBody) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 204 No Content\r\nConnection: close\r\n\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/file.txt"));
    request.method = "PUT";
    request.set_body("replacement");
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished());
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].method, "PUT");
    EXPECT_EQ(server.requests()[0].body, "replacement");
    EXPECT_EQ(handle->response_code(), 204);
}

TEST_F(HttpTransferTest, CustomMethodIsSent) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/items/7"));
    request.method = "DELETE";
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].method, "DELETE");
}

TEST_F(HttpTransferTest, CredentialsAreSent) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = transfer_handle::create(transfer_request{server.url("/private")}, delegate,
                                          credential{"alice", "secret"});
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(scheduler_->start(handle.value()).has_value());
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_EQ(server.requests().size(), 1u);
    // base64("alice:secret")
    EXPECT_EQ(server.requests()[0].header("Authorization"), "Basic YWxpY2U6c2VjcmV0");
}

namespace {

/// 401 with a Basic challenge until the request carries credentials
auto basic_challenge() -> loopback_http_server::responder {
    return [](int fd, const recorded_request& request, const std::atomic<bool>&) {
        if (request.header("Authorization")) {
            loopback_http_server::send_all(
                fd, "HTTP/1.1 204 No Content\r\nConnection: close\r\n\r\n");
        } else {
            loopback_http_server::send_all(fd,
                                           "HTTP/1.1 401 Unauthorized\r\n"
                                           "WWW-Authenticate: Basic realm=\"files\"\r\n"
                                           "Content-Length: 0\r\n"
                                           "Connection: close\r\n"
                                           "\r\n");
        }
    };
}

}  // namespace

TEST_F(HttpTransferTest, AuthRoundTripResendsRewindableBody) {
    auto& server = serve(basic_challenge());
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/upload.txt"));
    request.method = "PUT";
    request.set_body("payload");
    request.options.any_http_auth = true;
    auto handle = transfer_handle::create(std::move(request), delegate,
                                          credential{"alice", "secret"});
    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    ASSERT_TRUE(scheduler_->start(handle.value()).has_value());
    ASSERT_TRUE(delegate->wait_done());

    ASSERT_TRUE(delegate->finished()) << delegate->failure()->to_string();
    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_FALSE(requests[0].header("Authorization").has_value());
    EXPECT_EQ(requests[1].header("Authorization"), "Basic YWxpY2U6c2VjcmV0");
    EXPECT_EQ(requests[1].body, "payload");
    EXPECT_EQ(handle.value()->response_code(), 204);
}

TEST_F(HttpTransferTest, AuthRoundTripWithOneShotBodyIsUsageError) {
    auto& server = serve(basic_challenge());
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/upload.txt"));
    request.method = "PUT";
    request.body_source = std::make_unique<chunked_source>("helloworld", 5, true);
    request.options.any_http_auth = true;
    auto handle = transfer_handle::create(std::move(request), delegate,
                                          credential{"alice", "secret"});
    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    ASSERT_TRUE(scheduler_->start(handle.value()).has_value());
    ASSERT_TRUE(delegate->wait_done());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind(), error_kind::usage);
    EXPECT_NE(failure->message().find("cannot be resent"), std::string::npos);
    EXPECT_FALSE(delegate->finished());
    EXPECT_EQ(delegate->terminal_count(), 1);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].body, "helloworld");
}

TEST_F(HttpTransferTest, VerboseReportsDebugInfo) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\nContent-Length: 3\r\nConnection: close\r\n\r\nabc"));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/verbose"));
    request.options.verbose = true;
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    auto types = delegate->debug_types();
    ASSERT_FALSE(types.empty());
    EXPECT_NE(std::find(types.begin(), types.end(), debug_info_type::header_out), types.end());
    EXPECT_NE(std::find(types.begin(), types.end(), debug_info_type::header_in), types.end());
}

TEST_F(HttpTransferTest, QuietTransferReportsNoDebugInfo) {
    auto& server = serve(loopback_http_server::canned(
        "HTTP/1.1 200 OK\r\nContent-Length: 3\r\nConnection: close\r\n\r\nabc"));
    auto delegate = std::make_shared<recording_delegate>();

    auto handle = start(transfer_request{server.url("/quiet")}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    EXPECT_TRUE(delegate->debug_types().empty());
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(HttpTransferTest, RefusedConnectionIsEngineError) {
    auto delegate = std::make_shared<recording_delegate>();
    auto url = "http://127.0.0.1:" + std::to_string(loopback_http_server::closed_port()) + "/";

    auto handle = start(transfer_request{url}, delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->domain(), error_domain::engine);
    EXPECT_EQ(failure->native_code(), static_cast<int>(CURLE_COULDNT_CONNECT));
    EXPECT_EQ(failure->response_code(), 0);
    EXPECT_EQ(failure->failing_url(), url);
    EXPECT_TRUE(delegate->responses().empty());
}

TEST_F(HttpTransferTest, TimeoutIsEngineError) {
    auto& server = serve(loopback_http_server::trickle(50ms));
    auto delegate = std::make_shared<recording_delegate>();

    transfer_request request(server.url("/slow"));
    request.timeout = 300ms;
    auto handle = start(std::move(request), delegate);
    ASSERT_NE(handle, nullptr);
    ASSERT_TRUE(delegate->wait_done());

    auto failure = delegate->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->native_code(), static_cast<int>(CURLE_OPERATION_TIMEDOUT));
    EXPECT_EQ(failure->response_code(), 200);
    ASSERT_EQ(delegate->responses().size(), 1u);
}

}  // namespace kcenon::curl_transfer::test
