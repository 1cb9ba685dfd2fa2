/**
 * @file download_example.cpp
 * @brief Download a URL into a local file
 *
 * This example demonstrates:
 * - Creating a transfer_handle with a delegate
 * - Receiving response headers and body data
 * - Range requests and timeouts
 * - Driving the transfer synchronously or on a scheduler
 * - Interpreting transfer_error
 */

#include <kcenon/curl_transfer/curl_transfer.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>

using namespace kcenon::curl_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Writes the body to a file and prints progress
 */
class file_sink_delegate : public transfer_delegate {
public:
    explicit file_sink_delegate(const std::filesystem::path& path)
        : output_(path, std::ios::binary), start_(std::chrono::steady_clock::now()) {}

    auto is_open() const -> bool { return output_.is_open(); }

    void on_response_received(transfer_handle& /*handle*/,
                              const transfer_response& response) override {
        std::cout << "Response: " << response.status_code() << std::endl;
        for (const auto& [name, value] : response.headers()) {
            std::cout << "  " << name << ": " << value << std::endl;
        }
        if (auto length = response.content_length()) {
            expected_ = static_cast<uint64_t>(*length);
        }
    }

    void on_data_received(transfer_handle& /*handle*/, std::span<const std::byte> data) override {
        output_.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        received_ += data.size();

        std::cout << "\rReceived " << format_bytes(received_);
        if (expected_ > 0) {
            std::cout << " / " << format_bytes(expected_) << " ("
                      << (received_ * 100 / expected_) << "%)";
        }
        std::cout << std::flush;
    }

    void on_finished(transfer_handle& handle) override {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_);
        std::cout << std::endl
                  << "Finished: " << format_bytes(received_) << " in " << std::fixed
                  << std::setprecision(2) << elapsed.count() << "s (response "
                  << handle.response_code() << ")" << std::endl;
        if (!handle.initial_ftp_path().empty()) {
            std::cout << "FTP entry path: " << handle.initial_ftp_path() << std::endl;
        }
        done_.set_value(true);
    }

    void on_failed(transfer_handle& /*handle*/, const transfer_error& error) override {
        std::cout << std::endl;
        if (error.is_cancelled()) {
            std::cerr << "Download cancelled" << std::endl;
        } else {
            std::cerr << "Download failed: " << error.to_string() << std::endl;
            std::cerr << "  Kind: " << to_string(error.kind()) << std::endl;
        }
        done_.set_value(false);
    }

    auto result() -> std::future<bool> { return done_.get_future(); }

private:
    std::ofstream output_;
    std::chrono::steady_clock::time_point start_;
    uint64_t received_ = 0;
    uint64_t expected_ = 0;
    std::promise<bool> done_;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Download Example - curl_transfer " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --range <a-b>       Request a byte range" << std::endl;
    std::cout << "  -t, --timeout <ms>      Overall timeout in milliseconds" << std::endl;
    std::cout << "  -u, --user <u:p>        Credentials for the server" << std::endl;
    std::cout << "  -s, --sync              Drive the transfer on this thread" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " https://example.com/index.html index.html" << std::endl;
    std::cout << "  " << program << " -r 0-1023 ftp://ftp.example.com/pub/big.iso head.bin"
              << std::endl;
    std::cout << "  " << program << " --sync file:///etc/hosts hosts.copy" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string url;
    std::string local_path;
    std::string range;
    std::optional<credential> user;
    std::optional<std::chrono::milliseconds> timeout;
    bool synchronous = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--range") {
            if (++i >= argc) {
                std::cerr << "Error: --range requires an argument" << std::endl;
                return 1;
            }
            range = argv[i];
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout = std::chrono::milliseconds(std::stol(argv[i]));
        } else if (arg == "-u" || arg == "--user") {
            if (++i >= argc) {
                std::cerr << "Error: --user requires an argument" << std::endl;
                return 1;
            }
            std::string pair = argv[i];
            auto colon = pair.find(':');
            user = credential{pair.substr(0, colon),
                              colon == std::string::npos ? "" : pair.substr(colon + 1)};
        } else if (arg == "-s" || arg == "--sync") {
            synchronous = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return 1;
        } else if (url.empty()) {
            url = arg;
        } else if (local_path.empty()) {
            local_path = arg;
        } else {
            std::cerr << "Error: Too many arguments" << std::endl;
            return 1;
        }
    }

    if (url.empty() || local_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "  Download Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "URL:    " << url << std::endl;
    std::cout << "Output: " << local_path << std::endl;
    std::cout << "Engine: " << engine_version() << std::endl;
    std::cout << std::endl;

    auto delegate = std::make_shared<file_sink_delegate>(local_path);
    if (!delegate->is_open()) {
        std::cerr << "Error: Cannot open " << local_path << " for writing" << std::endl;
        return 1;
    }
    auto outcome = delegate->result();

    transfer_request request(url);
    request.timeout = timeout;
    if (!range.empty()) {
        request.add_header("Range", "bytes=" + range);
    }

    auto handle = transfer_handle::create(std::move(request), delegate, user);
    if (!handle) {
        std::cerr << "Error: " << handle.error().message << std::endl;
        return 1;
    }

    if (synchronous) {
        auto performed = perform_synchronously(handle.value());
        if (!performed) {
            std::cerr << "Error: " << performed.error().message << std::endl;
            return 1;
        }
        return outcome.get() ? 0 : 1;
    }

    auto sched = scheduler::create();
    if (!sched) {
        std::cerr << "Error: " << sched.error().message << std::endl;
        return 1;
    }

    auto started = sched.value()->start(handle.value());
    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }

    bool ok = outcome.get();
    sched.value()->shutdown();
    return ok ? 0 : 1;
}
