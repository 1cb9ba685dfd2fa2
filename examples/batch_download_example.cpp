/**
 * @file batch_download_example.cpp
 * @brief Download several URLs concurrently on one scheduler
 *
 * This example demonstrates:
 * - Running many transfer_handles on a single scheduler thread
 * - One delegate per transfer writing into its own file
 * - Handling individual failures within a batch
 * - Summarizing the batch once every transfer has settled
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
#include <vector>

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
 * @brief Format transfer rate
 */
auto format_rate(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

/**
 * @brief Derive a local file name from the last path segment of a URL
 */
auto local_name_for(const std::string& url, std::size_t index) -> std::string {
    auto query = url.find_first_of("?#");
    auto path = url.substr(0, query);
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? "" : path.substr(slash + 1);
    if (name.empty()) {
        name = "download_" + std::to_string(index);
    }
    return name;
}

struct batch_entry_result {
    std::string url;
    bool success = false;
    uint64_t bytes = 0;
    long response_code = 0;
    std::string error;
};

class batch_entry_delegate : public transfer_delegate {
public:
    batch_entry_delegate(std::string url, const std::filesystem::path& path)
        : output_(path, std::ios::binary) {
        result_.url = std::move(url);
    }

    auto is_open() const -> bool { return output_.is_open(); }

    void on_data_received(transfer_handle& /*handle*/, std::span<const std::byte> data) override {
        output_.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        result_.bytes += data.size();
    }

    void on_finished(transfer_handle& handle) override {
        output_.close();
        result_.success = true;
        result_.response_code = handle.response_code();
        std::cout << "  [done]   " << result_.url << " (" << format_bytes(result_.bytes) << ")"
                  << std::endl;
        done_.set_value(result_);
    }

    void on_failed(transfer_handle& handle, const transfer_error& error) override {
        output_.close();
        result_.response_code = handle.response_code();
        result_.error = error.to_string();
        std::cout << "  [failed] " << result_.url << ": " << result_.error << std::endl;
        done_.set_value(result_);
    }

    auto result() -> std::future<batch_entry_result> { return done_.get_future(); }

private:
    std::ofstream output_;
    batch_entry_result result_;
    std::promise<batch_entry_result> done_;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Download Example - curl_transfer " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url> [url...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -o, --output <dir>      Download directory (default: ./downloads)"
              << std::endl;
    std::cout << "  -t, --timeout <ms>      Per-transfer timeout in milliseconds" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program
              << " https://example.com/a.txt https://example.com/b.txt ftp://host/pub/c.bin"
              << std::endl;
    std::cout << "  " << program << " -o /tmp/out -t 30000 https://example.com/big.iso"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path download_dir = "./downloads";
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return 1;
            }
            download_dir = argv[i];
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout = std::chrono::milliseconds(std::stol(argv[i]));
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return 1;
        } else {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(download_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << download_dir << ": " << ec.message() << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "  Batch Download Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Transfers: " << urls.size() << std::endl;
    std::cout << "Output:    " << download_dir.string() << std::endl;
    std::cout << std::endl;

    auto sched = scheduler::create();
    if (!sched) {
        std::cerr << "Error: " << sched.error().message << std::endl;
        return 1;
    }

    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::shared_ptr<transfer_handle>> handles;
    std::vector<std::future<batch_entry_result>> outcomes;
    std::vector<batch_entry_result> results;

    for (std::size_t i = 0; i < urls.size(); ++i) {
        const auto& url = urls[i];
        auto delegate = std::make_shared<batch_entry_delegate>(
            url, download_dir / local_name_for(url, i));
        if (!delegate->is_open()) {
            results.push_back({url, false, 0, 0, "cannot open local file"});
            continue;
        }

        transfer_request request(url);
        request.timeout = timeout;

        auto handle = transfer_handle::create(std::move(request), delegate);
        if (!handle) {
            results.push_back({url, false, 0, 0, handle.error().message});
            continue;
        }

        auto future = delegate->result();
        auto started = sched.value()->start(handle.value());
        if (!started) {
            results.push_back({url, false, 0, 0, started.error().message});
            continue;
        }
        handles.push_back(handle.value());
        outcomes.push_back(std::move(future));
    }

    std::cout << "Started " << handles.size() << " transfer(s)" << std::endl;

    for (auto& outcome : outcomes) {
        results.push_back(outcome.get());
    }
    sched.value()->shutdown();

    auto elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    uint64_t total_bytes = 0;
    std::size_t succeeded = 0;
    for (const auto& entry : results) {
        total_bytes += entry.bytes;
        if (entry.success) {
            ++succeeded;
        }
    }

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Succeeded: " << succeeded << " / " << results.size() << std::endl;
    std::cout << "Total:     " << format_bytes(total_bytes) << std::endl;
    std::cout << "Elapsed:   " << std::fixed << std::setprecision(2) << elapsed << "s"
              << std::endl;
    if (elapsed > 0) {
        std::cout << "Rate:      " << format_rate(static_cast<double>(total_bytes) / elapsed)
                  << std::endl;
    }

    for (const auto& entry : results) {
        if (!entry.success) {
            std::cout << "  FAILED " << entry.url << " (" << entry.error << ")" << std::endl;
        }
    }

    return succeeded == results.size() ? 0 : 1;
}
