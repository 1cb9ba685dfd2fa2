/**
 * @file upload_example.cpp
 * @brief Upload a local file to a URL
 *
 * This example demonstrates:
 * - Streaming an upload body from a file with stream_upload_source
 * - Upload progress through on_will_send_body
 * - Creating missing FTP directories
 * - Deciding SFTP host keys against a known_hosts file
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
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

class upload_progress_delegate : public transfer_delegate {
public:
    upload_progress_delegate(uint64_t total, bool trust_new_hosts)
        : total_(total), trust_new_hosts_(trust_new_hosts) {}

    void on_data_received(transfer_handle& /*handle*/,
                          std::span<const std::byte> /*data*/) override {}

    void on_response_received(transfer_handle& /*handle*/,
                              const transfer_response& response) override {
        std::cout << std::endl << "Server replied " << response.status_code() << std::endl;
    }

    void on_will_send_body(transfer_handle& /*handle*/, std::size_t bytes) override {
        sent_ += bytes;
        std::cout << "\rSent " << format_bytes(sent_);
        if (total_ > 0) {
            std::cout << " / " << format_bytes(total_) << " (" << (sent_ * 100 / total_) << "%)";
        }
        std::cout << std::flush;
    }

    auto on_host_fingerprint(transfer_handle& /*handle*/,
                             const host_key& found,
                             const host_key* /*known*/,
                             host_key_match match) -> host_key_disposition override {
        std::cout << std::endl
                  << "Host key " << to_string(found.type()) << " " << found.sha256_fingerprint()
                  << " (" << to_string(match) << ")" << std::endl;

        if (match == host_key_match::match) {
            return host_key_disposition::accept;
        }
        if (match == host_key_match::missing && trust_new_hosts_) {
            std::cout << "Adding host key to known_hosts" << std::endl;
            return host_key_disposition::accept_and_persist;
        }
        return host_key_disposition::reject;
    }

    void on_finished(transfer_handle& /*handle*/) override {
        std::cout << std::endl << "Upload complete: " << format_bytes(sent_) << std::endl;
        done_.set_value(true);
    }

    void on_failed(transfer_handle& /*handle*/, const transfer_error& error) override {
        std::cout << std::endl;
        std::cerr << "Upload failed: " << error.to_string() << std::endl;
        done_.set_value(false);
    }

    auto result() -> std::future<bool> { return done_.get_future(); }

private:
    uint64_t total_;
    uint64_t sent_ = 0;
    bool trust_new_hosts_;
    std::promise<bool> done_;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - curl_transfer " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <url>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --user <u:p>          Credentials for the server" << std::endl;
    std::cout << "  -k, --known-hosts <file>  known_hosts file for SFTP/SCP" << std::endl;
    std::cout << "  --trust-new-hosts         Accept and remember unknown host keys" << std::endl;
    std::cout << "  --create-dirs             Create missing FTP directories" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " report.pdf ftp://ftp.example.com/incoming/report.pdf"
              << std::endl;
    std::cout << "  " << program
              << " -u me:secret -k ~/.ssh/known_hosts data.bin sftp://host/home/me/data.bin"
              << std::endl;
    std::cout << "  " << program << " notes.txt file:///tmp/notes.txt" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string local_path;
    std::string url;
    std::optional<credential> user;
    std::optional<std::string> known_hosts;
    bool trust_new_hosts = false;
    bool create_dirs = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-u" || arg == "--user") {
            if (++i >= argc) {
                std::cerr << "Error: --user requires an argument" << std::endl;
                return 1;
            }
            std::string pair = argv[i];
            auto colon = pair.find(':');
            user = credential{pair.substr(0, colon),
                              colon == std::string::npos ? "" : pair.substr(colon + 1)};
        } else if (arg == "-k" || arg == "--known-hosts") {
            if (++i >= argc) {
                std::cerr << "Error: --known-hosts requires an argument" << std::endl;
                return 1;
            }
            known_hosts = argv[i];
        } else if (arg == "--trust-new-hosts") {
            trust_new_hosts = true;
        } else if (arg == "--create-dirs") {
            create_dirs = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return 1;
        } else if (local_path.empty()) {
            local_path = arg;
        } else if (url.empty()) {
            url = arg;
        } else {
            std::cerr << "Error: Too many arguments" << std::endl;
            return 1;
        }
    }

    if (local_path.empty() || url.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        std::cerr << "Error: Cannot read " << local_path << ": " << ec.message() << std::endl;
        return 1;
    }

    auto stream = std::make_unique<std::ifstream>(local_path, std::ios::binary);
    if (!stream->is_open()) {
        std::cerr << "Error: Cannot open " << local_path << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "  Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "File: " << local_path << " (" << format_bytes(size) << ")" << std::endl;
    std::cout << "URL:  " << url << std::endl;
    std::cout << std::endl;

    transfer_request request(url);
    request.body_source = std::make_unique<stream_upload_source>(std::move(stream), size);
    request.options.known_hosts_path = known_hosts;
    request.options.ftp_create_missing_dirs = create_dirs;
    if (url.rfind("http", 0) == 0) {
        request.method = "PUT";
    }

    auto delegate = std::make_shared<upload_progress_delegate>(size, trust_new_hosts);
    auto outcome = delegate->result();

    auto handle = transfer_handle::create(std::move(request), delegate, user);
    if (!handle) {
        std::cerr << "Error: " << handle.error().message << std::endl;
        return 1;
    }

    auto performed = perform_synchronously(handle.value());
    if (!performed) {
        std::cerr << "Error: " << performed.error().message << std::endl;
        return 1;
    }
    return outcome.get() ? 0 : 1;
}
