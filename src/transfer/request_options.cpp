/**
 * @file request_options.cpp
 * @brief Translation of a transfer_request into engine options
 */

#include "request_options.h"

#include <algorithm>
#include <cctype>

namespace kcenon::curl_transfer::detail {

namespace {

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto to_upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // namespace

auto select_body_mode(const transfer_request& request) -> body_mode {
    auto method = to_upper(request.method);
    if (method == "POST") {
        return body_mode::post;
    }
    if (method == "PUT" || request.has_body()) {
        return body_mode::upload;
    }
    return body_mode::none;
}

auto strip_range_unit(std::string_view value) -> std::string {
    constexpr std::string_view unit = "bytes=";
    if (value.size() >= unit.size() && equals_ignore_case(value.substr(0, unit.size()), unit)) {
        value.remove_prefix(unit.size());
    }
    return std::string(value);
}

auto uses_ssh_host_key(std::string_view url) -> bool {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return false;
    }
    auto scheme = url.substr(0, scheme_end);
    return equals_ignore_case(scheme, "sftp") || equals_ignore_case(scheme, "scp");
}

auto apply_request_options(CURL* easy,
                           const transfer_request& request,
                           std::optional<uint64_t> body_size,
                           const std::optional<credential>& user,
                           const proxy_settings& proxy,
                           std::vector<curl_slist*>& aux_lists) -> result<void> {
    option_writer writer(easy);

    writer.set(CURLOPT_URL, request.url.c_str(), "CURLOPT_URL");
    writer.set(CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
    writer.set(CURLOPT_FOLLOWLOCATION, 0L, "CURLOPT_FOLLOWLOCATION");

    // Method and body
    auto method = to_upper(request.method);
    auto mode = select_body_mode(request);
    if (method == "HEAD") {
        writer.set(CURLOPT_NOBODY, 1L, "CURLOPT_NOBODY");
    } else if (method != "GET" && method != "POST" && method != "PUT") {
        writer.set(CURLOPT_CUSTOMREQUEST, request.method.c_str(), "CURLOPT_CUSTOMREQUEST");
    }

    if (mode == body_mode::post) {
        writer.set(CURLOPT_POST, 1L, "CURLOPT_POST");
        if (body_size) {
            writer.set(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(*body_size),
                       "CURLOPT_POSTFIELDSIZE_LARGE");
        }
    } else if (mode == body_mode::upload) {
        writer.set(CURLOPT_UPLOAD, 1L, "CURLOPT_UPLOAD");
        if (body_size) {
            writer.set(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*body_size),
                       "CURLOPT_INFILESIZE_LARGE");
        }
    }

    // Headers; Range and Accept-Encoding work for every protocol
    curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        if (equals_ignore_case(name, "Range")) {
            auto range = strip_range_unit(value);
            writer.set(CURLOPT_RANGE, range.c_str(), "CURLOPT_RANGE");
            continue;
        }
        if (equals_ignore_case(name, "Accept-Encoding")) {
            writer.set(CURLOPT_ACCEPT_ENCODING, value.c_str(), "CURLOPT_ACCEPT_ENCODING");
            continue;
        }

        std::string line = value.empty() ? name + ";" : name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list, line.c_str());
        if (appended == nullptr) {
            if (header_list != nullptr) {
                aux_lists.push_back(header_list);
            }
            return unexpected{error{error_code::engine_option_failed,
                                    "failed to allocate header list"}};
        }
        header_list = appended;
    }
    if (header_list != nullptr) {
        aux_lists.push_back(header_list);
        writer.set(CURLOPT_HTTPHEADER, header_list, "CURLOPT_HTTPHEADER");
    }

    // Timeouts
    if (request.timeout) {
        writer.set(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout->count()),
                   "CURLOPT_TIMEOUT_MS");
    }
    if (request.connect_timeout) {
        writer.set(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout->count()),
                   "CURLOPT_CONNECTTIMEOUT_MS");
    }

    // Options
    const auto& options = request.options;
    if (options.verbose) {
        writer.set(CURLOPT_VERBOSE, 1L, "CURLOPT_VERBOSE");
    }
    if (options.buffer_size) {
        writer.set(CURLOPT_BUFFERSIZE, static_cast<long>(*options.buffer_size),
                   "CURLOPT_BUFFERSIZE");
    }
    if (options.ftp_create_missing_dirs) {
        writer.set(CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY),
                   "CURLOPT_FTP_CREATE_MISSING_DIRS");
    }
    if (options.known_hosts_path && uses_ssh_host_key(request.url)) {
        writer.set(CURLOPT_SSH_KNOWNHOSTS, options.known_hosts_path->c_str(),
                   "CURLOPT_SSH_KNOWNHOSTS");
    }

    // Credentials
    if (user) {
        writer.set(CURLOPT_USERNAME, user->user.c_str(), "CURLOPT_USERNAME");
        writer.set(CURLOPT_PASSWORD, user->password.c_str(), "CURLOPT_PASSWORD");
    }
    if (options.any_http_auth) {
        writer.set(CURLOPT_HTTPAUTH, static_cast<unsigned long>(CURLAUTH_ANY), "CURLOPT_HTTPAUTH");
    }

    // Process-wide proxy settings
    if (!proxy.allows_proxy) {
        writer.set(CURLOPT_PROXY, "", "CURLOPT_PROXY");
    }
    if (proxy.user_password) {
        writer.set(CURLOPT_PROXYUSERPWD, proxy.user_password->c_str(), "CURLOPT_PROXYUSERPWD");
    }

    return writer.finish();
}

}  // namespace kcenon::curl_transfer::detail
