/**
 * @file transfer_response.cpp
 * @brief Header section parsing
 */

#include "kcenon/curl_transfer/transfer/transfer_response.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace kcenon::curl_transfer {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto strip_line_ending(std::string_view line) -> std::string_view {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    return line;
}

auto parse_three_digits(std::string_view text) -> std::optional<long> {
    if (text.size() < 3) {
        return std::nullopt;
    }
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + 3, value);
    if (ec != std::errc{} || ptr != text.data() + 3) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

transfer_response::transfer_response(std::string url, long status_code, header_map headers)
    : url_(std::move(url)), status_code_(status_code), headers_(std::move(headers)) {}

auto transfer_response::header(std::string_view name) const -> std::optional<std::string> {
    auto it = headers_.find(to_lower(name));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto transfer_response::content_length() const -> std::optional<long long> {
    auto value = header("content-length");
    if (!value) {
        return std::nullopt;
    }
    auto text = trim(*value);
    long long length = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
    if (ec != std::errc{} || ptr != text.data() + text.size() || length < 0) {
        return std::nullopt;
    }
    return length;
}

auto response_builder::parse_status_line(std::string_view line) -> std::optional<long> {
    line = strip_line_ending(line);

    // "HTTP/1.1 200 OK", "HTTP/2 204"
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        auto space = line.find(' ');
        if (space == std::string_view::npos) {
            return std::nullopt;
        }
        auto rest = line.substr(space + 1);
        auto code = parse_three_digits(rest);
        if (!code || (rest.size() > 3 && rest[3] != ' ')) {
            return std::nullopt;
        }
        return code;
    }

    // "226 Transfer complete", "220-Welcome", "230"
    auto code = parse_three_digits(line);
    if (!code) {
        return std::nullopt;
    }
    if (line.size() > 3 && line[3] != ' ' && line[3] != '-') {
        return std::nullopt;
    }
    return code;
}

auto response_builder::build(std::string url,
                             std::span<const std::string> lines,
                             long fallback_status) -> transfer_response {
    long status = fallback_status;
    header_map headers;

    std::size_t first_field = 0;
    if (!lines.empty()) {
        if (auto code = parse_status_line(lines.front())) {
            status = *code;
            first_field = 1;
        }
    }

    std::string last_name;
    for (std::size_t i = first_field; i < lines.size(); ++i) {
        auto line = strip_line_ending(lines[i]);
        if (line.empty()) {
            continue;
        }

        if (line.front() == ' ' || line.front() == '\t') {
            auto it = headers.find(last_name);
            if (it != headers.end()) {
                auto extra = trim(line);
                if (!extra.empty()) {
                    it->second += ' ';
                    it->second += extra;
                }
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            last_name.clear();
            continue;
        }

        auto name = to_lower(trim(line.substr(0, colon)));
        auto value = std::string(trim(line.substr(colon + 1)));

        auto [it, inserted] = headers.try_emplace(name, value);
        if (!inserted) {
            it->second += ", ";
            it->second += value;
        }
        last_name = std::move(name);
    }

    return transfer_response(std::move(url), status, std::move(headers));
}

}  // namespace kcenon::curl_transfer
