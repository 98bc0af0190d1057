// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace ferry::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view strip_query_and_fragment(std::string_view url) noexcept {
    auto cut = url.find_first_of("?#");
    return cut == std::string_view::npos ? url : url.substr(0, cut);
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TaskErrc::invalid_url));
    }

    url.scheme_ = to_lower(url_str.substr(0, scheme_end));

    auto rest_start = scheme_end + 3; // Skip "://"

    // host_end is at the first of: /, ?, #, or end
    auto host_end = url_str.find_first_of("/?#", rest_start);
    if (host_end == std::string_view::npos) {
        host_end = url_str.length();
    }

    std::size_t authority_start = rest_start;

    // Skip userinfo (user:pass@host)
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 address [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(TaskErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    url.host_ = to_lower(url.host_);

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(TaskErrc::invalid_url));
    }
    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(make_error_code(TaskErrc::invalid_url));
    }

    auto query_start = url_str.find('?', host_end);
    auto fragment_start = url_str.find('#', host_end);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }
    if (query_start == std::string_view::npos || query_start > fragment_start) {
        query_start = fragment_start;
    }

    // Extract path (if present)
    if (host_end < query_start && url_str[host_end] == '/') {
        url.path_ = std::string(url_str.substr(host_end, query_start - host_end));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::path_tail() const {
    auto last_slash = path_.rfind('/');
    std::string_view tail = path_;
    if (last_slash != std::string::npos) {
        tail = std::string_view(path_).substr(last_slash + 1);
    }
    return percent_decode(tail);
}

std::string Url::query_param(std::string_view key) const {
    std::string_view q = query_;
    while (!q.empty()) {
        auto amp = q.find('&');
        auto pair = q.substr(0, amp);
        auto eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            return eq == std::string_view::npos ? std::string{} : percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        q.remove_prefix(amp + 1);
    }
    return {};
}

std::string Url::resolve(std::string_view ref) const {
    auto scheme_sep = ref.find("://");
    if (scheme_sep != std::string_view::npos && ref.find_first_of("/?#") > scheme_sep) {
        return std::string(ref);
    }
    if (ref.starts_with("//")) {
        return scheme_ + ":" + std::string(ref);
    }
    if (ref.starts_with("/")) {
        return base() + std::string(ref);
    }

    // Relative: replace last path segment
    std::string dir = path_;
    auto last_slash = dir.rfind('/');
    dir = last_slash == std::string::npos ? "/" : dir.substr(0, last_slash + 1);
    return base() + dir + std::string(ref);
}

} // namespace ferry::core
