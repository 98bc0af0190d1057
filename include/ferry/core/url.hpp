// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace ferry::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, percent-decoded; empty for directory URLs
    [[nodiscard]] std::string path_tail() const;

    // Query parameter value (first match), empty when absent
    [[nodiscard]] std::string query_param(std::string_view key) const;

    // Resolve `ref` against this URL (absolute, root-relative or relative)
    [[nodiscard]] std::string resolve(std::string_view ref) const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Lowercase ASCII copy
[[nodiscard]] std::string to_lower(std::string_view s);

// Drop everything from the first '?' or '#'
[[nodiscard]] std::string_view strip_query_and_fragment(std::string_view url) noexcept;

// Decode %XX escapes; malformed escapes are kept as-is
[[nodiscard]] std::string percent_decode(std::string_view s);

} // namespace ferry::core
