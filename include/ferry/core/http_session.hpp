// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/fetcher.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace ferry::core {

// HTTP response metadata
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-cased names
    std::uint64_t content_length{0};
    std::string content_type;
    std::string filename;                          // From Content-Disposition
};

// libcurl-backed Fetcher. One easy handle per request; sequential use only.
class HttpSession final : public Fetcher {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    // Non-copyable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<std::string, Failure>
    fetch_text(const std::string& url) override;

    [[nodiscard]] std::expected<std::filesystem::path, Failure>
    download(const DownloadRequest& request, const ProgressFn& progress) override;

    void user_agent(std::string ua) { user_agent_ = std::move(ua); }

    // Parse a Content-Disposition value; supports filename*= (RFC 5987) and filename=
    [[nodiscard]] static std::string parse_content_disposition(std::string_view value);

    // Apply the filename priority: header name > URL path tail > fallback
    [[nodiscard]] static std::string resolve_filename(std::string_view header_name,
                                                      std::string_view url,
                                                      std::string_view fallback);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string user_agent_{"ferry/0.1"};
};

} // namespace ferry::core
