// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry::core {

enum class TaskErrc {
    success = 0,
    busy,
    cancelled,
    banned,
    password_required,
    wrong_password,
    corrupt_archive,
    no_links,
    invalid_url,
    unresolvable_link,
    network_error,
    http_error,
    manifest_invalid,
    process_failed,
    tool_missing,
    resource_error,
    task_not_found,
    not_owner,
    invalid_index,
};

// Presentation class of an error, as seen by the front-end
enum class ErrorClass : std::uint8_t {
    none,
    input,          // Bad password, corrupt archive, empty link set
    busy,           // Slot already held
    cancelled,      // Cooperative cancellation, not an error
    transient_io,   // Per-item fetch/remux failure
    resource,       // Temp dir, disk full, missing tool
};

namespace detail {

struct TaskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::task";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TaskErrc>(ev)) {
            case TaskErrc::success:            return "Success";
            case TaskErrc::busy:               return "Another task is already running";
            case TaskErrc::cancelled:          return "Task cancelled";
            case TaskErrc::banned:             return "User is banned";
            case TaskErrc::password_required:  return "Archive is password protected";
            case TaskErrc::wrong_password:     return "Wrong or missing password";
            case TaskErrc::corrupt_archive:    return "Archive is corrupt or unsupported";
            case TaskErrc::no_links:           return "No valid URLs found";
            case TaskErrc::invalid_url:        return "Invalid URL";
            case TaskErrc::unresolvable_link:  return "Link cannot be resolved to a direct download";
            case TaskErrc::network_error:      return "Network error";
            case TaskErrc::http_error:         return "HTTP error";
            case TaskErrc::manifest_invalid:   return "Streaming manifest could not be parsed";
            case TaskErrc::process_failed:     return "External tool failed";
            case TaskErrc::tool_missing:       return "External tool not found";
            case TaskErrc::resource_error:     return "Temporary storage unavailable";
            case TaskErrc::task_not_found:     return "Task expired or not found";
            case TaskErrc::not_owner:          return "Task belongs to another user";
            case TaskErrc::invalid_index:      return "Invalid selection";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TaskErrcCategory& task_errc_category() noexcept {
    static detail::TaskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TaskErrc e) noexcept {
    return {static_cast<int>(e), task_errc_category()};
}

// Error code plus the verbatim diagnostic of whatever produced it
struct Failure {
    std::error_code code;
    std::string detail;

    Failure() = default;
    Failure(std::error_code c) : code(c) {}  // NOLINT
    Failure(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}
    Failure(TaskErrc e) : code(make_error_code(e)) {}  // NOLINT
    Failure(TaskErrc e, std::string d) : code(make_error_code(e)), detail(std::move(d)) {}

    [[nodiscard]] std::string message() const {
        if (detail.empty()) return code.message();
        return code.message() + ": " + detail;
    }

    [[nodiscard]] bool is(TaskErrc e) const noexcept { return code == make_error_code(e); }
};

[[nodiscard]] ErrorClass error_class(std::error_code ec) noexcept;

[[nodiscard]] std::string_view to_string(ErrorClass c) noexcept;

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::TaskErrc> : true_type {};

} // namespace std
