// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>

namespace ferry::core {

ErrorClass error_class(std::error_code ec) noexcept {
    if (!ec) return ErrorClass::none;

    if (ec.category() != task_errc_category()) {
        // errno-style codes come from filesystem calls
        if (ec == std::errc::no_space_on_device ||
            ec == std::errc::permission_denied ||
            ec == std::errc::read_only_file_system) {
            return ErrorClass::resource;
        }
        return ErrorClass::transient_io;
    }

    switch (static_cast<TaskErrc>(ec.value())) {
        case TaskErrc::busy:
            return ErrorClass::busy;
        case TaskErrc::cancelled:
            return ErrorClass::cancelled;
        case TaskErrc::network_error:
        case TaskErrc::http_error:
        case TaskErrc::manifest_invalid:
        case TaskErrc::process_failed:
        case TaskErrc::unresolvable_link:
            return ErrorClass::transient_io;
        case TaskErrc::resource_error:
        case TaskErrc::tool_missing:
            return ErrorClass::resource;
        case TaskErrc::success:
            return ErrorClass::none;
        default:
            return ErrorClass::input;
    }
}

std::string_view to_string(ErrorClass c) noexcept {
    switch (c) {
        case ErrorClass::none:          return "none";
        case ErrorClass::input:         return "input";
        case ErrorClass::busy:          return "busy";
        case ErrorClass::cancelled:     return "cancelled";
        case ErrorClass::transient_io:  return "transient_io";
        case ErrorClass::resource:      return "resource";
    }
    return "unknown";
}

} // namespace ferry::core
