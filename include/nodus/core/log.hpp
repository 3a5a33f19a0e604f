#pragma once

#include "nodus/core/errors.hpp"

namespace nodus::core {
    // All log lines go to stderr, one line per call, prefixed with the severity.

    void log_error(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_info(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

    // No-op unless 'enabled' is set.
    void log_debug(bool enabled, const char* fmt, ...) noexcept __attribute__((format(printf, 2, 3)));

    // error: <context> failed (code=<name>/<n>, domain=<name>/<n>, aux=<n>)
    void log_status(const char* context, Status s) noexcept;
} // namespace nodus::core
