#include "nodus/core/log.hpp"

#include <cstdarg>
#include <cstdio>

namespace nodus::core {
    namespace {
        void vlog(const char* prefix, const char* fmt, va_list ap) noexcept {
            std::fprintf(stderr, "%s: ", prefix);
            std::vfprintf(stderr, fmt, ap);
            std::fputc('\n', stderr);
        }
    } // namespace

    void log_error(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog("error", fmt, ap);
        va_end(ap);
    }

    void log_info(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog("info", fmt, ap);
        va_end(ap);
    }

    void log_debug(bool enabled, const char* fmt, ...) noexcept {
        if (!enabled) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        vlog("debug", fmt, ap);
        va_end(ap);
    }

    void log_status(const char* context, Status s) noexcept {
        std::fprintf(stderr,
                "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                context,
                status_code_name(s.code),
                static_cast<unsigned>(s.code),
                status_domain_name(s.domain),
                static_cast<unsigned>(s.domain),
                s.aux);
    }
} // namespace nodus::core
