#include "nodus/cli/values.hpp"

#include <charconv>
#include <cerrno>
#include <cstdlib>

#include "nodus/core/uid.hpp"

namespace nodus::cli {
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::core::Value;

    namespace {
        bool parse_int(std::string_view s, i64* out) noexcept {
            if (s.empty()) {
                return false;
            }
            i64 v{};
            auto r = std::from_chars(s.data(), s.data() + s.size(), v, 10);
            if (r.ec != std::errc() || r.ptr != s.data() + s.size()) {
                return false;
            }
            *out = v;
            return true;
        }

        bool looks_numeric(std::string_view s) noexcept {
            bool digit = false;
            for (char c : s) {
                if (c >= '0' && c <= '9') {
                    digit = true;
                } else if (c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
                    return false;
                }
            }
            return digit;
        }

        bool parse_float(std::string_view s, double* out) {
            if (!looks_numeric(s)) {
                return false;
            }
            const std::string tmp(s);
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(tmp.c_str(), &end);
            if (end == tmp.c_str() || *end != '\0' || errno != 0) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    Status parse_value_token(std::string_view tok, const std::string& node_id, Value* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        if (!tok.empty() && tok.front() == '@') {
            nodus::core::Uid id{};
            const std::string text(tok.substr(1));
            const Status s = nodus::core::uid_parse(text.c_str(), &id);
            if (!nodus::core::is_ok(s)) {
                return s;
            }
            *out = Value(nodus::core::Pointer{id, node_id, {}});
            return nodus::core::ok_status();
        }
        if (tok == "none") {
            *out = Value{};
            return nodus::core::ok_status();
        }
        if (tok == "true" || tok == "false") {
            *out = Value(tok == "true");
            return nodus::core::ok_status();
        }

        i64 iv{};
        if (parse_int(tok, &iv)) {
            *out = Value(iv);
            return nodus::core::ok_status();
        }
        double fv{};
        if (parse_float(tok, &fv)) {
            *out = Value(fv);
            return nodus::core::ok_status();
        }

        *out = Value(std::string(tok));
        return nodus::core::ok_status();
    }

    Status parse_value_args(const CliArgs& args, const std::string& node_id, nodus::net::ArgList* out) {
        if (out == nullptr || (args.argc > 0 && args.argv == nullptr)) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        out->clear();
        out->reserve(args.argc);
        for (u32 i = 0; i < args.argc; ++i) {
            Value v;
            Status s = parse_value_token(args.argv[i], node_id, &v);
            if (!nodus::core::is_ok(s)) {
                s.aux = i;
                return s;
            }
            out->push_back(std::move(v));
        }
        return nodus::core::ok_status();
    }
} // namespace nodus::cli
