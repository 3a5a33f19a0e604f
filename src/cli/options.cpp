#include "nodus/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace nodus::cli {
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;

    namespace {
        constexpr OptionSpec kNodeOptions[] = {
            {OptionId::NodeId, OptionType::String, "id", 'i'},
            {OptionId::Debug, OptionType::Flag, "debug", 'd'},
            {OptionId::MaxEntries, OptionType::I64, "max-entries", 'm'},
            {OptionId::NoDigest, OptionType::Flag, "no-digest", '\0'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        };

        Status bad_arg(u32 index) noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, index);
        }

        const OptionSpec* find_long(const OptionSpec* specs, u32 n, const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < n; ++i) {
                const char* ln = specs[i].long_name;
                if (ln != nullptr && std::strlen(ln) == name_len && std::strncmp(ln, name, name_len) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        const OptionSpec* find_short(const OptionSpec* specs, u32 n, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < n; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end || s == end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Converts 'text' according to spec.type into *opt.
        bool fill_value(const OptionSpec& spec, const char* text, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
            case OptionType::Flag:
                opt->value.boolv = 1;
                return text == nullptr;
            case OptionType::String:
                opt->value.str = text;
                return text != nullptr;
            case OptionType::I64:
                return text != nullptr && parse_i64(text, &opt->value.i64v);
            }
            return false;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr || out->data == nullptr || out->cap == 0) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return bad_arg(i);
            }

            const u32 at = i;
            const char* text = inline_value;
            if (spec->type != OptionType::Flag && text == nullptr) {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return bad_arg(at);
                }
                text = args.argv[++i];
            }
            ++i;

            ParsedOption opt{};
            if (!fill_value(*spec, text, &opt)) {
                return bad_arg(at);
            }
            if (out->len >= out->cap) {
                return bad_arg(at);
            }
            out->data[out->len++] = opt;
        }

        *consumed = i;
        return nodus::core::ok_status();
    }

    const ParsedOption* option_find(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    const OptionSpec* node_option_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kNodeOptions) / sizeof(kNodeOptions[0]));
        }
        return kNodeOptions;
    }
} // namespace nodus::cli
