#pragma once

#include <type_traits>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"

namespace nodus::cli {
    using u8 = nodus::core::u8;
    using u32 = nodus::core::u32;
    using i64 = nodus::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        NodeId = 1,
        Debug = 2,
        MaxEntries = 3,
        NoDigest = 4,
        Help = 5,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned output buffer.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", flags) until the first positional argument or "--".
    // Failures are Cli/Invalid with aux = index of the offending argument.
    [[nodiscard]] nodus::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins. nullptr if the option was not given.
    [[nodiscard]] const ParsedOption* option_find(const ParsedOptions& opts, OptionId id) noexcept;

    // The process-level options of the nodus executable.
    [[nodiscard]] const OptionSpec* node_option_specs(u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);

} // namespace nodus::cli
