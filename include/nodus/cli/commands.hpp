#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "nodus/cli/options.hpp"
#include "nodus/core/errors.hpp"

namespace nodus::cli {
    using u32 = nodus::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Save = 2,
        Put = 3,
        Get = 4,
        Delete = 5,
        Call = 6,
        CallPointer = 7,
        Method = 8,
        List = 9,
        Stat = 10,
        Verify = 11,
        Stats = 12,
        Quit = 13,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against 'specs' and hands back the remaining arguments.
    // Unknown command: Cli/NotFound. Too few arguments: Cli/Invalid with
    // aux = the required count.
    [[nodiscard]] nodus::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // REPL command table, aliases included.
    [[nodiscard]] const CommandSpec* repl_command_specs(u32* count) noexcept;

    // Splits a REPL line on blanks. Double quotes group words and may hold
    // \" and \\ escapes. Unterminated quote: Cli/Invalid.
    [[nodiscard]] nodus::core::Status tokenize_line(std::string_view line, std::vector<std::string>* out);

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);

} // namespace nodus::cli
