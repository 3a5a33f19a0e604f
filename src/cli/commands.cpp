#include "nodus/cli/commands.hpp"

#include <cstring>

namespace nodus::cli {
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;

    namespace {
        constexpr CommandSpec kReplCommands[] = {
            {CommandId::Help, "help", 0, "help"},
            {CommandId::Save, "save", 1, "save <value>"},
            {CommandId::Put, "put", 2, "put <uid> <value>"},
            {CommandId::Get, "get", 1, "get <uid>"},
            {CommandId::Get, "g", 1, "g <uid>"},
            {CommandId::Delete, "del", 1, "del <uid>"},
            {CommandId::Call, "call", 1, "call <path> [args...]"},
            {CommandId::CallPointer, "callp", 1, "callp <path> [args...]"},
            {CommandId::Method, "method", 2, "method <uid> <name> [args...]"},
            {CommandId::List, "ls", 0, "ls"},
            {CommandId::List, "list", 0, "list"},
            {CommandId::Stat, "stat", 1, "stat <uid>"},
            {CommandId::Verify, "verify", 1, "verify <uid>"},
            {CommandId::Stats, "stats", 0, "stats"},
            {CommandId::Quit, "q", 0, "q"},
            {CommandId::Quit, "quit", 0, "quit"},
            {CommandId::Quit, "exit", 0, "exit"},
        };

        bool is_blank(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }
    } // namespace

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count && match == nullptr; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                match = &specs[i];
            }
        }
        if (match == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::NotFound);
        }
        if (args.argc - 1 < match->min_args) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid, match->min_args);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return nodus::core::ok_status();
    }

    const CommandSpec* repl_command_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kReplCommands) / sizeof(kReplCommands[0]));
        }
        return kReplCommands;
    }

    Status tokenize_line(std::string_view line, std::vector<std::string>* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        out->clear();

        std::size_t i = 0;
        while (i < line.size()) {
            while (i < line.size() && is_blank(line[i])) {
                ++i;
            }
            if (i == line.size()) {
                break;
            }

            std::string tok;
            bool quoted = false;
            while (i < line.size() && (quoted || !is_blank(line[i]))) {
                const char c = line[i++];
                if (c == '"') {
                    quoted = !quoted;
                } else if (quoted && c == '\\' && i < line.size() && (line[i] == '"' || line[i] == '\\')) {
                    tok.push_back(line[i++]);
                } else {
                    tok.push_back(c);
                }
            }
            if (quoted) {
                return make_status(StatusDomain::Cli, StatusCode::Invalid, static_cast<u32>(i));
            }
            out->push_back(std::move(tok));
        }
        return nodus::core::ok_status();
    }
} // namespace nodus::cli
