#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "nodus/cli/arith.hpp"
#include "nodus/cli/commands.hpp"
#include "nodus/cli/options.hpp"
#include "nodus/cli/values.hpp"
#include "nodus/core/errors.hpp"
#include "nodus/core/id_wrappers.hpp"
#include "nodus/core/log.hpp"
#include "nodus/core/uid.hpp"
#include "nodus/core/value.hpp"
#include "nodus/net/message.hpp"
#include "nodus/node/virtual_worker.hpp"
#include "nodus/security/random.hpp"
#include "nodus/storage/hashing.hpp"

using nodus::cli::CliArgs;
using nodus::cli::CommandId;
using nodus::core::Status;
using nodus::core::Uid;
using nodus::core::Value;

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string node_id{"node-a"};
    bool debug{false};
    nodus::storage::ObjectStoreConfig store{};
};

// The REPL talks to the node through a second, client-side worker.
struct Session {
    std::unique_ptr<nodus::node::VirtualWorker> node;
    std::unique_ptr<nodus::node::VirtualWorker> client;
};

void print_usage(const char* argv0) {
    printf("usage: %s [--id <node>] [--debug] [--max-entries <n>] [--no-digest]\n", argv0);
    printf("  -i, --id <node>          node id (default: $NODUS_NODE_ID or node-a)\n");
    printf("  -d, --debug              log every dispatch and keep statistics\n");
    printf("  -m, --max-entries <n>    cap on stored objects (0 = unlimited)\n");
    printf("      --no-digest          do not keep BLAKE3 digests of stored objects\n");
}

Status load_config(int argc, char** argv, CliConfig* cfg, bool* show_help) {
    const char* env_id = std::getenv("NODUS_NODE_ID");
    if (env_id != nullptr && *env_id != '\0') {
        cfg->node_id = env_id;
    }

    nodus::cli::ParsedOption storage[16]{};
    nodus::cli::ParsedOptions opts{storage, 0, 16};
    nodus::core::u32 spec_count = 0;
    const nodus::cli::OptionSpec* specs = nodus::cli::node_option_specs(&spec_count);
    const CliArgs args{argv + 1, static_cast<nodus::core::u32>(argc > 0 ? argc - 1 : 0)};

    nodus::core::u32 consumed = 0;
    Status s = nodus::cli::parse_options(args, specs, spec_count, &opts, &consumed);
    if (!nodus::core::is_ok(s)) {
        return s;
    }
    if (consumed != args.argc) {
        return nodus::core::make_status(nodus::core::StatusDomain::Cli, nodus::core::StatusCode::Invalid, consumed);
    }

    using nodus::cli::OptionId;
    *show_help = nodus::cli::option_find(opts, OptionId::Help) != nullptr;
    if (const auto* o = nodus::cli::option_find(opts, OptionId::NodeId)) {
        cfg->node_id = o->value.str;
    }
    cfg->debug = nodus::cli::option_find(opts, OptionId::Debug) != nullptr;
    if (nodus::cli::option_find(opts, OptionId::NoDigest) != nullptr) {
        cfg->store.compute_digests = false;
    }
    if (const auto* o = nodus::cli::option_find(opts, OptionId::MaxEntries)) {
        if (o->value.i64v < 0 || o->value.i64v > static_cast<nodus::core::i64>(UINT32_MAX)) {
            return nodus::core::make_status(nodus::core::StatusDomain::Cli, nodus::core::StatusCode::Invalid);
        }
        cfg->store.max_entries = static_cast<nodus::core::u32>(o->value.i64v);
    }
    if (cfg->node_id.empty()) {
        return nodus::core::make_status(nodus::core::StatusDomain::Cli, nodus::core::StatusCode::Invalid);
    }
    return nodus::core::ok_status();
}

Status open_session(const CliConfig& cfg, Session* session) {
    nodus::node::WorkerConfig node_cfg;
    node_cfg.id = cfg.node_id;
    node_cfg.debug = cfg.debug;
    node_cfg.store = cfg.store;

    std::vector<nodus::node::Framework> frameworks;
    frameworks.push_back(nodus::cli::arith_framework());
    Status s = nodus::node::VirtualWorker::create(node_cfg, std::move(frameworks), &session->node);
    if (!nodus::core::is_ok(s)) {
        return s;
    }

    nodus::node::WorkerConfig client_cfg;
    client_cfg.id = cfg.node_id + "-client";
    s = nodus::node::VirtualWorker::create(client_cfg, {}, &session->client);
    if (!nodus::core::is_ok(s)) {
        return s;
    }

    nodus::node::VirtualWorker::connect(*session->node, *session->client);
    return nodus::core::ok_status();
}

// ========================================================================
// Command Handlers
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

bool parse_uid_arg(const char* cmd, const char* text, Uid* out) {
    const Status s = nodus::core::uid_parse(text, out);
    if (!nodus::core::is_ok(s)) {
        fprintf(stderr, "error: %s: '%s' is not a UID\n", cmd, text);
        return false;
    }
    return true;
}

// Sends msg to the node. Prints and returns false on any failure.
bool round_trip(Session& session, const char* cmd, const nodus::net::Message& msg, nodus::net::Response* out) {
    const Status s = session.client->request(msg, out);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status(cmd, s);
        return false;
    }
    if (!out->ok()) {
        nodus::core::log_status(cmd, out->status);
        return false;
    }
    return true;
}

void handle_help() {
    nodus::core::u32 n = 0;
    const nodus::cli::CommandSpec* specs = nodus::cli::repl_command_specs(&n);
    printf("Commands:\n");
    for (nodus::core::u32 i = 0; i < n; ++i) {
        printf("  %s\n", specs[i].usage);
    }
    printf("\n");
    printf("Values: 42, 1.5, true, false, none, @<uid> (pointer to a stored object), text\n");
    printf("Frameworks: arith.add, arith.mul, arith.Accumulator (add, total, reset)\n");
}

void handle_store(Session& session, const Uid& id, const char* value_text, const char* cmd) {
    Value v;
    const Status s = nodus::cli::parse_value_token(value_text, session.node->id(), &v);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status(cmd, s);
        return;
    }
    nodus::net::Response r;
    if (round_trip(session, cmd, nodus::net::SaveObject{id, std::move(v)}, &r)) {
        printf("%s\n", nodus::core::uid_to_string(id).c_str());
    }
}

void handle_save(Session& session, const CliArgs& args) {
    Uid id{};
    const Status s = nodus::core::uid_generate(&id);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("save", s);
        return;
    }
    handle_store(session, id, args.argv[0], "save");
}

void handle_put(Session& session, const CliArgs& args) {
    Uid id{};
    if (parse_uid_arg("put", args.argv[0], &id)) {
        handle_store(session, id, args.argv[1], "put");
    }
}

void handle_get(Session& session, const CliArgs& args) {
    Uid id{};
    if (!parse_uid_arg("get", args.argv[0], &id)) {
        return;
    }
    nodus::net::Response r;
    if (round_trip(session, "get", nodus::net::GetObject{id}, &r)) {
        printf("%s\n", nodus::core::value_repr(r.payload).c_str());
    }
}

void handle_delete(Session& session, const CliArgs& args) {
    Uid id{};
    if (!parse_uid_arg("del", args.argv[0], &id)) {
        return;
    }
    nodus::net::Response r;
    if (round_trip(session, "del", nodus::net::DeleteObject{id}, &r)) {
        printf("deleted\n");
    }
}

void handle_call(Session& session, const CliArgs& args, bool store_result) {
    const char* cmd = store_result ? "callp" : "call";
    nodus::net::RunFunctionOrConstructor msg;
    msg.path = args.argv[0];
    Status s = nodus::cli::parse_value_args(CliArgs{args.argv + 1, args.argc - 1}, session.node->id(), &msg.args);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status(cmd, s);
        return;
    }
    if (store_result) {
        Uid result_id{};
        s = nodus::core::uid_generate(&result_id);
        if (!nodus::core::is_ok(s)) {
            nodus::core::log_status(cmd, s);
            return;
        }
        msg.result_id = result_id;
    }

    nodus::net::Response r;
    if (round_trip(session, cmd, msg, &r)) {
        printf("%s\n", nodus::core::value_repr(r.payload).c_str());
    }
}

void handle_method(Session& session, const CliArgs& args) {
    nodus::net::RunClassMethod msg;
    if (!parse_uid_arg("method", args.argv[0], &msg.uid)) {
        return;
    }
    msg.method_name = args.argv[1];
    const Status s = nodus::cli::parse_value_args(CliArgs{args.argv + 2, args.argc - 2}, session.node->id(), &msg.args);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("method", s);
        return;
    }
    nodus::net::Response r;
    if (round_trip(session, "method", msg, &r)) {
        printf("%s\n", nodus::core::value_repr(r.payload).c_str());
    }
}

void handle_list(Session& session) {
    const nodus::storage::ObjectStore& store = session.node->store();
    std::vector<Uid> ids;
    const Status s = store.list(&ids);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("ls", s);
        return;
    }
    if (ids.empty()) {
        printf("No objects on %s\n", session.node->id().c_str());
        return;
    }

    printf("%s: %zu objects\n", session.node->id().c_str(), ids.size());
    printf("%-36s  %-22s  %s\n", "UID", "Type", "Value");
    for (const Uid& id : ids) {
        Value v;
        if (!nodus::core::is_ok(store.get(id, &v))) {
            continue; // erased since list()
        }
        printf("%-36s  %-22s  %s\n",
               nodus::core::uid_to_string(id).c_str(),
               nodus::core::value_type_name(v).c_str(),
               nodus::core::value_repr(v).c_str());
    }
}

void handle_stat(Session& session, const CliArgs& args) {
    Uid id{};
    if (!parse_uid_arg("stat", args.argv[0], &id)) {
        return;
    }
    nodus::storage::ObjectMeta meta{};
    const Status s = session.node->store().meta(id, &meta);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("stat", s);
        return;
    }
    printf("uid:        %s\n", nodus::core::uid_to_string(id).c_str());
    if (meta.encodable) {
        printf("size:       %llu bytes\n", static_cast<unsigned long long>(meta.size_bytes));
    } else {
        printf("size:       unknown (not encodable)\n");
    }
    printf("version:    %u\n", meta.version);
    printf("created_at: %lld\n", static_cast<long long>(meta.created_at));
    printf("updated_at: %lld\n", static_cast<long long>(meta.updated_at));
    if (!nodus::storage::digest_is_zero(meta.digest)) {
        printf("blake3:     %s\n", nodus::storage::digest_to_hex(meta.digest).c_str());
    }
}

void handle_verify(Session& session, const CliArgs& args) {
    Uid id{};
    if (!parse_uid_arg("verify", args.argv[0], &id)) {
        return;
    }
    bool valid = false;
    const Status s = session.node->store().verify(id, &valid);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("verify", s);
        return;
    }
    printf("%s\n", valid ? "Object is valid" : "Object is CORRUPT");
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    CliConfig cfg;
    bool show_help = false;
    Status s = load_config(argc, argv, &cfg, &show_help);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("option parsing", s);
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    s = nodus::core::id_wrappers_register_defaults();
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("id wrapper registration", s);
        return EXIT_FAILURE;
    }

    Session session;
    s = open_session(cfg, &session);
    if (!nodus::core::is_ok(s)) {
        nodus::core::log_status("worker startup", s);
        return EXIT_FAILURE;
    }
    nodus::core::log_info("node %s ready (entropy: %s, digests: %s)",
            cfg.node_id.c_str(),
            nodus::security::random_backend_name(),
            cfg.store.compute_digests ? "on" : "off");

    nodus::core::u32 command_count = 0;
    const nodus::cli::CommandSpec* commands = nodus::cli::repl_command_specs(&command_count);

    printf("nodus - Interactive Mode\n");
    printf("node=%s\n", cfg.node_id.c_str());
    printf("Type 'help' for commands, 'q' to quit\n\n");

    std::vector<std::string> tokens;
    std::vector<const char*> cmd_argv;
    while (g_running) {
        printf("nodus> ");
        fflush(stdout);

        char line[4096];
        if (!fgets(line, sizeof(line), stdin)) {
            break; // EOF (Ctrl-D)
        }

        s = nodus::cli::tokenize_line(line, &tokens);
        if (!nodus::core::is_ok(s)) {
            print_error("unterminated quote");
            continue;
        }
        if (tokens.empty()) {
            continue;
        }
        cmd_argv.clear();
        for (const std::string& t : tokens) {
            cmd_argv.push_back(t.c_str());
        }

        nodus::cli::CommandInvocation cmd;
        nodus::core::u32 consumed = 0;
        const CliArgs args{cmd_argv.data(), static_cast<nodus::core::u32>(cmd_argv.size())};
        s = nodus::cli::parse_command(args, commands, command_count, &cmd, &consumed);
        if (s.code == nodus::core::StatusCode::NotFound) {
            print_error("unknown command");
            continue;
        }
        if (!nodus::core::is_ok(s)) {
            fprintf(stderr, "error: %s needs %u argument(s), see 'help'\n", cmd_argv[0], s.aux);
            continue;
        }

        switch (cmd.id) {
        case CommandId::Help: handle_help(); break;
        case CommandId::Save: handle_save(session, cmd.args); break;
        case CommandId::Put: handle_put(session, cmd.args); break;
        case CommandId::Get: handle_get(session, cmd.args); break;
        case CommandId::Delete: handle_delete(session, cmd.args); break;
        case CommandId::Call: handle_call(session, cmd.args, false); break;
        case CommandId::CallPointer: handle_call(session, cmd.args, true); break;
        case CommandId::Method: handle_method(session, cmd.args); break;
        case CommandId::List: handle_list(session); break;
        case CommandId::Stat: handle_stat(session, cmd.args); break;
        case CommandId::Verify: handle_verify(session, cmd.args); break;
        case CommandId::Stats: printf("%s\n", session.node->describe().c_str()); break;
        case CommandId::Quit: g_running = 0; break;
        default: print_error("unknown command"); break;
        }
    }

    session.node->shutdown();
    session.client->shutdown();
    printf("Goodbye!\n");
    return EXIT_SUCCESS;
}
