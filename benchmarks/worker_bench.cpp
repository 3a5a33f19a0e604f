#include <memory>
#include <vector>

#include <benchmark/benchmark.h>

#include "nodus/cli/arith.hpp"
#include "nodus/node/virtual_worker.hpp"

using namespace nodus::node;
using nodus::core::is_ok;
using nodus::core::Uid;
using nodus::core::Value;

namespace {
    std::unique_ptr<VirtualWorker> make_node(const char* id, bool with_arith) {
        WorkerConfig cfg;
        cfg.id = id;
        std::vector<Framework> fws;
        if (with_arith) {
            fws.push_back(nodus::cli::arith_framework());
        }
        std::unique_ptr<VirtualWorker> w;
        if (!is_ok(VirtualWorker::create(cfg, std::move(fws), &w))) {
            return nullptr;
        }
        return w;
    }
} // namespace

// ============================================================================
// In-Process Dispatch
// ============================================================================

static void BM_WorkerGetObject(benchmark::State& state) {
    auto node = make_node("node-a", false);
    Uid id{};
    (void)nodus::core::uid_generate(&id);
    if (!node || !node->recv_msg(nodus::net::SaveObject{id, Value(42)}).ok()) {
        state.SkipWithError("Setup failed");
        return;
    }

    for (auto _ : state) {
        nodus::net::Response r = node->recv_msg(nodus::net::GetObject{id});
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WorkerGetObject);

static void BM_WorkerMethodCall(benchmark::State& state) {
    auto node = make_node("node-a", true);
    Uid acc{};
    (void)nodus::core::uid_generate(&acc);
    if (!node || !node->recv_msg(nodus::net::RunFunctionOrConstructor{"arith.Accumulator", {}, acc}).ok()) {
        state.SkipWithError("Setup failed");
        return;
    }

    const nodus::net::Message msg = nodus::net::RunClassMethod{acc, "add", {Value(1)}, std::nullopt};
    for (auto _ : state) {
        nodus::net::Response r = node->recv_msg(msg);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WorkerMethodCall);

// ============================================================================
// Framed Round Trip
// ============================================================================

static void BM_VirtualWorkerRequest(benchmark::State& state) {
    auto node = make_node("node-a", true);
    auto client = make_node("node-a-client", false);
    if (!node || !client) {
        state.SkipWithError("Setup failed");
        return;
    }
    VirtualWorker::connect(*node, *client);

    const nodus::net::Message msg = nodus::net::RunFunctionOrConstructor{"arith.add", {Value(1), Value(2)}, std::nullopt};
    for (auto _ : state) {
        nodus::net::Response r;
        nodus::core::Status s = client->request(msg, &r);
        if (!is_ok(s)) {
            state.SkipWithError("Request failed");
            break;
        }
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VirtualWorkerRequest);
