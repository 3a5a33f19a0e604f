#include <benchmark/benchmark.h>
#include "nodus/storage/object_store.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace nodus::storage;
using namespace nodus::core;

namespace {
    std::vector<Uid> make_ids(size_t n) {
        std::vector<Uid> ids(n);
        for (auto& id : ids) {
            (void)uid_generate(&id);
        }
        return ids;
    }

    Value payload(size_t bytes) {
        return Value(std::string(bytes, 'x'));
    }
} // namespace

// ============================================================================
// Single-Threaded Save / Get
// ============================================================================

static void BM_ObjectSave(benchmark::State& state) {
    ObjectStoreConfig cfg;
    cfg.compute_digests = state.range(1) != 0;
    ObjectStore store(cfg);

    const Value v = payload(static_cast<size_t>(state.range(0)));
    const std::vector<Uid> ids = make_ids(1024);
    size_t i = 0;

    for (auto _ : state) {
        Status s = store.save(ids[i++ % ids.size()], v);
        if (!is_ok(s)) {
            state.SkipWithError("Save failed");
            break;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ObjectSave)
    ->Args({64, 0})
    ->Args({64, 1})
    ->Args({64 * 1024, 0})
    ->Args({64 * 1024, 1});

static void BM_ObjectGet(benchmark::State& state) {
    ObjectStore store;
    const std::vector<Uid> ids = make_ids(1024);
    for (const auto& id : ids) {
        if (!is_ok(store.save(id, payload(static_cast<size_t>(state.range(0)))))) {
            state.SkipWithError("Setup save failed");
            return;
        }
    }
    size_t i = 0;

    for (auto _ : state) {
        Value out;
        Status s = store.get(ids[i++ % ids.size()], &out);
        if (!is_ok(s)) {
            state.SkipWithError("Get failed");
            break;
        }
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ObjectGet)->Arg(64)->Arg(64 * 1024);

static void BM_ObjectUpdate(benchmark::State& state) {
    ObjectStore store;
    Uid id{};
    (void)uid_generate(&id);
    if (!is_ok(store.save(id, Value(i64{0})))) {
        state.SkipWithError("Setup save failed");
        return;
    }

    for (auto _ : state) {
        Status s = store.update(id, [](Value& v) -> Status {
            i64* n = v.get_if<i64>();
            if (n == nullptr) {
                return make_status(StatusDomain::Store, StatusCode::Corrupt);
            }
            ++*n;
            return ok_status();
        });
        if (!is_ok(s)) {
            state.SkipWithError("Update failed");
            break;
        }
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ObjectUpdate);

// ============================================================================
// Parallel Get Benchmarks
// ============================================================================

static void BM_ObjectParallelGet(benchmark::State& state) {
    const int num_threads = static_cast<int>(state.range(0));

    ObjectStore store;
    const std::vector<Uid> ids = make_ids(256);
    for (const auto& id : ids) {
        if (!is_ok(store.save(id, payload(256)))) {
            state.SkipWithError("Setup failed");
            return;
        }
    }

    for (auto _ : state) {
        std::vector<std::thread> threads;
        std::atomic<int> failures{0};

        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&store, &ids, &failures]() {
                for (const auto& id : ids) {
                    Value out;
                    if (!is_ok(store.get(id, &out))) {
                        failures.fetch_add(1);
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }
        if (failures.load() != 0) {
            state.SkipWithError("Get failed");
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * num_threads * static_cast<int64_t>(ids.size()));
}
BENCHMARK(BM_ObjectParallelGet)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Arg(8)
    ->UseRealTime();
