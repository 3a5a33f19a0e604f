#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/net/message.hpp"
#include "nodus/node/framework.hpp"
#include "nodus/node/router.hpp"
#include "nodus/node/stats.hpp"
#include "nodus/storage/object_store.hpp"

namespace nodus::node {

    struct WorkerConfig {
        std::string id;                       // node id, used as Pointer location
        bool debug{false};                    // log every dispatch, attach WorkerStats
        StatsCollector* stats{nullptr};       // not owned; must outlive the worker
        nodus::storage::ObjectStoreConfig store{};
    };

    enum class WorkerState : u8 {
        Constructing = 0,
        Ready,
        ShuttingDown,
    };

    [[nodiscard]] const char* worker_state_name(WorkerState s) noexcept;

    // ========================================================================
    // Worker
    // ========================================================================
    //
    // A node: one object store, the shared router, and the frameworks it can
    // run. recv_msg is the only way in. Transport is left to subclasses.

    class Worker {
    public:
        // Registers 'frameworks' in order. A duplicate name fails with
        // Worker/DuplicateFramework and leaves *out untouched.
        [[nodiscard]] static nodus::core::Status create(WorkerConfig cfg,
                                                        std::vector<Framework> frameworks,
                                                        std::unique_ptr<Worker>* out);

        Worker(const Worker&) = delete;
        Worker& operator=(const Worker&) = delete;
        virtual ~Worker() = default;

        // Dispatches one message and returns its single response. Refuses
        // with Worker/Unavailable unless Ready.
        [[nodiscard]] nodus::net::Response recv_msg(const nodus::net::Message& msg);

        // Outgoing bytes. NotImplemented here.
        [[nodiscard]] virtual nodus::core::Status send_msg(nodus::core::BufferView bytes);

        // Next incoming frame. NotImplemented here.
        [[nodiscard]] virtual nodus::core::Status recv_bytes(std::vector<u8>* out);

        void shutdown() noexcept;

        // "Worker id:<id>", or "Worker: <id>" plus the stats report.
        [[nodiscard]] std::string describe() const;

        [[nodiscard]] const std::string& id() const noexcept { return cfg_.id; }
        [[nodiscard]] WorkerState state() const noexcept { return state_; }
        [[nodiscard]] bool debug() const noexcept { return cfg_.debug; }
        [[nodiscard]] nodus::storage::ObjectStore& store() noexcept { return store_; }
        [[nodiscard]] const nodus::storage::ObjectStore& store() const noexcept { return store_; }
        [[nodiscard]] const FrameworkRegistry& frameworks() const noexcept { return frameworks_; }
        [[nodiscard]] StatsCollector* stats() const noexcept { return stats_; }

    protected:
        explicit Worker(WorkerConfig cfg);

        // Second construction phase, shared with subclasses' factories.
        [[nodiscard]] nodus::core::Status init(std::vector<Framework> frameworks);

    private:
        WorkerConfig cfg_;
        WorkerState state_{WorkerState::Constructing};
        nodus::storage::ObjectStore store_;
        const Router* router_;
        FrameworkRegistry frameworks_;
        std::unique_ptr<WorkerStats> owned_stats_;
        StatsCollector* stats_{nullptr};
    };

} // namespace nodus::node
