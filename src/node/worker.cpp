#include "nodus/node/worker.hpp"

#include <chrono>

#include "nodus/core/id_wrappers.hpp"
#include "nodus/core/log.hpp"

namespace nodus::node {
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;

    const char* worker_state_name(WorkerState s) noexcept {
        switch (s) {
        case WorkerState::Constructing: return "constructing";
        case WorkerState::Ready: return "ready";
        case WorkerState::ShuttingDown: return "shutting-down";
        }
        return "unknown";
    }

    Worker::Worker(WorkerConfig cfg)
        : cfg_(std::move(cfg)), store_(cfg_.store), router_(&default_router()) {}

    Status Worker::create(WorkerConfig cfg, std::vector<Framework> frameworks, std::unique_ptr<Worker>* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Worker, StatusCode::Invalid);
        }
        std::unique_ptr<Worker> w(new Worker(std::move(cfg)));
        const Status s = w->init(std::move(frameworks));
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        *out = std::move(w);
        return nodus::core::ok_status();
    }

    Status Worker::init(std::vector<Framework> frameworks) {
        // Stored Uuid16 values are encoded through the wrapper registry.
        const Status reg = nodus::core::id_wrappers_register_defaults();
        if (!nodus::core::is_ok(reg)) {
            return reg;
        }

        for (Framework& fw : frameworks) {
            const std::string name = fw.name;
            const Status s = frameworks_.add(std::move(fw));
            if (!nodus::core::is_ok(s)) {
                nodus::core::log_error("worker %s: cannot register framework '%s'", cfg_.id.c_str(), name.c_str());
                return s;
            }
        }

        if (cfg_.stats != nullptr) {
            stats_ = cfg_.stats;
        } else if (cfg_.debug) {
            owned_stats_ = std::make_unique<WorkerStats>();
            stats_ = owned_stats_.get();
        }

        state_ = WorkerState::Ready;
        nodus::core::log_debug(cfg_.debug, "worker %s ready (%u frameworks)", cfg_.id.c_str(), frameworks_.size());
        return nodus::core::ok_status();
    }

    nodus::net::Response Worker::recv_msg(const nodus::net::Message& msg) {
        const nodus::net::MsgKind kind = nodus::net::msg_kind(msg);
        if (state_ != WorkerState::Ready) {
            return nodus::net::response_failure(kind, make_status(StatusDomain::Worker, StatusCode::Unavailable));
        }

        DispatchContext ctx{cfg_.id, store_, frameworks_};
        const auto t0 = std::chrono::steady_clock::now();
        nodus::net::Response r = router_->dispatch(ctx, msg);
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - t0);

        if (stats_ != nullptr) {
            stats_->record(DispatchSample{kind, r.status, static_cast<u64>(elapsed.count())});
        }
        if (r.status.code == StatusCode::UnknownKind) {
            nodus::core::log_status(nodus::net::msg_kind_name(kind), r.status);
        }
        nodus::core::log_debug(cfg_.debug,
            "worker %s: %s -> %s/%s (%lldus)",
            cfg_.id.c_str(),
            nodus::net::msg_kind_name(kind),
            nodus::core::status_domain_name(r.status.domain),
            nodus::core::status_code_name(r.status.code),
            static_cast<long long>(elapsed.count() / 1000));
        return r;
    }

    Status Worker::send_msg(nodus::core::BufferView) {
        return make_status(StatusDomain::Worker, StatusCode::NotImplemented);
    }

    Status Worker::recv_bytes(std::vector<u8>*) {
        return make_status(StatusDomain::Worker, StatusCode::NotImplemented);
    }

    void Worker::shutdown() noexcept {
        if (state_ == WorkerState::ShuttingDown) {
            return;
        }
        state_ = WorkerState::ShuttingDown;
        nodus::core::log_debug(cfg_.debug, "worker %s shutting down", cfg_.id.c_str());
    }

    std::string Worker::describe() const {
        if (stats_ == nullptr) {
            return "Worker id:" + cfg_.id;
        }
        return "Worker: " + cfg_.id + "\n" + stats_->report();
    }
} // namespace nodus::node
