#pragma once

#include <array>
#include <mutex>
#include <string>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/net/message.hpp"

namespace nodus::node {
    using u64 = nodus::core::u64;

    // One dispatch as seen by the worker.
    struct DispatchSample {
        nodus::net::MsgKind kind{nodus::net::MsgKind::None};
        nodus::core::Status status{};
        u64 elapsed_ns{0};
    };

    // Observer injected into a Worker. record() runs on the dispatching thread
    // after the handler has returned.
    class StatsCollector {
    public:
        virtual ~StatsCollector() = default;

        virtual void record(const DispatchSample& sample) noexcept = 0;

        // Multi-line text summary. Empty if the collector has nothing to show.
        [[nodiscard]] virtual std::string report() const { return {}; }
    };

    struct KindStats {
        u64 count{0};
        u64 failures{0};
        u64 total_ns{0};
        u64 max_ns{0};
    };

    class WorkerStats final : public StatsCollector {
    public:
        void record(const DispatchSample& sample) noexcept override;

        // One line per message kind with at least one dispatch:
        //   <kind> count=<n> failures=<n> avg_us=<n> max_us=<n>
        [[nodiscard]] std::string report() const override;

        [[nodiscard]] KindStats kind(nodus::net::MsgKind k) const noexcept;
        [[nodiscard]] u64 total() const noexcept;
        void reset() noexcept;

    private:
        mutable std::mutex mutex_;
        std::array<KindStats, nodus::net::kMsgKindCount> kinds_{};
    };

} // namespace nodus::node
