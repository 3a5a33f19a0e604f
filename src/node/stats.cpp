#include "nodus/node/stats.hpp"

#include <cinttypes>
#include <cstdio>

namespace nodus::node {
    using nodus::net::MsgKind;

    namespace {
        std::size_t slot_of(MsgKind k) noexcept {
            const auto i = static_cast<std::size_t>(k);
            // Kinds outside the table share slot 0 with None.
            return i < nodus::net::kMsgKindCount ? i : 0;
        }
    } // namespace

    void WorkerStats::record(const DispatchSample& sample) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        KindStats& k = kinds_[slot_of(sample.kind)];
        k.count++;
        if (!nodus::core::is_ok(sample.status)) {
            k.failures++;
        }
        k.total_ns += sample.elapsed_ns;
        if (sample.elapsed_ns > k.max_ns) {
            k.max_ns = sample.elapsed_ns;
        }
    }

    std::string WorkerStats::report() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        char line[160];
        for (std::size_t i = 0; i < kinds_.size(); ++i) {
            const KindStats& k = kinds_[i];
            if (k.count == 0) {
                continue;
            }
            const u64 avg_us = (k.total_ns / k.count) / 1000u;
            std::snprintf(line, sizeof(line),
                "%s count=%" PRIu64 " failures=%" PRIu64 " avg_us=%" PRIu64 " max_us=%" PRIu64 "\n",
                nodus::net::msg_kind_name(static_cast<MsgKind>(i)),
                k.count,
                k.failures,
                avg_us,
                k.max_ns / 1000u);
            out += line;
        }
        return out;
    }

    KindStats WorkerStats::kind(MsgKind k) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return kinds_[slot_of(k)];
    }

    u64 WorkerStats::total() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        u64 n = 0;
        for (const KindStats& k : kinds_) {
            n += k.count;
        }
        return n;
    }

    void WorkerStats::reset() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        kinds_.fill(KindStats{});
    }
} // namespace nodus::node
