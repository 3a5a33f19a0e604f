#pragma once

#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/core/uid.hpp"
#include "nodus/core/value.hpp"

namespace nodus::storage {

using u32 = nodus::core::u32;
using u64 = nodus::core::u64;

// Object store configuration
struct ObjectStoreConfig {
    u32 max_entries{0};           // Maximum live entries (0 = unlimited)
    bool compute_digests{true};   // Keep a BLAKE3 digest of each stored object
};

// Per-entry metadata, refreshed on every write
struct ObjectMeta {
    u64 size_bytes{0};            // Encoded size of the object
    nodus::core::Hash256 digest{};// BLAKE3 of the encoded object (zero if digests are off)
    u32 version{0};               // Number of writes, 1 after the first save
    nodus::core::Timestamp created_at{0};
    nodus::core::Timestamp updated_at{0};
    bool encodable{true};         // false: size and digest are zero, verify is Unsupported
};

// ========================================================================
// Object Store
// ========================================================================
//
// Keyed table from UID to owned object. One entry per UID. Every public
// operation takes the store mutex, so a reader never sees a half-written entry.

class ObjectStore {
public:
    ObjectStore() noexcept = default;
    explicit ObjectStore(const ObjectStoreConfig& cfg) noexcept : cfg_(cfg) {}

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // Insert or overwrite (last write wins). Overwriting keeps created_at and
    // bumps version. A value the layout cannot encode is stored anyway with
    // meta.encodable = false.
    // - Unavailable if a new key would exceed max_entries
    [[nodiscard]] nodus::core::Status save(const nodus::core::Uid& id, nodus::core::Value object) noexcept;

    // Insert only. An existing key is a Conflict: this is how two distinct
    // objects landing on one UID get detected.
    [[nodiscard]] nodus::core::Status save_new(const nodus::core::Uid& id, nodus::core::Value object) noexcept;

    // NotFound if absent
    [[nodiscard]] nodus::core::Status get(const nodus::core::Uid& id, nodus::core::Value* out) const noexcept;

    // NotFound if absent
    [[nodiscard]] nodus::core::Status erase(const nodus::core::Uid& id) noexcept;

    [[nodiscard]] nodus::core::Status meta(const nodus::core::Uid& id, ObjectMeta* out) const noexcept;

    // Re-encodes the object and compares against the recorded digest.
    // Unsupported when digests are disabled or the object could not be
    // encoded when it was stored (aux = 1).
    [[nodiscard]] nodus::core::Status verify(const nodus::core::Uid& id, bool* valid) const noexcept;

    // Runs fn(Value&) -> Status on a copy of the stored object under the
    // store lock. The copy replaces the object only if fn succeeds; a failed
    // or throwing fn leaves object and metadata untouched. Exceptions from
    // fn propagate to the caller.
    template <typename Fn>
    [[nodiscard]] nodus::core::Status update(const nodus::core::Uid& id, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return nodus::core::make_status(nodus::core::StatusDomain::Store, nodus::core::StatusCode::NotFound);
        }
        nodus::core::Value next = it->second.object;
        const nodus::core::Status s = std::forward<Fn>(fn)(next);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        it->second.object = std::move(next);
        refresh_meta(it->second, nodus::core::now_micros());
        return nodus::core::ok_status();
    }

    [[nodiscard]] bool contains(const nodus::core::Uid& id) const noexcept;
    [[nodiscard]] u64 size() const noexcept;

    // All keys, sorted.
    [[nodiscard]] nodus::core::Status list(std::vector<nodus::core::Uid>* out) const noexcept;

    void clear() noexcept;

    [[nodiscard]] const ObjectStoreConfig& config() const noexcept { return cfg_; }

private:
    struct Entry {
        nodus::core::Value object;
        ObjectMeta meta;
    };

    [[nodiscard]] nodus::core::Status insert_locked(const nodus::core::Uid& id,
                                                    nodus::core::Value object,
                                                    bool allow_overwrite) noexcept;
    void refresh_meta(Entry& e, nodus::core::Timestamp now) const noexcept;

    ObjectStoreConfig cfg_{};
    mutable std::mutex mutex_;
    std::unordered_map<nodus::core::Uid, Entry> entries_;
};

} // namespace nodus::storage
