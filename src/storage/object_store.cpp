#include "nodus/storage/object_store.hpp"

#include <algorithm>

#include "nodus/storage/hashing.hpp"
#include "nodus/storage/layout.hpp"

namespace nodus::storage {

using namespace nodus::core;

// ========================================================================
// Internal Helpers
// ========================================================================

void ObjectStore::refresh_meta(Entry& e, Timestamp now) const noexcept {
    ObjectMeta m = e.meta;
    m.size_bytes = 0;
    m.digest = Hash256{};
    m.encodable = false;

    // Metadata is best effort: a value the layout cannot encode is still stored.
    std::vector<u8> encoded;
    if (is_ok(layout_encode_value(e.object, &encoded))) {
        m.size_bytes = static_cast<u64>(encoded.size());
        m.encodable = true;
        if (cfg_.compute_digests &&
            !is_ok(digest_compute({encoded.data(), static_cast<u32>(encoded.size())}, &m.digest))) {
            m.digest = Hash256{};
            m.encodable = false;
        }
    }
    if (m.version == 0) {
        m.created_at = now;
    }
    m.version += 1;
    m.updated_at = now;

    e.meta = m;
}

Status ObjectStore::insert_locked(const Uid& id, Value object, bool allow_overwrite) noexcept {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        if (!allow_overwrite) {
            return make_status(StatusDomain::Store, StatusCode::Conflict);
        }
        it->second.object = std::move(object);
        refresh_meta(it->second, now_micros());
        return ok_status();
    }

    if (cfg_.max_entries > 0 && entries_.size() >= cfg_.max_entries) {
        return make_status(StatusDomain::Store, StatusCode::Unavailable, cfg_.max_entries);
    }

    Entry e{std::move(object), ObjectMeta{}};
    refresh_meta(e, now_micros());
    entries_.emplace(id, std::move(e));
    return ok_status();
}

// ========================================================================
// Public API Implementation
// ========================================================================

Status ObjectStore::save(const Uid& id, Value object) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_locked(id, std::move(object), true);
}

Status ObjectStore::save_new(const Uid& id, Value object) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_locked(id, std::move(object), false);
}

Status ObjectStore::get(const Uid& id, Value* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }
    *out = it->second.object;
    return ok_status();
}

Status ObjectStore::erase(const Uid& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(id) == 0) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }
    return ok_status();
}

Status ObjectStore::meta(const Uid& id, ObjectMeta* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }
    *out = it->second.meta;
    return ok_status();
}

Status ObjectStore::verify(const Uid& id, bool* valid) const noexcept {
    if (!valid) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    if (!cfg_.compute_digests) {
        return make_status(StatusDomain::Store, StatusCode::Unsupported);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }
    if (!it->second.meta.encodable) {
        return make_status(StatusDomain::Store, StatusCode::Unsupported, 1);
    }

    std::vector<u8> encoded;
    Status s = layout_encode_value(it->second.object, &encoded);
    if (!is_ok(s)) {
        return s;
    }

    Hash256 digest{};
    s = digest_compute({encoded.data(), static_cast<u32>(encoded.size())}, &digest);
    if (!is_ok(s)) {
        return s;
    }

    *valid = digest == it->second.meta.digest &&
             static_cast<u64>(encoded.size()) == it->second.meta.size_bytes;
    return ok_status();
}

bool ObjectStore::contains(const Uid& id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

u64 ObjectStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<u64>(entries_.size());
}

Status ObjectStore::list(std::vector<Uid>* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    out->reserve(entries_.size());
    for (const auto& kv : entries_) {
        out->push_back(kv.first);
    }
    std::sort(out->begin(), out->end());
    return ok_status();
}

void ObjectStore::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace nodus::storage
