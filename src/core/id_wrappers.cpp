#include "nodus/core/id_wrappers.hpp"

#include <array>
#include <mutex>

namespace nodus::core {
    namespace {
        struct RegistryState {
            std::array<IdWrapperAdapter, kMaxIdWrappers> adapters{};
            u32 count{0};
            std::mutex mutex;
        };

        RegistryState& registry() noexcept {
            static RegistryState state;
            return state;
        }

        Uid wrap_uuid16(const Uuid16& raw) noexcept {
            return Uid{raw}.wrapped();
        }

        Uuid16 unwrap_uuid16(const Uid& id) noexcept {
            return id.value();
        }
    } // namespace

    Status id_wrapper_register(const IdWrapperAdapter& adapter) noexcept {
        if (adapter.type == ForeignIdType::None || adapter.wrap == nullptr || adapter.unwrap == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }

        RegistryState& st = registry();
        std::lock_guard<std::mutex> lock(st.mutex);

        for (u32 i = 0; i < st.count; ++i) {
            if (st.adapters[i].type == adapter.type) {
                return make_status(StatusDomain::Identity, StatusCode::Conflict, static_cast<u32>(adapter.type));
            }
        }
        if (st.count >= kMaxIdWrappers) {
            return make_status(StatusDomain::Identity, StatusCode::Unavailable);
        }
        st.adapters[st.count++] = adapter;
        return ok_status();
    }

    Status id_wrapper_find(ForeignIdType type, IdWrapperAdapter* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }

        RegistryState& st = registry();
        std::lock_guard<std::mutex> lock(st.mutex);

        for (u32 i = 0; i < st.count; ++i) {
            if (st.adapters[i].type == type) {
                *out = st.adapters[i];
                return ok_status();
            }
        }
        return make_status(StatusDomain::Identity, StatusCode::NotFound, static_cast<u32>(type));
    }

    Status id_wrappers_register_defaults() noexcept {
        IdWrapperAdapter existing{};
        if (is_ok(id_wrapper_find(ForeignIdType::Uuid16, &existing))) {
            return ok_status();
        }

        IdWrapperAdapter a{};
        a.type = ForeignIdType::Uuid16;
        a.name = "uuid16";
        a.wrap = &wrap_uuid16;
        a.unwrap = &unwrap_uuid16;
        return id_wrapper_register(a);
    }

    void id_wrappers_clear() noexcept {
        RegistryState& st = registry();
        std::lock_guard<std::mutex> lock(st.mutex);
        st.adapters = {};
        st.count = 0;
    }
} // namespace nodus::core
