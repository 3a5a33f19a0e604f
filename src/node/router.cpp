#include "nodus/node/router.hpp"

#include "nodus/node/services.hpp"

namespace nodus::node {
    using nodus::core::make_status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::net::MsgKind;

    Router::Router(std::initializer_list<Route> routes) noexcept {
        for (const Route& r : routes) {
            const auto i = static_cast<std::size_t>(r.kind);
            if (r.kind == MsgKind::None || i >= table_.size()) {
                continue;
            }
            table_[i] = r.handler;
        }
    }

    bool Router::handles(MsgKind kind) const noexcept {
        const auto i = static_cast<std::size_t>(kind);
        return i < table_.size() && table_[i] != nullptr;
    }

    nodus::net::Response Router::dispatch(DispatchContext& ctx, const nodus::net::Message& msg) const {
        const MsgKind kind = nodus::net::msg_kind(msg);
        if (!handles(kind)) {
            return nodus::net::response_failure(kind,
                make_status(StatusDomain::Router, StatusCode::UnknownKind, static_cast<nodus::core::u32>(kind)));
        }
        return table_[static_cast<std::size_t>(kind)](ctx, msg);
    }

    const Router& default_router() noexcept {
        static const Router router{
            {MsgKind::SaveObject, &handle_save_object},
            {MsgKind::GetObject, &handle_get_object},
            {MsgKind::DeleteObject, &handle_delete_object},
            {MsgKind::RunClassMethod, &handle_run_class_method},
            {MsgKind::RunFunctionOrConstructor, &handle_run_function_or_constructor},
        };
        return router;
    }
} // namespace nodus::node
