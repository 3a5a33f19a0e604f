#pragma once

#include <array>
#include <initializer_list>
#include <string>

#include "nodus/net/message.hpp"
#include "nodus/node/framework.hpp"
#include "nodus/storage/object_store.hpp"

namespace nodus::node {

    // What a handler may touch while serving one message.
    struct DispatchContext {
        const std::string& node_id;
        nodus::storage::ObjectStore& store;
        const FrameworkRegistry& frameworks;
    };

    using Handler = nodus::net::Response (*)(DispatchContext& ctx, const nodus::net::Message& msg);

    struct Route {
        nodus::net::MsgKind kind{nodus::net::MsgKind::None};
        Handler handler{nullptr};
    };

    // Fixed table from message kind to handler, indexed by the kind value.
    class Router {
    public:
        Router() noexcept = default;

        // Later routes for the same kind replace earlier ones. Routes with
        // an out-of-range kind are ignored.
        Router(std::initializer_list<Route> routes) noexcept;

        [[nodiscard]] bool handles(nodus::net::MsgKind kind) const noexcept;

        // Exactly one response. A kind with no handler answers Router/UnknownKind.
        [[nodiscard]] nodus::net::Response dispatch(DispatchContext& ctx, const nodus::net::Message& msg) const;

    private:
        std::array<Handler, nodus::net::kMsgKindCount> table_{};
    };

    // Shared router with a handler for every message kind. Built once.
    [[nodiscard]] const Router& default_router() noexcept;

} // namespace nodus::node
