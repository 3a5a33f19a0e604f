#pragma once

#include "nodus/net/message.hpp"
#include "nodus/node/router.hpp"

namespace nodus::node {
    // Handlers behind default_router(). Each expects the matching message
    // alternative and answers Router/UnknownKind if handed another one.

    [[nodiscard]] nodus::net::Response handle_save_object(DispatchContext& ctx, const nodus::net::Message& msg);
    [[nodiscard]] nodus::net::Response handle_get_object(DispatchContext& ctx, const nodus::net::Message& msg);
    [[nodiscard]] nodus::net::Response handle_delete_object(DispatchContext& ctx, const nodus::net::Message& msg);

    // Runs a method on a stored Instance. The target may be a stored local
    // Pointer (one hop). The method may mutate the stored instance.
    [[nodiscard]] nodus::net::Response handle_run_class_method(DispatchContext& ctx, const nodus::net::Message& msg);

    // Calls a framework function, or constructs an Instance of a framework class.
    [[nodiscard]] nodus::net::Response handle_run_function_or_constructor(DispatchContext& ctx,
                                                                          const nodus::net::Message& msg);

} // namespace nodus::node
