#include "nodus/node/services.hpp"

#include <exception>
#include <optional>
#include <utility>
#include <variant>

#include "nodus/core/log.hpp"

namespace nodus::node {
    using nodus::core::Instance;
    using nodus::core::List;
    using nodus::core::make_status;
    using nodus::core::Pointer;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::core::Uid;
    using nodus::core::Value;
    using nodus::net::Message;
    using nodus::net::MsgKind;
    using nodus::net::Response;

    namespace {
        Response wrong_kind(const Message& msg) {
            return nodus::net::response_failure(nodus::net::msg_kind(msg),
                make_status(StatusDomain::Router, StatusCode::UnknownKind));
        }

        Status worker_status(StatusCode code) noexcept {
            return make_status(StatusDomain::Worker, code);
        }

        // Framework callables are foreign code. A std::exception thrown by one
        // becomes External/Unknown so the message still gets its response.
        template <typename Fn>
        Status invoke_callable(const char* what, const std::string& name, Fn&& fn) {
            try {
                return std::forward<Fn>(fn)();
            } catch (const std::exception& e) {
                nodus::core::log_error("%s %s threw: %s", what, name.c_str(), e.what());
                return make_status(StatusDomain::External, StatusCode::Unknown);
            }
        }

        // Follows a Pointer that lives on this node to the object it names.
        // Remote pointers and pointer-to-pointer chains are refused.
        Status follow_local(DispatchContext& ctx, const Pointer& p, Uid* target, Value* out) {
            if (!nodus::core::pointer_is_local(p, ctx.node_id)) {
                return worker_status(StatusCode::UnsupportedIndirection);
            }
            Value v;
            const Status s = ctx.store.get(p.id, &v);
            if (!nodus::core::is_ok(s)) {
                return s;
            }
            if (v.get_if<Pointer>() != nullptr) {
                return worker_status(StatusCode::UnsupportedIndirection);
            }
            *target = p.id;
            *out = std::move(v);
            return nodus::core::ok_status();
        }

        // Local pointer arguments are replaced by their pointee; remote
        // pointers travel as plain values.
        Status resolve_args(DispatchContext& ctx, const ArgList& in, ArgList* out) {
            out->clear();
            out->reserve(in.size());
            for (const Value& arg : in) {
                const Pointer* p = arg.get_if<Pointer>();
                if (p == nullptr || !nodus::core::pointer_is_local(*p, ctx.node_id)) {
                    out->push_back(arg);
                    continue;
                }
                Uid ignored{};
                Value resolved;
                const Status s = follow_local(ctx, *p, &ignored, &resolved);
                if (!nodus::core::is_ok(s)) {
                    return s;
                }
                out->push_back(std::move(resolved));
            }
            return nodus::core::ok_status();
        }

        Response deliver(DispatchContext& ctx, MsgKind kind, Value result, const std::optional<Uid>& result_id) {
            if (!result_id.has_value()) {
                return nodus::net::response_value(kind, std::move(result));
            }
            std::string type = nodus::core::value_type_name(result);
            const Status s = ctx.store.save_new(*result_id, std::move(result));
            if (!nodus::core::is_ok(s)) {
                return nodus::net::response_failure(kind, s);
            }
            return nodus::net::response_value(kind, Pointer{*result_id, ctx.node_id, std::move(type)});
        }
    } // namespace

    Response handle_save_object(DispatchContext& ctx, const Message& msg) {
        const auto* m = std::get_if<nodus::net::SaveObject>(&msg);
        if (m == nullptr) {
            return wrong_kind(msg);
        }
        const Status s = ctx.store.save(m->uid, m->object);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(MsgKind::SaveObject, s);
        }
        return nodus::net::response_ack(MsgKind::SaveObject);
    }

    Response handle_get_object(DispatchContext& ctx, const Message& msg) {
        const auto* m = std::get_if<nodus::net::GetObject>(&msg);
        if (m == nullptr) {
            return wrong_kind(msg);
        }
        Value v;
        const Status s = ctx.store.get(m->uid, &v);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(MsgKind::GetObject, s);
        }
        return nodus::net::response_value(MsgKind::GetObject, std::move(v));
    }

    Response handle_delete_object(DispatchContext& ctx, const Message& msg) {
        const auto* m = std::get_if<nodus::net::DeleteObject>(&msg);
        if (m == nullptr) {
            return wrong_kind(msg);
        }
        const Status s = ctx.store.erase(m->uid);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(MsgKind::DeleteObject, s);
        }
        return nodus::net::response_ack(MsgKind::DeleteObject);
    }

    Response handle_run_class_method(DispatchContext& ctx, const Message& msg) {
        const auto* m = std::get_if<nodus::net::RunClassMethod>(&msg);
        if (m == nullptr) {
            return wrong_kind(msg);
        }
        constexpr MsgKind kind = MsgKind::RunClassMethod;

        Value target;
        Status s = ctx.store.get(m->uid, &target);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, s);
        }

        Uid target_id = m->uid;
        if (const Pointer* p = target.get_if<Pointer>()) {
            const Pointer hop = *p;
            s = follow_local(ctx, hop, &target_id, &target);
            if (!nodus::core::is_ok(s)) {
                return nodus::net::response_failure(kind, s);
            }
        }

        const Instance* inst = target.get_if<Instance>();
        if (inst == nullptr) {
            return nodus::net::response_failure(kind, worker_status(StatusCode::NotFound));
        }

        const AstNode* node = nullptr;
        s = ctx.frameworks.resolve(inst->type, &node);
        if (!nodus::core::is_ok(s) || node->kind != AstNodeKind::Class) {
            return nodus::net::response_failure(kind, worker_status(StatusCode::NotFound));
        }
        auto it = node->methods.find(m->method_name);
        if (it == node->methods.end() || !it->second) {
            return nodus::net::response_failure(kind, worker_status(StatusCode::NotFound));
        }

        ArgList args;
        s = resolve_args(ctx, m->args, &args);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, s);
        }

        // The method runs against the stored instance so that mutations stick.
        const MethodFn& method = it->second;
        const std::string& type = inst->type;
        Value result;
        s = ctx.store.update(target_id, [&](Value& obj) -> Status {
            Instance* live = obj.get_if<Instance>();
            if (live == nullptr || live->type != type) {
                return worker_status(StatusCode::NotFound);
            }
            return invoke_callable("method", m->method_name, [&] { return method(*live, args, &result); });
        });
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, s);
        }
        return deliver(ctx, kind, std::move(result), m->result_id);
    }

    Response handle_run_function_or_constructor(DispatchContext& ctx, const Message& msg) {
        const auto* m = std::get_if<nodus::net::RunFunctionOrConstructor>(&msg);
        if (m == nullptr) {
            return wrong_kind(msg);
        }
        constexpr MsgKind kind = MsgKind::RunFunctionOrConstructor;

        const AstNode* node = nullptr;
        Status s = ctx.frameworks.resolve(m->path, &node);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, worker_status(StatusCode::NotFound));
        }

        ArgList args;
        s = resolve_args(ctx, m->args, &args);
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, s);
        }

        Value result;
        switch (node->kind) {
        case AstNodeKind::Function:
            if (!node->function) {
                return nodus::net::response_failure(kind, worker_status(StatusCode::Unsupported));
            }
            s = invoke_callable("function", m->path, [&] { return node->function(args, &result); });
            break;
        case AstNodeKind::Class: {
            if (!node->constructor) {
                return nodus::net::response_failure(kind, worker_status(StatusCode::Unsupported));
            }
            List fields;
            s = invoke_callable("constructor", m->path, [&] { return node->constructor(args, &fields); });
            if (nodus::core::is_ok(s)) {
                result = Value(Instance{m->path, std::move(fields)});
            }
            break;
        }
        default:
            s = worker_status(StatusCode::Unsupported);
            break;
        }
        if (!nodus::core::is_ok(s)) {
            return nodus::net::response_failure(kind, s);
        }
        return deliver(ctx, kind, std::move(result), m->result_id);
    }
} // namespace nodus::node
