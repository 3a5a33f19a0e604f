#include "nodus/net/message.hpp"

namespace nodus::net {
    MsgKind msg_kind(const Message& msg) noexcept {
        switch (msg.index()) {
        case 0: return MsgKind::SaveObject;
        case 1: return MsgKind::GetObject;
        case 2: return MsgKind::DeleteObject;
        case 3: return MsgKind::RunClassMethod;
        case 4: return MsgKind::RunFunctionOrConstructor;
        default: return MsgKind::None;
        }
    }

    const char* msg_kind_name(MsgKind kind) noexcept {
        switch (kind) {
        case MsgKind::None: return "None";
        case MsgKind::SaveObject: return "SaveObject";
        case MsgKind::GetObject: return "GetObject";
        case MsgKind::DeleteObject: return "DeleteObject";
        case MsgKind::RunClassMethod: return "RunClassMethod";
        case MsgKind::RunFunctionOrConstructor: return "RunFunctionOrConstructor";
        }
        return "Unknown";
    }

    bool msg_kind_valid_u16(u16 v) noexcept {
        switch (static_cast<MsgKind>(v)) {
        case MsgKind::SaveObject:
        case MsgKind::GetObject:
        case MsgKind::DeleteObject:
        case MsgKind::RunClassMethod:
        case MsgKind::RunFunctionOrConstructor:
            return true;
        default:
            return false;
        }
    }

    Message pointer_get_message(const nodus::core::Pointer& p) {
        return GetObject{p.id};
    }

    Message pointer_delete_message(const nodus::core::Pointer& p) {
        return DeleteObject{p.id};
    }

    Message pointer_method_message(const nodus::core::Pointer& p,
        std::string method_name,
        ArgList args,
        std::optional<nodus::core::Uid> result_id) {
        return RunClassMethod{p.id, std::move(method_name), std::move(args), result_id};
    }
} // namespace nodus::net
