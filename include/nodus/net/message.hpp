#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/pointer.hpp"
#include "nodus/core/types.hpp"
#include "nodus/core/uid.hpp"
#include "nodus/core/value.hpp"

namespace nodus::net {
    using u8 = nodus::core::u8;
    using u16 = nodus::core::u16;
    using u32 = nodus::core::u32;

    enum class MsgKind : u16 {
        None = 0,
        SaveObject = 1,
        GetObject = 2,
        DeleteObject = 3,
        RunClassMethod = 4,
        RunFunctionOrConstructor = 5,
    };

    inline constexpr u32 kMsgKindCount = 6;

    using ArgList = std::vector<nodus::core::Value>;

    struct SaveObject {
        nodus::core::Uid uid{};
        nodus::core::Value object{};
    };

    struct GetObject {
        nodus::core::Uid uid{};
    };

    struct DeleteObject {
        nodus::core::Uid uid{};
    };

    // result_id set: the result is stored under it and the reply is a Pointer.
    // result_id empty: the result comes back inline.
    struct RunClassMethod {
        nodus::core::Uid uid{};
        std::string method_name;
        ArgList args;
        std::optional<nodus::core::Uid> result_id;
    };

    struct RunFunctionOrConstructor {
        std::string path;
        ArgList args;
        std::optional<nodus::core::Uid> result_id;
    };

    using Message = std::variant<SaveObject, GetObject, DeleteObject, RunClassMethod, RunFunctionOrConstructor>;

    [[nodiscard]] MsgKind msg_kind(const Message& msg) noexcept;
    [[nodiscard]] const char* msg_kind_name(MsgKind kind) noexcept;
    [[nodiscard]] bool msg_kind_valid_u16(u16 v) noexcept;

    // Exactly one per dispatched message. An ok status with a None payload is
    // a plain acknowledgement.
    struct Response {
        MsgKind kind{MsgKind::None};
        nodus::core::Status status{};
        nodus::core::Value payload{};

        [[nodiscard]] bool ok() const noexcept { return nodus::core::is_ok(status); }
        [[nodiscard]] bool is_ack() const noexcept { return ok() && payload.is_none(); }
    };

    [[nodiscard]] inline Response response_ack(MsgKind kind) {
        return Response{kind, nodus::core::ok_status(), nodus::core::Value{}};
    }

    [[nodiscard]] inline Response response_value(MsgKind kind, nodus::core::Value v) {
        return Response{kind, nodus::core::ok_status(), std::move(v)};
    }

    [[nodiscard]] inline Response response_failure(MsgKind kind, nodus::core::Status s) {
        return Response{kind, s, nodus::core::Value{}};
    }

    // Messages that act on the object a Pointer names.
    [[nodiscard]] Message pointer_get_message(const nodus::core::Pointer& p);
    [[nodiscard]] Message pointer_delete_message(const nodus::core::Pointer& p);
    [[nodiscard]] Message pointer_method_message(const nodus::core::Pointer& p,
        std::string method_name,
        ArgList args,
        std::optional<nodus::core::Uid> result_id = std::nullopt);

} // namespace nodus::net
