#pragma once

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/core/uid.hpp"

namespace nodus::core {

    // Foreign identifier types that may travel as a wrapped UID.
    enum class ForeignIdType : u8 {
        None = 0,
        Uuid16 = 1,
    };

    inline constexpr u32 kMaxIdWrappers = 8;

    using IdWrapFn = Uid (*)(const Uuid16& raw) noexcept;
    using IdUnwrapFn = Uuid16 (*)(const Uid& id) noexcept;

    struct IdWrapperAdapter {
        ForeignIdType type{ForeignIdType::None};
        const char* name{nullptr};
        IdWrapFn wrap{nullptr};
        IdUnwrapFn unwrap{nullptr};
    };

    // Process-wide table consulted by the value codec. Registering the same
    // type twice is a Conflict.
    [[nodiscard]] Status id_wrapper_register(const IdWrapperAdapter& adapter) noexcept;

    // Copies the adapter for 'type' into 'out'; NotFound if none is registered.
    [[nodiscard]] Status id_wrapper_find(ForeignIdType type, IdWrapperAdapter* out) noexcept;

    // Registers the Uuid16 adapter unless it is already present.
    [[nodiscard]] Status id_wrappers_register_defaults() noexcept;

    void id_wrappers_clear() noexcept;

} // namespace nodus::core
