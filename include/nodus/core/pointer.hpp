#pragma once

#include <string>

#include "nodus/core/uid.hpp"

namespace nodus::core {

    // Non-owning reference to an object held in some node's store.
    struct Pointer {
        Uid id{};
        std::string location;   // id of the owning node
        std::string type_hint;  // cached type name of the pointee, may be empty

        // Two pointers are equal when they name the same object; the cached
        // type is not part of identity.
        friend bool operator==(const Pointer& a, const Pointer& b) noexcept {
            return a.id == b.id && a.location == b.location;
        }
    };

    [[nodiscard]] inline bool pointer_is_local(const Pointer& p, const std::string& node_id) noexcept {
        return p.location == node_id;
    }

    // "<Pointer:node-a/xxxxxxxx-...>"
    [[nodiscard]] std::string pointer_repr(const Pointer& p);

} // namespace nodus::core
