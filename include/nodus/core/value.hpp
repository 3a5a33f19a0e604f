#pragma once

#include <string>
#include <variant>
#include <vector>

#include "nodus/core/pointer.hpp"
#include "nodus/core/types.hpp"
#include "nodus/core/uid.hpp"

namespace nodus::core {

    struct Value;
    using List = std::vector<Value>;

    struct Bytes {
        std::vector<u8> b;
        friend bool operator==(const Bytes&, const Bytes&) = default;
    };

    // Object built by a framework class. 'type' is the class path
    // ("framework.Class"), 'fields' its positional state.
    struct Instance {
        std::string type;
        std::vector<Value> fields;
    };

    bool operator==(const Instance& a, const Instance& b);

    enum class ValueTag : u8 {
        None = 0,
        Bool = 1,
        I64 = 2,
        F64 = 3,
        String = 4,
        Bytes = 5,
        Uid = 6,
        Uuid16 = 7,
        Pointer = 8,
        List = 9,
        Instance = 10,
    };

    // Any object a node can own. Alternative order matches ValueTag.
    struct Value {
        using Storage = std::variant<std::monostate, bool, i64, double, std::string, Bytes,
                                     Uid, Uuid16, Pointer, List, Instance>;
        Storage v{};

        Value() noexcept = default;
        Value(bool x) : v(x) {}
        Value(int x) : v(static_cast<i64>(x)) {}
        Value(i64 x) : v(x) {}
        Value(double x) : v(x) {}
        Value(const char* x) : v(std::string(x)) {}
        Value(std::string x) : v(std::move(x)) {}
        Value(Bytes x) : v(std::move(x)) {}
        Value(const Uid& x) : v(x) {}
        Value(const Uuid16& x) : v(x) {}
        Value(Pointer x) : v(std::move(x)) {}
        Value(List x) : v(std::move(x)) {}
        Value(Instance x) : v(std::move(x)) {}

        [[nodiscard]] ValueTag tag() const noexcept { return static_cast<ValueTag>(v.index()); }
        [[nodiscard]] bool is_none() const noexcept { return v.index() == 0; }

        template <typename T>
        [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&v); }

        template <typename T>
        [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&v); }
    };

    bool operator==(const Value& a, const Value& b);

    // True only if 'other' holds a UID with the same 128-bit value. Any other
    // kind of value compares unequal.
    [[nodiscard]] bool uid_equals(const Uid& id, const Value& other) noexcept;

    // "none", "bool", "int", "float", "str", "bytes", "UID", "uuid",
    // "Pointer", "list", or the instance's class path.
    [[nodiscard]] std::string value_type_name(const Value& v);

    // Human-readable rendering used by logs and the CLI.
    [[nodiscard]] std::string value_repr(const Value& v);

} // namespace nodus::core
