#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/value.hpp"
#include "nodus/net/message.hpp"

namespace nodus::node {
    using u8 = nodus::core::u8;
    using u32 = nodus::core::u32;
    using ArgList = nodus::net::ArgList;

    // Free function: args -> value.
    using CallFn = std::function<nodus::core::Status(const ArgList& args, nodus::core::Value* out)>;
    // Class constructor: args -> initial instance fields.
    using ConstructFn = std::function<nodus::core::Status(const ArgList& args, nodus::core::List* fields)>;
    // Bound method; may mutate the instance in place.
    using MethodFn = std::function<nodus::core::Status(nodus::core::Instance& self,
                                                       const ArgList& args,
                                                       nodus::core::Value* out)>;

    enum class AstNodeKind : u8 {
        Function = 1,
        Class = 2,
    };

    // One invokable entry of a framework's call graph.
    struct AstNode {
        AstNodeKind kind{AstNodeKind::Function};
        CallFn function;
        ConstructFn constructor;
        std::unordered_map<std::string, MethodFn> methods;
    };

    [[nodiscard]] AstNode make_function_node(CallFn fn);
    [[nodiscard]] AstNode make_class_node(ConstructFn ctor, std::unordered_map<std::string, MethodFn> methods);

    // A named call graph. Attribute keys are paths relative to the framework,
    // e.g. "linalg.norm" inside framework "num" is reached as "num.linalg.norm".
    struct Framework {
        std::string name;
        std::unordered_map<std::string, AstNode> attrs;
    };

    class FrameworkRegistry {
    public:
        // DuplicateFramework if 'fw.name' is already registered, Invalid if empty.
        [[nodiscard]] nodus::core::Status add(Framework fw);

        [[nodiscard]] const Framework* find(std::string_view name) const noexcept;

        // Splits "framework.attr.path" at the first dot. NotFound when either
        // part does not resolve.
        [[nodiscard]] nodus::core::Status resolve(std::string_view path, const AstNode** out) const;

        [[nodiscard]] u32 size() const noexcept { return static_cast<u32>(frameworks_.size()); }

        // Sorted framework names.
        [[nodiscard]] std::vector<std::string> names() const;

    private:
        std::unordered_map<std::string, Framework> frameworks_;
    };

} // namespace nodus::node
