#include "nodus/node/framework.hpp"

#include <algorithm>

namespace nodus::node {
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;

    AstNode make_function_node(CallFn fn) {
        AstNode n{};
        n.kind = AstNodeKind::Function;
        n.function = std::move(fn);
        return n;
    }

    AstNode make_class_node(ConstructFn ctor, std::unordered_map<std::string, MethodFn> methods) {
        AstNode n{};
        n.kind = AstNodeKind::Class;
        n.constructor = std::move(ctor);
        n.methods = std::move(methods);
        return n;
    }

    Status FrameworkRegistry::add(Framework fw) {
        if (fw.name.empty() || fw.name.find('.') != std::string::npos) {
            return make_status(StatusDomain::Framework, StatusCode::Invalid);
        }
        if (frameworks_.find(fw.name) != frameworks_.end()) {
            return make_status(StatusDomain::Worker, StatusCode::DuplicateFramework);
        }
        std::string key = fw.name;
        frameworks_.emplace(std::move(key), std::move(fw));
        return nodus::core::ok_status();
    }

    const Framework* FrameworkRegistry::find(std::string_view name) const noexcept {
        auto it = frameworks_.find(std::string(name));
        return it == frameworks_.end() ? nullptr : &it->second;
    }

    Status FrameworkRegistry::resolve(std::string_view path, const AstNode** out) const {
        if (out == nullptr) {
            return make_status(StatusDomain::Framework, StatusCode::Invalid);
        }

        const std::size_t dot = path.find('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 == path.size()) {
            return make_status(StatusDomain::Framework, StatusCode::NotFound);
        }

        const Framework* fw = find(path.substr(0, dot));
        if (fw == nullptr) {
            return make_status(StatusDomain::Framework, StatusCode::NotFound);
        }

        auto it = fw->attrs.find(std::string(path.substr(dot + 1)));
        if (it == fw->attrs.end()) {
            return make_status(StatusDomain::Framework, StatusCode::NotFound);
        }
        *out = &it->second;
        return nodus::core::ok_status();
    }

    std::vector<std::string> FrameworkRegistry::names() const {
        std::vector<std::string> out;
        out.reserve(frameworks_.size());
        for (const auto& kv : frameworks_) {
            out.push_back(kv.first);
        }
        std::sort(out.begin(), out.end());
        return out;
    }
} // namespace nodus::node
