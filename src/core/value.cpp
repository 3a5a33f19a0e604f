#include "nodus/core/value.hpp"

#include <cinttypes>
#include <cstdio>

namespace nodus::core {
    namespace {
        constexpr std::size_t kReprBytesShown = 16;
    } // namespace

    bool operator==(const Instance& a, const Instance& b) {
        return a.type == b.type && a.fields == b.fields;
    }

    bool operator==(const Value& a, const Value& b) {
        return a.v == b.v;
    }

    bool uid_equals(const Uid& id, const Value& other) noexcept {
        const Uid* u = other.get_if<Uid>();
        return u != nullptr && *u == id;
    }

    std::string pointer_repr(const Pointer& p) {
        return "<Pointer:" + p.location + "/" + uid_to_string(p.id) + ">";
    }

    std::string value_type_name(const Value& v) {
        switch (v.tag()) {
            case ValueTag::None: return "none";
            case ValueTag::Bool: return "bool";
            case ValueTag::I64: return "int";
            case ValueTag::F64: return "float";
            case ValueTag::String: return "str";
            case ValueTag::Bytes: return "bytes";
            case ValueTag::Uid: return "UID";
            case ValueTag::Uuid16: return "uuid";
            case ValueTag::Pointer: return "Pointer";
            case ValueTag::List: return "list";
            case ValueTag::Instance: return v.get_if<Instance>()->type;
        }
        return "unknown";
    }

    std::string value_repr(const Value& v) {
        char buf[64];
        switch (v.tag()) {
            case ValueTag::None:
                return "none";
            case ValueTag::Bool:
                return *v.get_if<bool>() ? "true" : "false";
            case ValueTag::I64:
                std::snprintf(buf, sizeof(buf), "%" PRId64, *v.get_if<i64>());
                return buf;
            case ValueTag::F64:
                std::snprintf(buf, sizeof(buf), "%g", *v.get_if<double>());
                return buf;
            case ValueTag::String:
                return "\"" + *v.get_if<std::string>() + "\"";
            case ValueTag::Bytes: {
                const auto& b = v.get_if<Bytes>()->b;
                std::string out = "b'";
                for (std::size_t i = 0; i < b.size() && i < kReprBytesShown; ++i) {
                    std::snprintf(buf, sizeof(buf), "%02x", b[i]);
                    out += buf;
                }
                if (b.size() > kReprBytesShown) {
                    out += "...";
                }
                return out + "'";
            }
            case ValueTag::Uid:
                return uid_repr(*v.get_if<Uid>());
            case ValueTag::Uuid16:
                return "<uuid:" + uid_to_string(Uid{*v.get_if<Uuid16>()}) + ">";
            case ValueTag::Pointer:
                return pointer_repr(*v.get_if<Pointer>());
            case ValueTag::List: {
                std::string out = "[";
                const List& l = *v.get_if<List>();
                for (std::size_t i = 0; i < l.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += value_repr(l[i]);
                }
                return out + "]";
            }
            case ValueTag::Instance: {
                const Instance& inst = *v.get_if<Instance>();
                std::string out = inst.type + "(";
                for (std::size_t i = 0; i < inst.fields.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += value_repr(inst.fields[i]);
                }
                return out + ")";
            }
        }
        return "?";
    }
} // namespace nodus::core
