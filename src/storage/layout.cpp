#include "nodus/storage/layout.hpp"

#include <cstring>
#include <string>

#include "nodus/core/endian.hpp"
#include "nodus/core/id_wrappers.hpp"

namespace nodus::storage {
    using nodus::core::make_status;
    using nodus::core::ok_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::core::Value;

    namespace {
        Status corrupt(u32 at) noexcept {
            return make_status(StatusDomain::Store, StatusCode::Corrupt, at);
        }

        void put_u8(std::vector<u8>* out, u8 v) {
            out->push_back(v);
        }

        void put_u32(std::vector<u8>* out, u32 v) {
            u8 b[4];
            nodus::core::put_u32_be(b, v);
            out->insert(out->end(), b, b + 4);
        }

        void put_u64(std::vector<u8>* out, u64 v) {
            u8 b[8];
            nodus::core::put_u64_be(b, v);
            out->insert(out->end(), b, b + 8);
        }

        Status put_blob(std::vector<u8>* out, const u8* data, std::size_t len) {
            if (len > 0xffffffffu) {
                return make_status(StatusDomain::Store, StatusCode::Invalid);
            }
            put_u32(out, static_cast<u32>(len));
            out->insert(out->end(), data, data + len);
            return ok_status();
        }

        Status put_string(std::vector<u8>* out, const std::string& s) {
            return put_blob(out, reinterpret_cast<const u8*>(s.data()), s.size());
        }

        void put_uid_value(std::vector<u8>* out, const nodus::core::Uuid16& v) {
            out->insert(out->end(), v.b.begin(), v.b.end());
        }

        Status encode(const Value& v, std::vector<u8>* out, u32 depth) {
            if (depth > kMaxValueDepth) {
                return make_status(StatusDomain::Store, StatusCode::Unsupported, depth);
            }

            switch (v.tag()) {
                case nodus::core::ValueTag::None:
                    put_u8(out, static_cast<u8>(WireTag::None));
                    return ok_status();
                case nodus::core::ValueTag::Bool:
                    put_u8(out, static_cast<u8>(WireTag::Bool));
                    put_u8(out, *v.get_if<bool>() ? 1 : 0);
                    return ok_status();
                case nodus::core::ValueTag::I64:
                    put_u8(out, static_cast<u8>(WireTag::I64));
                    put_u64(out, static_cast<u64>(*v.get_if<nodus::core::i64>()));
                    return ok_status();
                case nodus::core::ValueTag::F64: {
                    u64 bits = 0;
                    const double d = *v.get_if<double>();
                    std::memcpy(&bits, &d, sizeof(bits));
                    put_u8(out, static_cast<u8>(WireTag::F64));
                    put_u64(out, bits);
                    return ok_status();
                }
                case nodus::core::ValueTag::String:
                    put_u8(out, static_cast<u8>(WireTag::String));
                    return put_string(out, *v.get_if<std::string>());
                case nodus::core::ValueTag::Bytes: {
                    const auto& b = v.get_if<nodus::core::Bytes>()->b;
                    put_u8(out, static_cast<u8>(WireTag::Bytes));
                    return put_blob(out, b.data(), b.size());
                }
                case nodus::core::ValueTag::Uid: {
                    const nodus::core::Uid& id = *v.get_if<nodus::core::Uid>();
                    put_u8(out, static_cast<u8>(WireTag::Uid));
                    put_u8(out, id.as_wrapper() ? kUidFlagWrapper : 0);
                    put_uid_value(out, id.value());
                    return ok_status();
                }
                case nodus::core::ValueTag::Uuid16: {
                    nodus::core::IdWrapperAdapter a{};
                    const Status s = nodus::core::id_wrapper_find(nodus::core::ForeignIdType::Uuid16, &a);
                    if (!nodus::core::is_ok(s)) {
                        return make_status(StatusDomain::Store, StatusCode::Unsupported,
                                           static_cast<u32>(nodus::core::ValueTag::Uuid16));
                    }
                    const nodus::core::Uid id = a.wrap(*v.get_if<nodus::core::Uuid16>());
                    put_u8(out, static_cast<u8>(WireTag::Uid));
                    put_u8(out, kUidFlagWrapper);
                    put_uid_value(out, id.value());
                    return ok_status();
                }
                case nodus::core::ValueTag::Pointer: {
                    const nodus::core::Pointer& p = *v.get_if<nodus::core::Pointer>();
                    put_u8(out, static_cast<u8>(WireTag::Pointer));
                    put_uid_value(out, p.id.value());
                    Status s = put_string(out, p.location);
                    if (!nodus::core::is_ok(s)) return s;
                    return put_string(out, p.type_hint);
                }
                case nodus::core::ValueTag::List: {
                    const nodus::core::List& l = *v.get_if<nodus::core::List>();
                    put_u8(out, static_cast<u8>(WireTag::List));
                    put_u32(out, static_cast<u32>(l.size()));
                    for (const Value& item : l) {
                        const Status s = encode(item, out, depth + 1);
                        if (!nodus::core::is_ok(s)) return s;
                    }
                    return ok_status();
                }
                case nodus::core::ValueTag::Instance: {
                    const nodus::core::Instance& inst = *v.get_if<nodus::core::Instance>();
                    put_u8(out, static_cast<u8>(WireTag::Instance));
                    Status s = put_string(out, inst.type);
                    if (!nodus::core::is_ok(s)) return s;
                    put_u32(out, static_cast<u32>(inst.fields.size()));
                    for (const Value& item : inst.fields) {
                        s = encode(item, out, depth + 1);
                        if (!nodus::core::is_ok(s)) return s;
                    }
                    return ok_status();
                }
            }
            return make_status(StatusDomain::Store, StatusCode::Unsupported);
        }

        struct Reader {
            const u8* data;
            u32 len;
            u32 off;

            [[nodiscard]] bool has(u32 n) const noexcept { return len - off >= n; }
        };

        bool read_u8(Reader& r, u8* out) noexcept {
            if (!r.has(1)) return false;
            *out = r.data[r.off];
            r.off += 1;
            return true;
        }

        bool read_u32(Reader& r, u32* out) noexcept {
            if (!r.has(4)) return false;
            *out = nodus::core::get_u32_be(r.data + r.off);
            r.off += 4;
            return true;
        }

        bool read_u64(Reader& r, u64* out) noexcept {
            if (!r.has(8)) return false;
            *out = nodus::core::get_u64_be(r.data + r.off);
            r.off += 8;
            return true;
        }

        bool read_blob(Reader& r, const u8** data, u32* len) noexcept {
            u32 n = 0;
            if (!read_u32(r, &n)) return false;
            if (!r.has(n)) return false;
            *data = r.data + r.off;
            *len = n;
            r.off += n;
            return true;
        }

        bool read_string(Reader& r, std::string* out) {
            const u8* p = nullptr;
            u32 n = 0;
            if (!read_blob(r, &p, &n)) return false;
            out->assign(reinterpret_cast<const char*>(p), n);
            return true;
        }

        bool read_uuid(Reader& r, nodus::core::Uuid16* out) noexcept {
            if (!r.has(nodus::core::kUidBytes)) return false;
            std::memcpy(out->b.data(), r.data + r.off, nodus::core::kUidBytes);
            r.off += nodus::core::kUidBytes;
            return true;
        }

        Status decode(Reader& r, Value* out, u32 depth) {
            if (depth > kMaxValueDepth) {
                return make_status(StatusDomain::Store, StatusCode::Unsupported, depth);
            }

            const u32 start = r.off;
            u8 tag = 0;
            if (!read_u8(r, &tag)) return corrupt(start);

            switch (static_cast<WireTag>(tag)) {
                case WireTag::None:
                    *out = Value{};
                    return ok_status();
                case WireTag::Bool: {
                    u8 b = 0;
                    if (!read_u8(r, &b) || b > 1) return corrupt(start);
                    *out = Value{b == 1};
                    return ok_status();
                }
                case WireTag::I64: {
                    u64 x = 0;
                    if (!read_u64(r, &x)) return corrupt(start);
                    *out = Value{static_cast<nodus::core::i64>(x)};
                    return ok_status();
                }
                case WireTag::F64: {
                    u64 bits = 0;
                    if (!read_u64(r, &bits)) return corrupt(start);
                    double d = 0.0;
                    std::memcpy(&d, &bits, sizeof(d));
                    *out = Value{d};
                    return ok_status();
                }
                case WireTag::String: {
                    std::string s;
                    if (!read_string(r, &s)) return corrupt(start);
                    *out = Value{std::move(s)};
                    return ok_status();
                }
                case WireTag::Bytes: {
                    const u8* p = nullptr;
                    u32 n = 0;
                    if (!read_blob(r, &p, &n)) return corrupt(start);
                    *out = Value{nodus::core::Bytes{std::vector<u8>(p, p + n)}};
                    return ok_status();
                }
                case WireTag::Uid: {
                    u8 flags = 0;
                    if (!read_u8(r, &flags) || (flags & ~kUidFlagWrapper) != 0) return corrupt(start);
                    if (!r.has(nodus::core::kUidBytes)) return corrupt(start);

                    nodus::core::DecodedId d{};
                    const bool as_wrapper = (flags & kUidFlagWrapper) != 0;
                    const Status s = nodus::core::uid_deserialize({r.data + r.off, nodus::core::kUidBytes}, as_wrapper, &d);
                    if (!nodus::core::is_ok(s)) return s;
                    r.off += nodus::core::kUidBytes;

                    if (d.kind == nodus::core::DecodedId::Kind::Domain) {
                        *out = Value{d.uid};
                        return ok_status();
                    }

                    nodus::core::IdWrapperAdapter a{};
                    if (!nodus::core::is_ok(nodus::core::id_wrapper_find(nodus::core::ForeignIdType::Uuid16, &a))) {
                        return make_status(StatusDomain::Store, StatusCode::Unsupported,
                                           static_cast<u32>(nodus::core::ValueTag::Uuid16));
                    }
                    *out = Value{a.unwrap(nodus::core::Uid{d.raw, true})};
                    return ok_status();
                }
                case WireTag::Pointer: {
                    nodus::core::Uuid16 v{};
                    nodus::core::Pointer p{};
                    if (!read_uuid(r, &v)) return corrupt(start);
                    if (!read_string(r, &p.location)) return corrupt(start);
                    if (!read_string(r, &p.type_hint)) return corrupt(start);
                    p.id = nodus::core::Uid{v};
                    *out = Value{std::move(p)};
                    return ok_status();
                }
                case WireTag::List: {
                    u32 count = 0;
                    if (!read_u32(r, &count)) return corrupt(start);
                    // Every element takes at least one byte.
                    if (!r.has(count)) return corrupt(start);
                    nodus::core::List l;
                    l.reserve(count);
                    for (u32 i = 0; i < count; ++i) {
                        Value item;
                        const Status s = decode(r, &item, depth + 1);
                        if (!nodus::core::is_ok(s)) return s;
                        l.push_back(std::move(item));
                    }
                    *out = Value{std::move(l)};
                    return ok_status();
                }
                case WireTag::Instance: {
                    nodus::core::Instance inst;
                    u32 count = 0;
                    if (!read_string(r, &inst.type)) return corrupt(start);
                    if (!read_u32(r, &count) || !r.has(count)) return corrupt(start);
                    inst.fields.reserve(count);
                    for (u32 i = 0; i < count; ++i) {
                        Value item;
                        const Status s = decode(r, &item, depth + 1);
                        if (!nodus::core::is_ok(s)) return s;
                        inst.fields.push_back(std::move(item));
                    }
                    *out = Value{std::move(inst)};
                    return ok_status();
                }
            }
            return corrupt(start);
        }
    } // namespace

    Status layout_encode_value(const Value& v, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        const std::size_t mark = out->size();
        const Status s = encode(v, out, 0);
        if (!nodus::core::is_ok(s)) {
            out->resize(mark);
        }
        return s;
    }

    Status layout_decode_value(nodus::core::BufferView in, Value* out, u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (in.data == nullptr && in.len > 0) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }

        Reader r{in.data, in.len, 0};
        Value v;
        const Status s = decode(r, &v, 0);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        *out = std::move(v);
        *consumed = r.off;
        return ok_status();
    }
} // namespace nodus::storage
