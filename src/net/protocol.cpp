#include "nodus/net/protocol.hpp"

#include <cstring>
#include <string>

#include "nodus/core/endian.hpp"
#include "nodus/storage/layout.hpp"

namespace nodus::net {
    using nodus::core::get_u16_be;
    using nodus::core::get_u32_be;
    using nodus::core::put_u16_be;
    using nodus::core::put_u32_be;

    namespace {
        nodus::core::Status invalid() noexcept {
            return nodus::core::make_status(nodus::core::StatusDomain::Net, nodus::core::StatusCode::Invalid);
        }

        void append_u32(std::vector<u8>* out, u32 v) {
            u8 b[4];
            put_u32_be(b, v);
            out->insert(out->end(), b, b + 4);
        }

        void append_uid(std::vector<u8>* out, const nodus::core::Uid& id) {
            u8 b[nodus::core::kUidBytes];
            (void)nodus::core::uid_serialize(id, {b, sizeof(b)});
            out->insert(out->end(), b, b + sizeof(b));
        }

        nodus::core::Status append_string(std::vector<u8>* out, const std::string& s) {
            if (s.size() > 0xffffffffu) {
                return invalid();
            }
            append_u32(out, static_cast<u32>(s.size()));
            out->insert(out->end(), s.begin(), s.end());
            return nodus::core::ok_status();
        }

        nodus::core::Status append_call_tail(std::vector<u8>* out,
            const std::optional<nodus::core::Uid>& result_id,
            const ArgList& args) {
            out->push_back(result_id.has_value() ? kCallFlagResultId : 0);
            if (result_id.has_value()) {
                append_uid(out, *result_id);
            }
            append_u32(out, static_cast<u32>(args.size()));
            for (const nodus::core::Value& a : args) {
                const nodus::core::Status s = nodus::storage::layout_encode_value(a, out);
                if (!nodus::core::is_ok(s)) return s;
            }
            return nodus::core::ok_status();
        }

        nodus::core::Status encode_body(const Message& msg, std::vector<u8>* out) {
            switch (msg_kind(msg)) {
            case MsgKind::SaveObject: {
                const auto& m = std::get<SaveObject>(msg);
                append_uid(out, m.uid);
                return nodus::storage::layout_encode_value(m.object, out);
            }
            case MsgKind::GetObject:
                append_uid(out, std::get<GetObject>(msg).uid);
                return nodus::core::ok_status();
            case MsgKind::DeleteObject:
                append_uid(out, std::get<DeleteObject>(msg).uid);
                return nodus::core::ok_status();
            case MsgKind::RunClassMethod: {
                const auto& m = std::get<RunClassMethod>(msg);
                append_uid(out, m.uid);
                const nodus::core::Status s = append_string(out, m.method_name);
                if (!nodus::core::is_ok(s)) return s;
                return append_call_tail(out, m.result_id, m.args);
            }
            case MsgKind::RunFunctionOrConstructor: {
                const auto& m = std::get<RunFunctionOrConstructor>(msg);
                const nodus::core::Status s = append_string(out, m.path);
                if (!nodus::core::is_ok(s)) return s;
                return append_call_tail(out, m.result_id, m.args);
            }
            case MsgKind::None:
                break;
            }
            return invalid();
        }

        struct Cursor {
            const u8* data;
            u32 len;
            u32 off;

            [[nodiscard]] bool has(u32 n) const noexcept { return len - off >= n; }
            [[nodiscard]] BufferView rest() const noexcept { return {data + off, len - off}; }
        };

        bool read_uid(Cursor& c, nodus::core::Uid* out) noexcept {
            if (!c.has(nodus::core::kUidBytes)) return false;
            nodus::core::DecodedId d{};
            if (!nodus::core::is_ok(nodus::core::uid_deserialize({c.data + c.off, nodus::core::kUidBytes}, false, &d))) {
                return false;
            }
            *out = d.uid;
            c.off += nodus::core::kUidBytes;
            return true;
        }

        bool read_string(Cursor& c, std::string* out) {
            if (!c.has(4)) return false;
            const u32 n = get_u32_be(c.data + c.off);
            c.off += 4;
            if (!c.has(n)) return false;
            out->assign(reinterpret_cast<const char*>(c.data + c.off), n);
            c.off += n;
            return true;
        }

        bool read_value(Cursor& c, nodus::core::Value* out) noexcept {
            u32 used = 0;
            if (!nodus::core::is_ok(nodus::storage::layout_decode_value(c.rest(), out, &used))) {
                return false;
            }
            c.off += used;
            return true;
        }

        bool read_call_tail(Cursor& c, std::optional<nodus::core::Uid>* result_id, ArgList* args) {
            if (!c.has(1)) return false;
            const u8 flags = c.data[c.off++];
            if ((flags & ~kCallFlagResultId) != 0) return false;
            if ((flags & kCallFlagResultId) != 0) {
                nodus::core::Uid id{};
                if (!read_uid(c, &id)) return false;
                *result_id = id;
            }
            if (!c.has(4)) return false;
            const u32 argc = get_u32_be(c.data + c.off);
            c.off += 4;
            if (!c.has(argc)) return false;
            args->clear();
            args->reserve(argc);
            for (u32 i = 0; i < argc; ++i) {
                nodus::core::Value v;
                if (!read_value(c, &v)) return false;
                args->push_back(std::move(v));
            }
            return true;
        }

        bool decode_body(MsgKind kind, Cursor& c, Message* out) {
            switch (kind) {
            case MsgKind::SaveObject: {
                SaveObject m{};
                if (!read_uid(c, &m.uid) || !read_value(c, &m.object)) return false;
                *out = std::move(m);
                return true;
            }
            case MsgKind::GetObject: {
                GetObject m{};
                if (!read_uid(c, &m.uid)) return false;
                *out = m;
                return true;
            }
            case MsgKind::DeleteObject: {
                DeleteObject m{};
                if (!read_uid(c, &m.uid)) return false;
                *out = m;
                return true;
            }
            case MsgKind::RunClassMethod: {
                RunClassMethod m{};
                if (!read_uid(c, &m.uid) || !read_string(c, &m.method_name)) return false;
                if (!read_call_tail(c, &m.result_id, &m.args)) return false;
                *out = std::move(m);
                return true;
            }
            case MsgKind::RunFunctionOrConstructor: {
                RunFunctionOrConstructor m{};
                if (!read_string(c, &m.path)) return false;
                if (!read_call_tail(c, &m.result_id, &m.args)) return false;
                *out = std::move(m);
                return true;
            }
            case MsgKind::None:
                break;
            }
            return false;
        }
    } // namespace

    nodus::core::Status protocol_encode_message(const Message& msg, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }

        const std::size_t mark = out->size();
        out->resize(mark + kMessageHeaderBytes);

        const nodus::core::Status s = encode_body(msg, out);
        if (!nodus::core::is_ok(s)) {
            out->resize(mark);
            return s;
        }

        const std::size_t body_len = out->size() - mark - kMessageHeaderBytes;
        if (body_len > 0xffffffffu) {
            out->resize(mark);
            return invalid();
        }

        u8* h = out->data() + mark;
        put_u16_be(h + 0, kProtocolVersion);
        put_u16_be(h + 2, static_cast<u16>(msg_kind(msg)));
        put_u32_be(h + 4, static_cast<u32>(body_len));
        return nodus::core::ok_status();
    }

    ProtocolParseResult protocol_decode_message(BufferView in, Message* out, u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) return ProtocolParseResult::Invalid;
        if (in.data == nullptr) return ProtocolParseResult::NeedMore;
        if (in.len < kMessageHeaderBytes) return ProtocolParseResult::NeedMore;

        const u16 version = get_u16_be(in.data + 0);
        const u16 kind_u16 = get_u16_be(in.data + 2);
        const u32 body_len = get_u32_be(in.data + 4);

        if (version != kProtocolVersion) return ProtocolParseResult::Invalid;
        if (in.len - kMessageHeaderBytes < body_len) return ProtocolParseResult::NeedMore;
        // A kind this node does not know means the peer speaks another protocol revision.
        if (!msg_kind_valid_u16(kind_u16)) return ProtocolParseResult::UnknownKind;

        Cursor c{in.data + kMessageHeaderBytes, body_len, 0};
        Message m{};
        if (!decode_body(static_cast<MsgKind>(kind_u16), c, &m)) return ProtocolParseResult::Invalid;
        if (c.off != body_len) return ProtocolParseResult::Invalid;

        *out = std::move(m);
        *consumed = kMessageHeaderBytes + body_len;
        return ProtocolParseResult::Ok;
    }

    nodus::core::Status protocol_encode_response(const Response& r, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }

        const std::size_t mark = out->size();
        out->resize(mark + kResponseHeaderBytes);

        const nodus::core::Status s = nodus::storage::layout_encode_value(r.payload, out);
        if (!nodus::core::is_ok(s)) {
            out->resize(mark);
            return s;
        }

        const std::size_t body_len = out->size() - mark - kResponseHeaderBytes;
        u8* h = out->data() + mark;
        put_u16_be(h + 0, kProtocolVersion);
        put_u16_be(h + 2, static_cast<u16>(r.kind));
        put_u16_be(h + 4, static_cast<u16>(r.status.code));
        put_u16_be(h + 6, static_cast<u16>(r.status.domain));
        put_u32_be(h + 8, r.status.aux);
        put_u32_be(h + 12, static_cast<u32>(body_len));
        return nodus::core::ok_status();
    }

    ProtocolParseResult protocol_decode_response(BufferView in, Response* out, u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) return ProtocolParseResult::Invalid;
        if (in.data == nullptr) return ProtocolParseResult::NeedMore;
        if (in.len < kResponseHeaderBytes) return ProtocolParseResult::NeedMore;

        const u16 version = get_u16_be(in.data + 0);
        const u16 kind_u16 = get_u16_be(in.data + 2);
        const u16 code_u16 = get_u16_be(in.data + 4);
        const u16 domain_u16 = get_u16_be(in.data + 6);
        const u32 aux = get_u32_be(in.data + 8);
        const u32 body_len = get_u32_be(in.data + 12);

        if (version != kProtocolVersion) return ProtocolParseResult::Invalid;
        if (in.len - kResponseHeaderBytes < body_len) return ProtocolParseResult::NeedMore;
        // Kind None is legal here: it answers a message that could not be decoded.
        if (kind_u16 != 0 && !msg_kind_valid_u16(kind_u16)) return ProtocolParseResult::UnknownKind;

        Response r{};
        r.kind = static_cast<MsgKind>(kind_u16);
        r.status.code = static_cast<nodus::core::StatusCode>(code_u16);
        r.status.domain = static_cast<nodus::core::StatusDomain>(domain_u16);
        r.status.aux = aux;

        u32 used = 0;
        const nodus::core::Status s = nodus::storage::layout_decode_value(
            {in.data + kResponseHeaderBytes, body_len}, &r.payload, &used);
        if (!nodus::core::is_ok(s) || used != body_len) return ProtocolParseResult::Invalid;

        *out = std::move(r);
        *consumed = kResponseHeaderBytes + body_len;
        return ProtocolParseResult::Ok;
    }

    nodus::core::Status protocol_result_status(ProtocolParseResult r) noexcept {
        switch (r) {
        case ProtocolParseResult::Ok:
            return nodus::core::ok_status();
        case ProtocolParseResult::UnknownKind:
            return nodus::core::make_status(nodus::core::StatusDomain::Net, nodus::core::StatusCode::UnknownKind);
        case ProtocolParseResult::NeedMore:
        case ProtocolParseResult::Invalid:
            break;
        }
        return invalid();
    }
} // namespace nodus::net
