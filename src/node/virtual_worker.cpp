#include "nodus/node/virtual_worker.hpp"

#include "nodus/core/log.hpp"
#include "nodus/net/protocol.hpp"

namespace nodus::node {
    using nodus::core::BufferView;
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::net::FrameHeader;
    using nodus::net::FrameType;
    using nodus::net::kFrameHeaderBytes;
    using nodus::net::ProtocolParseResult;

    Status VirtualWorker::create(WorkerConfig cfg, std::vector<Framework> frameworks, std::unique_ptr<VirtualWorker>* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Worker, StatusCode::Invalid);
        }
        std::unique_ptr<VirtualWorker> w(new VirtualWorker(std::move(cfg)));
        const Status s = w->init(std::move(frameworks));
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        *out = std::move(w);
        return nodus::core::ok_status();
    }

    VirtualWorker::~VirtualWorker() {
        disconnect();
    }

    void VirtualWorker::connect(VirtualWorker& a, VirtualWorker& b) noexcept {
        a.disconnect();
        b.disconnect();
        a.peer_ = &b;
        b.peer_ = &a;
    }

    void VirtualWorker::disconnect() noexcept {
        if (peer_ != nullptr && peer_->peer_ == this) {
            peer_->peer_ = nullptr;
        }
        peer_ = nullptr;
    }

    Status VirtualWorker::send_msg(BufferView frame) {
        FrameHeader h{};
        BufferView payload{};
        const Status s = nodus::net::frame_open(frame, &h, &payload);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        if (peer_ == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Unavailable);
        }
        peer_->inbox_.emplace_back(frame.data, frame.data + frame.len);
        return nodus::core::ok_status();
    }

    Status VirtualWorker::recv_bytes(std::vector<u8>* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        if (inbox_.empty()) {
            return make_status(StatusDomain::Net, StatusCode::NotFound);
        }
        *out = std::move(inbox_.front());
        inbox_.pop_front();
        return nodus::core::ok_status();
    }

    Status VirtualWorker::send_frame(FrameType type, u32 request_id, std::vector<u8>* frame) {
        const Status s = nodus::net::frame_seal(type, request_id, frame);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        return send_msg(BufferView{frame->data(), static_cast<u32>(frame->size())});
    }

    Status VirtualWorker::send_request(const nodus::net::Message& msg, u32* request_id) {
        if (request_id == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        std::vector<u8> frame(kFrameHeaderBytes);
        Status s = nodus::net::protocol_encode_message(msg, &frame);
        if (!nodus::core::is_ok(s)) {
            return s;
        }

        const u32 id = next_request_id_++;
        s = send_frame(FrameType::Request, id, &frame);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        *request_id = id;
        return nodus::core::ok_status();
    }

    Status VirtualWorker::handle_frame(const std::vector<u8>& frame) {
        FrameHeader h{};
        BufferView body{};
        const Status opened = nodus::net::frame_open(BufferView{frame.data(), static_cast<u32>(frame.size())}, &h, &body);
        if (!nodus::core::is_ok(opened)) {
            return opened;
        }

        if (h.type == FrameType::Request) {
            nodus::net::Message msg;
            u32 consumed = 0;
            const ProtocolParseResult pr = nodus::net::protocol_decode_message(body, &msg, &consumed);

            nodus::net::Response r;
            if (pr == ProtocolParseResult::Ok && consumed == body.len) {
                r = recv_msg(msg);
            } else {
                Status bad = nodus::net::protocol_result_status(pr);
                if (pr == ProtocolParseResult::Ok) {
                    bad = make_status(StatusDomain::Net, StatusCode::Invalid, consumed);
                }
                nodus::core::log_status("decode request", bad);
                r = nodus::net::response_failure(nodus::net::MsgKind::None, bad);
            }

            std::vector<u8> reply(kFrameHeaderBytes);
            const Status s = nodus::net::protocol_encode_response(r, &reply);
            if (!nodus::core::is_ok(s)) {
                return s;
            }
            return send_frame(FrameType::Response, h.request_id, &reply);
        }

        nodus::net::Response r;
        u32 consumed = 0;
        const ProtocolParseResult pr = nodus::net::protocol_decode_response(body, &r, &consumed);
        if (pr != ProtocolParseResult::Ok || consumed != body.len) {
            const Status bad = nodus::net::protocol_result_status(
                pr == ProtocolParseResult::Ok ? ProtocolParseResult::Invalid : pr);
            nodus::core::log_status("decode response", bad);
            r = nodus::net::response_failure(nodus::net::MsgKind::None, bad);
        }
        responses_[h.request_id] = std::move(r);
        return nodus::core::ok_status();
    }

    Status VirtualWorker::pump(u32* handled) {
        u32 n = 0;
        while (!inbox_.empty()) {
            std::vector<u8> frame = std::move(inbox_.front());
            inbox_.pop_front();
            const Status s = handle_frame(frame);
            if (!nodus::core::is_ok(s)) {
                nodus::core::log_status("pump", s);
                if (handled != nullptr) *handled = n;
                return s;
            }
            n++;
        }
        if (handled != nullptr) *handled = n;
        return nodus::core::ok_status();
    }

    Status VirtualWorker::take_response(u32 request_id, nodus::net::Response* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        auto it = responses_.find(request_id);
        if (it == responses_.end()) {
            return make_status(StatusDomain::Net, StatusCode::NotFound, request_id);
        }
        *out = std::move(it->second);
        responses_.erase(it);
        return nodus::core::ok_status();
    }

    Status VirtualWorker::request(const nodus::net::Message& msg, nodus::net::Response* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        if (peer_ == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Unavailable);
        }

        u32 id = 0;
        Status s = send_request(msg, &id);
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        s = peer_->pump();
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        s = pump();
        if (!nodus::core::is_ok(s)) {
            return s;
        }
        return take_response(id, out);
    }
} // namespace nodus::node
