#pragma once

#include <deque>
#include <memory>
#include <unordered_map>
#include <vector>

#include "nodus/net/framing.hpp"
#include "nodus/net/message.hpp"
#include "nodus/node/worker.hpp"

namespace nodus::node {

    // In-process worker. Two connected instances exchange framed envelopes
    // through each other's inbox; nothing leaves the process.
    class VirtualWorker final : public Worker {
    public:
        [[nodiscard]] static nodus::core::Status create(WorkerConfig cfg,
                                                        std::vector<Framework> frameworks,
                                                        std::unique_ptr<VirtualWorker>* out);

        ~VirtualWorker() override;

        // Links a and b both ways, dropping any previous links.
        static void connect(VirtualWorker& a, VirtualWorker& b) noexcept;
        void disconnect() noexcept;

        // Queues one complete frame (header + payload) on the peer's inbox.
        // Net/Invalid for a malformed frame, Net/Unavailable without a peer.
        [[nodiscard]] nodus::core::Status send_msg(nodus::core::BufferView frame) override;

        // Pops the oldest frame from this worker's inbox. Net/NotFound if empty.
        [[nodiscard]] nodus::core::Status recv_bytes(std::vector<u8>* out) override;

        // Encodes and frames 'msg' as a request to the peer.
        [[nodiscard]] nodus::core::Status send_request(const nodus::net::Message& msg, u32* request_id);

        // Drains the inbox. Requests are dispatched through recv_msg and
        // answered on the peer; responses are parked for take_response.
        [[nodiscard]] nodus::core::Status pump(u32* handled = nullptr);

        // Net/NotFound if no response for 'request_id' has arrived.
        [[nodiscard]] nodus::core::Status take_response(u32 request_id, nodus::net::Response* out);

        // send_request, let the peer answer, collect the answer.
        [[nodiscard]] nodus::core::Status request(const nodus::net::Message& msg, nodus::net::Response* out);

        [[nodiscard]] VirtualWorker* peer() const noexcept { return peer_; }
        [[nodiscard]] std::size_t pending() const noexcept { return inbox_.size(); }

    private:
        explicit VirtualWorker(WorkerConfig cfg) : Worker(std::move(cfg)) {}

        [[nodiscard]] nodus::core::Status send_frame(nodus::net::FrameType type,
                                                     u32 request_id,
                                                     std::vector<u8>* frame);
        [[nodiscard]] nodus::core::Status handle_frame(const std::vector<u8>& frame);

        VirtualWorker* peer_{nullptr};
        std::deque<std::vector<u8>> inbox_;
        std::unordered_map<u32, nodus::net::Response> responses_;
        u32 next_request_id_{1};
    };

} // namespace nodus::node
