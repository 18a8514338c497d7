#pragma once
// Shared helpers for the xbeelink tests.

#include "xbeelink/bytes.hpp"
#include "xbeelink/packet.hpp"
#include "xbeelink/parser.hpp"
#include "xbeelink/transport/memory_connection.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <thread>

namespace xbeelink::test {

inline ByteVector hex(const std::string& text) {
    ByteVector out;
    from_hex(text, out);
    return out;
}

/// Poll `pred` every few ms until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

using Responder = std::function<std::optional<Packet>(const Packet& request)>;

/// Play the module: decode each written frame and inject whatever `fn` answers.
inline void respond_with(transport::MemoryConnection& conn, Responder fn) {
    conn.set_write_hook([&conn, fn](const std::vector<uint8_t>& frame) {
        PacketParser parser;
        Packet request;
        std::string err;
        if (parser.parse_packet(frame, OperatingMode::API, request, err) != ParseStatus::Ok) return;
        auto response = fn(request);
        if (response) conn.inject(response->generate_bytes(false));
    });
}

} // namespace xbeelink::test
