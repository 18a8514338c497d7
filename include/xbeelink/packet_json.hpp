#pragma once
/**
 * @file packet_json.hpp
 * @brief JSON rendering of decoded packets (nlohmann::json).
 *
 * Shape:
 * @code{.json}
 *   {
 *     "type": 136, "type_name": "AT Command Response", "frame_id": 1,
 *     "hex": "7E00058801424400F0",
 *     "fields": [ { "k": "Frame type", "v": "88 (AT Command Response)" }, ... ]
 *   }
 * @endcode
 * "frame_id" is null for kinds without one. "fields" mirrors Packet::parameters().
 */

#include "xbeelink/messages.hpp"
#include "xbeelink/packet.hpp"
#include "nlohmann/json.hpp"

namespace xbeelink {

nlohmann::json to_json(const Packet& packet);
nlohmann::json to_json(const XBeeMessage& message);

} // namespace xbeelink
