// -----------------------------------------------------------------------------
// packet_json.cpp: Packet / XBeeMessage -> nlohmann::json for the CLI's
// --format json output.
// -----------------------------------------------------------------------------
#include "xbeelink/packet_json.hpp"

namespace xbeelink {

using json = nlohmann::json;

json to_json(const Packet& packet) {
  json j;
  j["type"]      = packet.frame_type_value();
  j["type_name"] = packet.frame_type_name();

  const FrameId fid = packet.frame_id();
  if (fid) j["frame_id"] = *fid;
  else     j["frame_id"] = nullptr;

  j["hex"] = packet.to_hex_string();

  json fields = json::array();
  for (const auto& row : packet.parameters()) {
    json e;
    e["k"] = row.first;
    e["v"] = row.second;
    fields.push_back(e);
  }
  j["fields"] = fields;
  return j;
}

json to_json(const XBeeMessage& message) {
  json j;
  j["from64"]    = message.remote.addr64.to_string();
  j["from16"]    = message.remote.addr16.to_string();
  j["broadcast"] = message.broadcast;
  j["hex"]       = to_hex(message.data);
  j["text"]      = to_printable(message.data);
  return j;
}

} // namespace xbeelink
