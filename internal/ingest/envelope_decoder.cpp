#include "envelope_decoder.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <optional>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "meshgraph/mesh/v1/envelope.pb.h"

namespace meshgraph::ingest {

namespace pb  = meshgraph::mesh::v1;
namespace gpb  = google::protobuf;
using util::MalformedPayloadError;

namespace {

constexpr double kCoordinateScale = 1e-7;

// trims and collapses whitespace, drops control characters
std::optional<std::string> CleanName(const std::string& raw) {
  std::string out;
  bool        pending_space = false;
  for (unsigned char c : raw) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (c < 0x20 || c == 0x7f) continue;
    if (pending_space) out += ' ';
    pending_space = false;
    out += static_cast<char>(c);
  }
  if (out.empty()) return std::nullopt;
  return out;
}

std::optional<int32_t> HopCount(uint32_t hop_start, uint32_t hop_limit) {
  if (hop_start == 0 || hop_limit > hop_start) return std::nullopt;
  return static_cast<int32_t>(hop_start - hop_limit);
}

// ------------------------------------------------------------------
// Protobuf port payloads
// ------------------------------------------------------------------

void AppendNodeInfo(const pb::MeshPacket& packet, const pb::Data& data, int64_t ts, std::vector<model::Event>& out) {
  pb::User user;
  if (!user.ParseFromString(data.payload())) {
    throw MalformedPayloadError("bad NODEINFO payload");
  }

  model::NodeInfoUpdate u;
  u.id         = packet.from();
  u.long_name  = CleanName(user.long_name());
  u.short_name = CleanName(user.short_name());
  if (user.hw_model() != 0) u.hardware = user.hw_model();
  u.role      = model::FromDeviceRole(user.role());
  u.timestamp = ts;
  out.emplace_back(std::move(u));
}

void AppendPosition(const pb::MeshPacket& packet, const pb::Data& data, int64_t ts, std::vector<model::Event>& out) {
  pb::Position pos;
  if (!pos.ParseFromString(data.payload())) {
    throw MalformedPayloadError("bad POSITION payload");
  }
  // 0/0 means the node has no fix
  if (pos.latitude_i() == 0 && pos.longitude_i() == 0) return;

  model::NodeInfoUpdate u;
  u.id        = packet.from();
  u.latitude  = pos.latitude_i() * kCoordinateScale;
  u.longitude = pos.longitude_i() * kCoordinateScale;
  u.timestamp = ts;
  out.emplace_back(std::move(u));
}

void AppendNeighbors(const pb::MeshPacket& packet, const pb::Data& data, int64_t ts, std::vector<model::Event>& out) {
  pb::NeighborInfo info;
  if (!info.ParseFromString(data.payload())) {
    throw MalformedPayloadError("bad NEIGHBORINFO payload");
  }

  const model::NodeNum reporter = info.node_id() != 0 ? info.node_id() : packet.from();
  for (const auto& n : info.neighbors()) {
    if (n.node_id() == 0) continue;
    model::NeighborReport r;
    r.reporter  = reporter;
    r.neighbor  = n.node_id();
    r.snr       = n.snr();
    r.timestamp = ts;
    out.emplace_back(r);
  }
}

void AppendTraceroute(const pb::MeshPacket& packet, const pb::Data& data, int64_t ts, std::vector<model::Event>& out) {
  // requests carry a partial route; only replies describe the full path
  if (data.request_id() == 0) return;

  pb::RouteDiscovery route;
  if (!route.ParseFromString(data.payload())) {
    throw MalformedPayloadError("bad TRACEROUTE payload");
  }

  model::TracerouteRecord r;
  r.packet_id = packet.id();
  r.origin    = packet.to();
  r.timestamp = ts;
  r.hops.push_back(packet.to());
  for (auto hop : route.route()) r.hops.push_back(hop);
  r.hops.push_back(packet.from());
  out.emplace_back(std::move(r));
}

// ------------------------------------------------------------------
// JSON helpers
// ------------------------------------------------------------------

const gpb::Value* Field(const gpb::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() == gpb::Value::kNullValue) return nullptr;
  return &it->second;
}

std::optional<double> NumberField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != gpb::Value::kNumberValue) return std::nullopt;
  return v->number_value();
}

// whole number within [min, max]; JSON numbers arrive as doubles
std::optional<int64_t> Integral(double d, int64_t min, int64_t max) {
  if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
  if (d < static_cast<double>(min) || d > static_cast<double>(max)) return std::nullopt;
  return static_cast<int64_t>(d);
}

std::optional<int64_t> IntegralField(const gpb::Struct& s, const std::string& key, int64_t min, int64_t max) {
  auto d = NumberField(s, key);
  if (!d) return std::nullopt;
  return Integral(*d, min, max);
}

// node number as a JSON number or a "!hex" string
std::optional<uint32_t> NodeValue(const gpb::Value& v) {
  if (v.kind_case() == gpb::Value::kNumberValue) {
    auto n = Integral(v.number_value(), 0, UINT32_MAX);
    if (!n) return std::nullopt;
    return static_cast<uint32_t>(*n);
  }
  if (v.kind_case() == gpb::Value::kStringValue) {
    return util::ParseNodeId(v.string_value());
  }
  return std::nullopt;
}

std::optional<uint32_t> NodeField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v) return std::nullopt;
  return NodeValue(*v);
}

std::optional<bool> BoolField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != gpb::Value::kBoolValue) return std::nullopt;
  return v->bool_value();
}

std::optional<std::string> StringField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != gpb::Value::kStringValue) return std::nullopt;
  return v->string_value();
}

const gpb::Struct* StructField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != gpb::Value::kStructValue) return nullptr;
  return &v->struct_value();
}

const gpb::ListValue* ListField(const gpb::Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != gpb::Value::kListValue) return nullptr;
  return &v->list_value();
}

std::string JsonTypeTag(const std::optional<std::string>& type) {
  static const char* kKnown[] = {"text",         "position",      "nodeinfo",   "routing",    "admin",
                                 "waypoint",     "telemetry",     "traceroute", "neighborinfo",
                                 "store_forward", "range_test",   "map_report"};
  if (!type) return "unknown";
  for (const char* known : kKnown) {
    if (*type == known) return *type;
  }
  return "unknown";
}

std::optional<pb::Data> DecryptData(const ChannelCipher& cipher, const std::string& channel_id,
                                    const pb::MeshPacket& packet) {
  auto plain = cipher.Decrypt(channel_id, packet.from(), packet.id(), packet.encrypted());
  if (!plain) return std::nullopt;

  // a wrong key yields noise; accept only a Data with a known port
  pb::Data data;
  if (!data.ParseFromString(*plain) || !pb::PortNum_IsValid(data.portnum()) || data.portnum() == pb::UNKNOWN_APP) {
    MESHGRAPH_LOG_DEBUG("packet not decrypted", {observability::StringField("channel", channel_id),
                                                 observability::IntField("packet_id", packet.id())});
    return std::nullopt;
  }
  return data;
}

// JSON traceroute requests, like protobuf ones, carry no reply id
bool IsTracerouteRequest(const gpb::Struct& root) {
  if (BoolField(root, "want_response").value_or(false)) return true;
  if (const auto* v = Field(root, "request_id")) {
    return v->kind_case() == gpb::Value::kNumberValue && v->number_value() == 0;
  }
  return false;
}

} // namespace

EnvelopeDecoder::EnvelopeDecoder() = default;

EnvelopeDecoder::EnvelopeDecoder(ChannelCipher cipher) : cipher_(std::move(cipher)) {
}

std::string_view EnvelopeDecoder::TypeTag(uint32_t portnum) {
  switch (portnum) {
    case pb::TEXT_MESSAGE_APP:
    case pb::TEXT_MESSAGE_COMPRESSED_APP:
      return "text";
    case pb::POSITION_APP:
      return "position";
    case pb::NODEINFO_APP:
      return "nodeinfo";
    case pb::ROUTING_APP:
      return "routing";
    case pb::ADMIN_APP:
      return "admin";
    case pb::WAYPOINT_APP:
      return "waypoint";
    case pb::TELEMETRY_APP:
      return "telemetry";
    case pb::TRACEROUTE_APP:
      return "traceroute";
    case pb::NEIGHBORINFO_APP:
      return "neighborinfo";
    case pb::STORE_FORWARD_APP:
      return "store_forward";
    case pb::RANGE_TEST_APP:
      return "range_test";
    case pb::MAP_REPORT_APP:
      return "map_report";
    default:
      return "unknown";
  }
}

std::vector<model::Event> EnvelopeDecoder::Decode(const Envelope& envelope) const {
  try {
    if (envelope.topic.find("/json/") != std::string::npos) {
      return DecodeJson(envelope);
    }
    return DecodeProtobuf(envelope);
  } catch (const MalformedPayloadError& e) {
    return {model::Unknown{envelope.topic, e.what()}};
  } catch (const std::exception& e) {
    return {model::Unknown{envelope.topic, std::string("decode failed: ") + e.what()}};
  }
}

std::vector<model::Event> EnvelopeDecoder::DecodeProtobuf(const Envelope& envelope) const {
  pb::ServiceEnvelope se;
  if (!se.ParseFromString(envelope.payload)) {
    throw MalformedPayloadError("not a ServiceEnvelope");
  }
  if (!se.has_packet()) {
    throw MalformedPayloadError("envelope without packet");
  }

  const auto& packet = se.packet();
  if (packet.from() == 0 || packet.id() == 0) {
    throw MalformedPayloadError("packet header missing from/id");
  }

  model::Message m;
  m.id              = packet.id();
  m.timestamp       = envelope.received_at;
  m.from            = packet.from();
  m.to              = packet.to();
  m.physical_sender = packet.from();
  m.topic           = envelope.topic;
  m.relay_node      = packet.relay_node() & 0xff;
  m.hop_count       = HopCount(packet.hop_start(), packet.hop_limit());
  if (packet.rx_rssi() != 0) m.rssi = packet.rx_rssi();
  if (packet.rx_snr() != 0.0f) m.snr = packet.rx_snr();

  std::optional<pb::Data> data;
  if (packet.payload_variant_case() == pb::MeshPacket::kEncrypted) {
    data   = DecryptData(cipher_, se.channel_id(), packet);
    m.type = data ? std::string(TypeTag(data->portnum())) : "encrypted";
  } else if (packet.has_decoded()) {
    data   = packet.decoded();
    m.type = std::string(TypeTag(data->portnum()));
  } else {
    m.type = "unknown";
  }

  std::vector<model::Event> out;
  out.emplace_back(m);
  if (!data) return out;

  // a bad port payload still leaves the Message
  try {
    switch (data->portnum()) {
      case pb::NODEINFO_APP:
        AppendNodeInfo(packet, *data, envelope.received_at, out);
        break;
      case pb::POSITION_APP:
        AppendPosition(packet, *data, envelope.received_at, out);
        break;
      case pb::NEIGHBORINFO_APP:
        AppendNeighbors(packet, *data, envelope.received_at, out);
        break;
      case pb::TRACEROUTE_APP:
        AppendTraceroute(packet, *data, envelope.received_at, out);
        break;
      default:
        break;
    }
  } catch (const MalformedPayloadError& e) {
    MESHGRAPH_LOG_DEBUG("port payload skipped", {observability::StringField("topic", envelope.topic),
                                                 observability::IntField("packet_id", packet.id()),
                                                 observability::StringField("reason", e.what())});
    out.resize(1);
  }
  return out;
}

std::vector<model::Event> EnvelopeDecoder::DecodeJson(const Envelope& envelope) const {
  gpb::Struct root;
  auto        status = gpb::util::JsonStringToMessage(envelope.payload, &root);
  if (!status.ok()) {
    throw MalformedPayloadError("invalid JSON: " + std::string(status.message()));
  }

  const auto from = NodeField(root, "from");
  const auto id   = NodeField(root, "id");
  if (!from || *from == 0 || !id || *id == 0) {
    throw MalformedPayloadError("packet header missing from/id");
  }

  const int64_t ts = envelope.received_at;

  model::Message m;
  m.id              = *id;
  m.timestamp       = ts;
  m.from            = *from;
  m.to              = NodeField(root, "to").value_or(util::kBroadcastNode);
  m.physical_sender = *from;
  m.topic           = envelope.topic;
  m.type            = JsonTypeTag(StringField(root, "type"));
  m.rssi            = NumberField(root, "rssi");
  m.snr             = NumberField(root, "snr");
  if (auto hops = IntegralField(root, "hops_away", 0, INT32_MAX)) {
    m.hop_count = static_cast<int32_t>(*hops);
  } else if (auto start = IntegralField(root, "hop_start", 0, UINT32_MAX)) {
    if (auto limit = IntegralField(root, "hop_limit", 0, UINT32_MAX)) {
      m.hop_count = HopCount(static_cast<uint32_t>(*start), static_cast<uint32_t>(*limit));
    }
  }

  std::vector<model::Event> out;
  out.emplace_back(m);

  const gpb::Struct* payload = StructField(root, "payload");
  if (!payload) return out;

  if (m.type == "nodeinfo") {
    model::NodeInfoUpdate u;
    u.id = m.from;
    if (auto v = StringField(*payload, "longname")) u.long_name = CleanName(*v);
    if (auto v = StringField(*payload, "shortname")) u.short_name = CleanName(*v);
    if (auto v = IntegralField(*payload, "hardware", 0, UINT32_MAX)) u.hardware = static_cast<uint32_t>(*v);
    if (NumberField(*payload, "role")) {
      if (auto v = IntegralField(*payload, "role", 0, UINT32_MAX)) u.role = model::FromDeviceRole(static_cast<uint32_t>(*v));
    } else if (auto name = StringField(*payload, "role")) {
      u.role = model::RoleFromString(*name);
    }
    u.timestamp = ts;
    out.emplace_back(std::move(u));
  } else if (m.type == "position") {
    auto lat = NumberField(*payload, "latitude_i");
    auto lon = NumberField(*payload, "longitude_i");
    if (lat && lon && (*lat != 0 || *lon != 0)) {
      model::NodeInfoUpdate u;
      u.id        = m.from;
      u.latitude  = *lat * kCoordinateScale;
      u.longitude = *lon * kCoordinateScale;
      u.timestamp = ts;
      out.emplace_back(std::move(u));
    }
  } else if (m.type == "neighborinfo") {
    const model::NodeNum reporter = NodeField(*payload, "node_id").value_or(m.from);
    if (const auto* list = ListField(*payload, "neighbors")) {
      for (const auto& item : list->values()) {
        if (item.kind_case() != gpb::Value::kStructValue) continue;
        auto neighbor = NodeField(item.struct_value(), "node_id");
        if (!neighbor || *neighbor == 0) continue;
        model::NeighborReport r;
        r.reporter  = reporter;
        r.neighbor  = *neighbor;
        r.snr       = NumberField(item.struct_value(), "snr");
        r.timestamp = ts;
        out.emplace_back(r);
      }
    }
  } else if (m.type == "traceroute" && !IsTracerouteRequest(root)) {
    if (const auto* list = ListField(*payload, "route")) {
      model::TracerouteRecord r;
      r.packet_id = m.id;
      r.origin    = m.to;
      r.timestamp = ts;
      r.hops.push_back(m.to);
      for (const auto& item : list->values()) {
        if (auto hop = NodeValue(item)) r.hops.push_back(*hop);
      }
      r.hops.push_back(m.from);
      out.emplace_back(std::move(r));
    }
  }
  return out;
}

} // namespace meshgraph::ingest
