#include "internal/ingest/envelope_decoder.hpp"

#include <openssl/evp.h>

#include <array>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "meshgraph/mesh/v1/envelope.pb.h"

namespace {

namespace pb = meshgraph::mesh::v1;

using meshgraph::ingest::ChannelCipher;
using meshgraph::ingest::ChannelKeys;
using meshgraph::ingest::Envelope;
using meshgraph::ingest::EnvelopeDecoder;
using meshgraph::model::Message;
using meshgraph::model::NeighborReport;
using meshgraph::model::NodeInfoUpdate;
using meshgraph::model::NodeRole;
using meshgraph::model::TracerouteRecord;
using meshgraph::model::Unknown;

constexpr int64_t kNow = 1710000432;

pb::MeshPacket Packet(uint32_t from, uint32_t to, uint32_t id, pb::PortNum port, const std::string& payload) {
  pb::MeshPacket packet;
  packet.set_from(from);
  packet.set_to(to);
  packet.set_id(id);
  packet.mutable_decoded()->set_portnum(port);
  packet.mutable_decoded()->set_payload(payload);
  return packet;
}

Envelope Wrap(const pb::MeshPacket& packet, const std::string& topic = "msh/US/2/e/LongFast/!a1b2c3d4") {
  pb::ServiceEnvelope se;
  *se.mutable_packet() = packet;
  se.set_channel_id("LongFast");
  se.set_gateway_id("!a1b2c3d4");
  return Envelope{topic, se.SerializeAsString(), kNow};
}

// firmware counter block: packet id LE64, sender LE32, zero padding
std::string EncryptLikeFirmware(const EVP_CIPHER* cipher, const std::string& key, uint32_t from, uint32_t id,
                                const std::string& plain) {
  std::array<unsigned char, 16> iv{};
  for (int i = 0; i < 4; ++i) {
    iv[i]     = static_cast<unsigned char>(id >> (8 * i));
    iv[8 + i] = static_cast<unsigned char>(from >> (8 * i));
  }
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  assert(ctx != nullptr);
  assert(EVP_EncryptInit_ex(ctx, cipher, nullptr, reinterpret_cast<const unsigned char*>(key.data()), iv.data()) == 1);
  std::string out(plain.size(), '\0');
  int         len = 0;
  assert(EVP_EncryptUpdate(ctx, reinterpret_cast<unsigned char*>(out.data()), &len,
                           reinterpret_cast<const unsigned char*>(plain.data()), static_cast<int>(plain.size())) == 1);
  EVP_CIPHER_CTX_free(ctx);
  out.resize(static_cast<std::size_t>(len));
  return out;
}

pb::MeshPacket EncryptedPacket(uint32_t from, uint32_t id, const pb::Data& data, const EVP_CIPHER* cipher,
                               const std::string& key) {
  pb::MeshPacket packet;
  packet.set_from(from);
  packet.set_to(0xFFFFFFFF);
  packet.set_id(id);
  packet.set_encrypted(EncryptLikeFirmware(cipher, key, from, id, data.SerializeAsString()));
  return packet;
}

void TestTextMessageHeader() {
  auto packet = Packet(0x11111111, 0xFFFFFFFF, 42, pb::TEXT_MESSAGE_APP, "hello mesh");
  packet.set_rx_rssi(-97);
  packet.set_rx_snr(6.25f);
  packet.set_hop_start(3);
  packet.set_hop_limit(1);
  packet.set_relay_node(0x1234);

  auto events = EnvelopeDecoder{}.Decode(Wrap(packet));
  assert(events.size() == 1);
  const auto& m = std::get<Message>(events[0]);
  assert(m.id == 42);
  assert(m.from == 0x11111111);
  assert(m.to == 0xFFFFFFFF);
  assert(m.physical_sender == 0x11111111);
  assert(m.type == "text");
  assert(m.timestamp == kNow);
  assert(m.rssi.has_value() && *m.rssi == -97);
  assert(m.snr.has_value() && *m.snr == 6.25);
  assert(m.hop_count.has_value() && *m.hop_count == 2);
  assert(m.relay_node == 0x34);
}

void TestMissingRadioMetadataStaysAbsent() {
  auto events = EnvelopeDecoder{}.Decode(Wrap(Packet(0x11111111, 0x22222222, 43, pb::ROUTING_APP, "")));
  const auto& m = std::get<Message>(events[0]);
  assert(m.type == "routing");
  assert(!m.rssi.has_value());
  assert(!m.snr.has_value());
  assert(!m.hop_count.has_value());
}

void TestEncryptedPacket() {
  pb::MeshPacket packet;
  packet.set_from(0x11111111);
  packet.set_to(0xFFFFFFFF);
  packet.set_id(44);
  packet.set_encrypted(std::string("\x8a\x01\x02\x03", 4));

  // "AA==" disables decryption, so the payload stays opaque
  ChannelKeys keys;
  keys.default_psk = "AA==";
  auto events = EnvelopeDecoder{ChannelCipher(keys)}.Decode(Wrap(packet));
  assert(events.size() == 1);
  assert(std::get<Message>(events[0]).type == "encrypted");
}

void TestDefaultKeyDecryptsNodeInfo() {
  pb::User user;
  user.set_long_name("Ridge Relay");
  user.set_short_name("RR");
  user.set_role(2);

  pb::Data data;
  data.set_portnum(pb::NODEINFO_APP);
  data.set_payload(user.SerializeAsString());

  const std::string default_key("\xd4\xf1\xbb\x3a\x20\x29\x07\x59\xf0\xbc\xff\xab\xcf\x4e\x69\x01", 16);
  auto packet = EncryptedPacket(0x0a0b0c0d, 0x5eed0001, data, EVP_aes_128_ctr(), default_key);

  auto events = EnvelopeDecoder{}.Decode(Wrap(packet));
  assert(events.size() == 2);
  const auto& m = std::get<Message>(events[0]);
  assert(m.type == "nodeinfo");
  assert(m.id == 0x5eed0001);
  const auto& u = std::get<NodeInfoUpdate>(events[1]);
  assert(u.id == 0x0a0b0c0d);
  assert(u.long_name == std::string("Ridge Relay"));
  assert(u.role == NodeRole::kRouter);
}

void TestChannelKeyDecryptsTraceroute() {
  pb::RouteDiscovery route;
  route.add_route(0x22222222);

  pb::Data data;
  data.set_portnum(pb::TRACEROUTE_APP);
  data.set_payload(route.SerializeAsString());
  data.set_request_id(901);

  // 32 byte key "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=" selects AES-256
  const std::string key = "0123456789abcdef0123456789abcdef";
  auto              packet = EncryptedPacket(0x33333333, 0x00c0ffee, data, EVP_aes_256_ctr(), key);
  packet.set_to(0x11111111);

  ChannelKeys keys;
  keys.psk_by_channel["Backhaul"] = "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=";
  EnvelopeDecoder decoder{ChannelCipher(keys)};

  pb::ServiceEnvelope se;
  *se.mutable_packet() = packet;
  se.set_channel_id("Backhaul");
  auto events = decoder.Decode(Envelope{"msh/US/2/e/Backhaul/!a1b2c3d4", se.SerializeAsString(), kNow});
  assert(events.size() == 2);
  assert(std::get<Message>(events[0]).type == "traceroute");
  const auto& tr = std::get<TracerouteRecord>(events[1]);
  assert((tr.hops == std::vector<uint32_t>{0x11111111, 0x22222222, 0x33333333}));
}

void TestNodeInfoUpdate() {
  pb::User user;
  user.set_long_name("  Base   Camp\x01 ");
  user.set_short_name("BC");
  user.set_hw_model(9);
  user.set_role(2);

  auto events = EnvelopeDecoder{}.Decode(Wrap(Packet(0x0a0b0c0d, 0xFFFFFFFF, 45, pb::NODEINFO_APP, user.SerializeAsString())));
  assert(events.size() == 2);
  assert(std::get<Message>(events[0]).type == "nodeinfo");
  const auto& u = std::get<NodeInfoUpdate>(events[1]);
  assert(u.id == 0x0a0b0c0d);
  assert(u.long_name == std::string("Base Camp"));
  assert(u.short_name == std::string("BC"));
  assert(u.hardware == 9u);
  assert(u.role == NodeRole::kRouter);
  assert(!u.latitude.has_value());
}

void TestPositionUpdate() {
  pb::Position pos;
  pos.set_latitude_i(475000000);
  pos.set_longitude_i(-1223000000);

  auto events = EnvelopeDecoder{}.Decode(Wrap(Packet(0x0a0b0c0d, 0xFFFFFFFF, 46, pb::POSITION_APP, pos.SerializeAsString())));
  assert(events.size() == 2);
  const auto& u = std::get<NodeInfoUpdate>(events[1]);
  assert(std::fabs(*u.latitude - 47.5) < 1e-9);
  assert(std::fabs(*u.longitude + 122.3) < 1e-9);
  assert(!u.role.has_value());

  pb::Position no_fix;
  auto         none = EnvelopeDecoder{}.Decode(Wrap(Packet(0x0a0b0c0d, 0xFFFFFFFF, 47, pb::POSITION_APP, no_fix.SerializeAsString())));
  assert(none.size() == 1);
}

void TestNeighborInfoReports() {
  pb::NeighborInfo info;
  info.set_node_id(0x0a0b0c0d);
  auto* n1 = info.add_neighbors();
  n1->set_node_id(0x11111111);
  n1->set_snr(7.5f);
  auto* n2 = info.add_neighbors();
  n2->set_node_id(0x22222222);
  n2->set_snr(-3.0f);

  auto events = EnvelopeDecoder{}.Decode(Wrap(Packet(0x0a0b0c0d, 0xFFFFFFFF, 48, pb::NEIGHBORINFO_APP, info.SerializeAsString())));
  assert(events.size() == 3);
  const auto& r1 = std::get<NeighborReport>(events[1]);
  const auto& r2 = std::get<NeighborReport>(events[2]);
  assert(r1.reporter == 0x0a0b0c0d && r1.neighbor == 0x11111111 && *r1.snr == 7.5);
  assert(r2.reporter == 0x0a0b0c0d && r2.neighbor == 0x22222222 && *r2.snr == -3.0);
}

void TestTracerouteReplyHops() {
  pb::RouteDiscovery route;
  route.add_route(0x22222222);

  // reply travels from the traced node C back to the origin A via B
  auto packet = Packet(0x33333333, 0x11111111, 49, pb::TRACEROUTE_APP, route.SerializeAsString());
  packet.mutable_decoded()->set_request_id(900);

  auto events = EnvelopeDecoder{}.Decode(Wrap(packet));
  assert(events.size() == 2);
  const auto& tr = std::get<TracerouteRecord>(events[1]);
  assert(tr.packet_id == 49);
  assert(tr.origin == 0x11111111);
  assert((tr.hops == std::vector<uint32_t>{0x11111111, 0x22222222, 0x33333333}));

  // requests carry no completed route
  auto request = Packet(0x11111111, 0x33333333, 50, pb::TRACEROUTE_APP, route.SerializeAsString());
  assert(EnvelopeDecoder{}.Decode(Wrap(request)).size() == 1);
}

void TestBadPortPayloadKeepsMessage() {
  auto events = EnvelopeDecoder{}.Decode(
      Wrap(Packet(0x0a0b0c0d, 0xFFFFFFFF, 51, pb::NODEINFO_APP, std::string("\x0a\x05" "ab", 4))));
  assert(events.size() == 1);
  assert(std::get<Message>(events[0]).type == "nodeinfo");
}

void TestCorruptEnvelopeIsUnknown() {
  EnvelopeDecoder decoder;

  auto truncated = decoder.Decode(Envelope{"msh/US/2/e/LongFast/!a1b2c3d4", std::string("\x0a\x05" "ab", 4), kNow});
  assert(truncated.size() == 1);
  assert(std::holds_alternative<Unknown>(truncated[0]));
  assert(std::get<Unknown>(truncated[0]).topic == "msh/US/2/e/LongFast/!a1b2c3d4");

  pb::ServiceEnvelope no_packet;
  no_packet.set_channel_id("LongFast");
  auto empty = decoder.Decode(Envelope{"msh/US/2/e/LongFast/!a1b2c3d4", no_packet.SerializeAsString(), kNow});
  assert(std::holds_alternative<Unknown>(empty[0]));

  pb::MeshPacket anonymous;
  anonymous.set_id(52);
  auto no_from = decoder.Decode(Wrap(anonymous));
  assert(std::holds_alternative<Unknown>(no_from[0]));
}

void TestJsonMessages() {
  EnvelopeDecoder decoder;

  auto text = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                      R"({"from":286331153,"to":572662306,"id":77,"type":"text","rssi":-101,"snr":4.5,
                                          "hops_away":1,"payload":{"text":"hi"}})",
                                      kNow});
  assert(text.size() == 1);
  const auto& m = std::get<Message>(text[0]);
  assert(m.from == 0x11111111);
  assert(m.to == 0x22222222);
  assert(m.id == 77);
  assert(m.type == "text");
  assert(*m.rssi == -101);
  assert(*m.snr == 4.5);
  assert(*m.hop_count == 1);

  auto nodeinfo = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                          R"({"from":286331153,"id":78,"type":"nodeinfo",
                                              "payload":{"longname":"Hill Top","shortname":"HT","hardware":43,"role":3}})",
                                          kNow});
  assert(nodeinfo.size() == 2);
  assert(std::get<Message>(nodeinfo[0]).to == 0xFFFFFFFF);
  const auto& u = std::get<NodeInfoUpdate>(nodeinfo[1]);
  assert(u.long_name == std::string("Hill Top"));
  assert(u.role == NodeRole::kRouterClient);

  auto neighbors = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                           R"({"from":286331153,"id":79,"type":"neighborinfo",
                                               "payload":{"node_id":286331153,"neighbors":[{"node_id":572662306,"snr":2.0}]}})",
                                           kNow});
  assert(neighbors.size() == 2);
  assert(std::get<NeighborReport>(neighbors[1]).neighbor == 0x22222222);

  auto odd_type = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4", R"({"from":"!11111111","id":80,"type":"sensor"})", kNow});
  assert(std::get<Message>(odd_type[0]).type == "unknown");
  assert(std::get<Message>(odd_type[0]).from == 0x11111111);

  auto broken = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4", "{not json", kNow});
  assert(std::holds_alternative<Unknown>(broken[0]));

  auto headless = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4", R"({"type":"text"})", kNow});
  assert(std::holds_alternative<Unknown>(headless[0]));
}

void TestJsonRejectsOutOfRangeNumbers() {
  EnvelopeDecoder decoder;

  auto trace = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                       R"({"from":286331153,"to":572662306,"id":81,"type":"traceroute","hops_away":1e12,
                                           "payload":{"route":[-5,1e15,2.5,"!33333333",4294967296]}})",
                                       kNow});
  assert(trace.size() == 2);
  assert(!std::get<Message>(trace[0]).hop_count.has_value());
  const auto& tr = std::get<TracerouteRecord>(trace[1]);
  assert((tr.hops == std::vector<uint32_t>{0x22222222, 0x33333333, 0x11111111}));

  auto hops = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                      R"({"from":286331153,"id":82,"type":"text","hop_start":2.5,"hop_limit":-1})", kNow});
  assert(!std::get<Message>(hops[0]).hop_count.has_value());

  auto hops_ok = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                         R"({"from":286331153,"id":83,"type":"text","hop_start":3,"hop_limit":1})", kNow});
  assert(*std::get<Message>(hops_ok[0]).hop_count == 2);

  auto node = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                      R"({"from":286331153,"id":84,"type":"nodeinfo",
                                          "payload":{"longname":"Odd","hardware":1e20,"role":-1}})",
                                      kNow});
  assert(node.size() == 2);
  const auto& u = std::get<NodeInfoUpdate>(node[1]);
  assert(u.long_name == std::string("Odd"));
  assert(!u.hardware.has_value());
  assert(!u.role.has_value());

  auto fractional = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                            R"({"from":286331153,"id":85,"type":"nodeinfo","payload":{"hardware":9.5,"role":1.5}})",
                                            kNow});
  assert(!std::get<NodeInfoUpdate>(fractional[1]).hardware.has_value());
  assert(!std::get<NodeInfoUpdate>(fractional[1]).role.has_value());
}

void TestJsonTracerouteRequestSkipped() {
  EnvelopeDecoder decoder;

  auto wants = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                       R"({"from":286331153,"to":572662306,"id":86,"type":"traceroute","want_response":true,
                                           "payload":{"route":[858993459]}})",
                                       kNow});
  assert(wants.size() == 1);
  assert(std::get<Message>(wants[0]).type == "traceroute");

  auto unanswered = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                            R"({"from":286331153,"to":572662306,"id":87,"type":"traceroute","request_id":0,
                                                "payload":{"route":[858993459]}})",
                                            kNow});
  assert(unanswered.size() == 1);

  auto reply = decoder.Decode(Envelope{"msh/US/2/json/LongFast/!a1b2c3d4",
                                       R"({"from":286331153,"to":572662306,"id":88,"type":"traceroute","request_id":900,
                                           "payload":{"route":[858993459]}})",
                                       kNow});
  assert(reply.size() == 2);
  assert(std::holds_alternative<TracerouteRecord>(reply[1]));
}

void TestPortTags() {
  assert(EnvelopeDecoder::TypeTag(pb::TELEMETRY_APP) == "telemetry");
  assert(EnvelopeDecoder::TypeTag(pb::MAP_REPORT_APP) == "map_report");
  assert(EnvelopeDecoder::TypeTag(pb::STORE_FORWARD_APP) == "store_forward");
  assert(EnvelopeDecoder::TypeTag(pb::RANGE_TEST_APP) == "range_test");
  assert(EnvelopeDecoder::TypeTag(9999) == "unknown");
}

} // namespace

int main() {
  TestTextMessageHeader();
  TestMissingRadioMetadataStaysAbsent();
  TestEncryptedPacket();
  TestDefaultKeyDecryptsNodeInfo();
  TestChannelKeyDecryptsTraceroute();
  TestNodeInfoUpdate();
  TestPositionUpdate();
  TestNeighborInfoReports();
  TestTracerouteReplyHops();
  TestBadPortPayloadKeepsMessage();
  TestCorruptEnvelopeIsUnknown();
  TestJsonMessages();
  TestJsonRejectsOutOfRangeNumbers();
  TestJsonTracerouteRequestSkipped();
  TestPortTags();

  std::cout << "meshgraph_unit_envelope_decoder: pass\n";
  return 0;
}
