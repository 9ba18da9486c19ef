#include "internal/exporter/artifact_writer.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

namespace gpb = google::protobuf;

using meshgraph::exporter::ArtifactWriter;
using meshgraph::exporter::Graph;
using meshgraph::exporter::GraphEdge;
using meshgraph::exporter::GraphNode;
using meshgraph::exporter::SeriesBuilder;
using meshgraph::exporter::ViewKind;
using meshgraph::util::FromUnixSeconds;

constexpr int64_t kNow = 1710000432;

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "meshgraph_artifact_writer_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

const gpb::Struct& Data(const gpb::Value& element) {
  return element.struct_value().fields().at("data").struct_value();
}

Graph SampleGraph(ViewKind view) {
  Graph graph;
  graph.view = view;

  GraphNode a;
  a.id          = 0x0000000a;
  a.label       = "BASE";
  a.role        = "router";
  a.connections = 1;
  GraphNode b;
  b.id          = 0x0000000b;
  b.label       = "!0000000b";
  b.role        = "unknown";
  b.connections = 1;
  graph.nodes = {a, b};

  GraphEdge edge;
  edge.source = a.id;
  edge.target = b.id;
  edge.count  = 3;
  edge.snr    = 4.5;
  if (view == ViewKind::kMessages) edge.rssi = -88.0;
  graph.edges = {edge};
  return graph;
}

void TestGraphElements() {
  gpb::ListValue elements;
  auto           status = gpb::util::JsonStringToMessage(ArtifactWriter::GraphJson(SampleGraph(ViewKind::kMessages)), &elements);
  assert(status.ok());
  assert(elements.values_size() == 3);

  const auto& node = Data(elements.values(0));
  assert(node.fields().at("id").string_value() == "!0000000a");
  assert(node.fields().at("label").string_value() == "BASE");
  assert(node.fields().at("role").string_value() == "router");
  assert(node.fields().at("connections").number_value() == 1);

  const auto& edge = Data(elements.values(2));
  assert(edge.fields().at("id").string_value() == "!0000000a_!0000000b");
  assert(edge.fields().at("source").string_value() == "!0000000a");
  assert(edge.fields().at("target").string_value() == "!0000000b");
  assert(edge.fields().at("count").number_value() == 3);
  assert(edge.fields().at("rssi").number_value() == -88.0);
  assert(edge.fields().count("snr") == 0);
}

void TestNeighborEdgesCarrySnrAndNullRssi() {
  gpb::ListValue elements;
  assert(gpb::util::JsonStringToMessage(ArtifactWriter::GraphJson(SampleGraph(ViewKind::kNeighbors)), &elements).ok());

  const auto& edge = Data(elements.values(2));
  assert(edge.fields().at("rssi").kind_case() == gpb::Value::kNullValue);
  assert(edge.fields().at("snr").number_value() == 4.5);
}

void TestEmptyGraphIsEmptyArray() {
  gpb::ListValue elements;
  assert(gpb::util::JsonStringToMessage(ArtifactWriter::GraphJson(Graph{}), &elements).ok());
  assert(elements.values_size() == 0);
}

void TestHourlyDocument() {
  meshgraph::model::HourlyTypeCount c;
  c.hour  = 1710000000;
  c.type  = "text";
  c.count = 1;

  auto series = SeriesBuilder{}.BuildHourly({c}, FromUnixSeconds(kNow), 1);

  gpb::Struct root;
  assert(gpb::util::JsonStringToMessage(ArtifactWriter::HourlyJson(series, FromUnixSeconds(kNow)), &root).ok());
  assert(root.fields().at("x").list_value().values_size() == 24);
  assert(root.fields().at("x").list_value().values(23).string_value() == "2024-03-09T16:00:00Z");
  assert(root.fields().at("types").list_value().values(0).string_value() == "text");
  assert(root.fields().at("data").struct_value().fields().at("text").list_value().values(23).number_value() == 1);

  const auto& metadata = root.fields().at("metadata").struct_value();
  assert(metadata.fields().at("total_messages").number_value() == 1);
  const auto& by_type = metadata.fields().at("messages_by_type").struct_value();
  assert(by_type.fields().at("text").number_value() == 1);
  assert(by_type.fields().at("text_percentage").number_value() == 100.0);
  assert(metadata.fields().at("generated_at").string_value() == "2024-03-09T16:07:12Z");
}

void TestSendersDocument() {
  auto series = SeriesBuilder{}.BuildSenders({}, FromUnixSeconds(kNow), 1);

  gpb::Struct root;
  assert(gpb::util::JsonStringToMessage(ArtifactWriter::SendersJson(series, FromUnixSeconds(kNow)), &root).ok());
  assert(root.fields().at("unique_senders").list_value().values_size() == 24);
  assert(root.fields().at("unique_physical_senders").list_value().values_size() == 24);

  const auto& metadata = root.fields().at("metadata").struct_value();
  assert(metadata.fields().at("total_unique_senders").number_value() == 0);
  assert(metadata.fields().count("average_unique_physical_senders_per_hour") == 1);
}

void TestFilesAreReplacedAtomically() {
  const auto     dir = TempDir("atomic");
  ArtifactWriter writer(dir);
  assert(std::filesystem::is_directory(dir));

  auto first = writer.WriteGraph("cytoscape_messages_1h.json", SampleGraph(ViewKind::kMessages));
  assert(first == dir / "cytoscape_messages_1h.json");
  auto second = writer.WriteGraph("cytoscape_messages_1h.json", Graph{});
  assert(second == first);

  gpb::ListValue elements;
  assert(gpb::util::JsonStringToMessage(ReadFile(second), &elements).ok());
  assert(elements.values_size() == 0);

  auto marker = writer.WriteMarker("cytoscape_data.txt", FromUnixSeconds(kNow));
  assert(ReadFile(marker) == "Sat Mar  9 16:07:12 UTC 2024\n");

  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    assert(entry.path().extension() != ".tmp");
  }
}

} // namespace

int main() {
  TestGraphElements();
  TestNeighborEdgesCarrySnrAndNullRssi();
  TestEmptyGraphIsEmptyArray();
  TestHourlyDocument();
  TestSendersDocument();
  TestFilesAreReplacedAtomically();

  std::cout << "meshgraph_unit_artifact_writer: pass\n";
  return 0;
}
