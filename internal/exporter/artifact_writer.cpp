#include "artifact_writer.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/util/node_id.hpp"

namespace meshgraph::exporter {

namespace gpb = google::protobuf;

namespace {

void SetNumber(gpb::Struct& s, const std::string& key, double v) {
  (*s.mutable_fields())[key].set_number_value(v);
}

void SetString(gpb::Struct& s, const std::string& key, const std::string& v) {
  (*s.mutable_fields())[key].set_string_value(v);
}

void SetOptional(gpb::Struct& s, const std::string& key, const std::optional<double>& v) {
  if (v) {
    SetNumber(s, key, *v);
  } else {
    (*s.mutable_fields())[key].set_null_value(gpb::NULL_VALUE);
  }
}

gpb::ListValue* SetList(gpb::Struct& s, const std::string& key) {
  return (*s.mutable_fields())[key].mutable_list_value();
}

gpb::Struct* SetStruct(gpb::Struct& s, const std::string& key) {
  return (*s.mutable_fields())[key].mutable_struct_value();
}

template <typename Message>
std::string ToJson(const Message& message) {
  gpb::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = gpb::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("artifact serialization failed: " + std::string(status.message()));
  }
  return json;
}

void AddBuckets(gpb::Struct& root, const std::vector<util::TimePoint>& buckets) {
  auto* x = SetList(root, "x");
  for (const auto& bucket : buckets) {
    x->add_values()->set_string_value(util::FormatIso8601(bucket));
  }
}

} // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw std::runtime_error("cannot create output directory " + output_dir_.string() + ": " + ec.message());
  }
}

std::string ArtifactWriter::GraphJson(const Graph& graph) {
  gpb::ListValue elements;

  for (const auto& node : graph.nodes) {
    auto* data = SetStruct(*elements.add_values()->mutable_struct_value(), "data");
    SetString(*data, "id", util::FormatNodeId(node.id));
    SetString(*data, "label", node.label);
    SetNumber(*data, "connections", node.connections);
    SetString(*data, "role", node.role);
  }

  for (const auto& edge : graph.edges) {
    const auto source = util::FormatNodeId(edge.source);
    const auto target = util::FormatNodeId(edge.target);

    auto* data = SetStruct(*elements.add_values()->mutable_struct_value(), "data");
    SetString(*data, "id", source + "_" + target);
    SetString(*data, "source", source);
    SetString(*data, "target", target);
    SetOptional(*data, "rssi", edge.rssi);
    SetNumber(*data, "count", static_cast<double>(edge.count));
    if (graph.view == ViewKind::kNeighbors) {
      SetOptional(*data, "snr", edge.snr);
    }
  }

  return ToJson(elements);
}

std::string ArtifactWriter::HourlyJson(const HourlySeries& series, util::TimePoint generated_at) {
  gpb::Struct root;
  AddBuckets(root, series.buckets);

  auto* types = SetList(root, "types");
  for (const auto& type : series.types) {
    types->add_values()->set_string_value(type);
  }

  auto* data = SetStruct(root, "data");
  for (const auto& [type, counts] : series.counts) {
    auto* row = SetList(*data, type);
    for (auto c : counts) row->add_values()->set_number_value(static_cast<double>(c));
  }

  auto* metadata = SetStruct(root, "metadata");
  SetNumber(*metadata, "total_messages", static_cast<double>(series.total));
  auto* by_type = SetStruct(*metadata, "messages_by_type");
  for (const auto& [type, total] : series.total_by_type) {
    SetNumber(*by_type, type, static_cast<double>(total));
    SetNumber(*by_type, type + "_percentage", series.percentage_by_type.at(type));
  }
  SetString(*metadata, "generated_at", util::FormatIso8601(generated_at));

  return ToJson(root);
}

std::string ArtifactWriter::SendersJson(const SenderSeries& series, util::TimePoint generated_at) {
  gpb::Struct root;
  AddBuckets(root, series.buckets);

  auto* senders = SetList(root, "unique_senders");
  for (auto c : series.unique_senders) senders->add_values()->set_number_value(static_cast<double>(c));

  auto* physical = SetList(root, "unique_physical_senders");
  for (auto c : series.unique_physical_senders) physical->add_values()->set_number_value(static_cast<double>(c));

  auto* metadata = SetStruct(root, "metadata");
  SetNumber(*metadata, "total_unique_senders", static_cast<double>(series.total_unique_senders));
  SetNumber(*metadata, "total_unique_physical_senders", static_cast<double>(series.total_unique_physical_senders));
  SetNumber(*metadata, "average_unique_senders_per_hour", series.average_unique_senders);
  SetNumber(*metadata, "average_unique_physical_senders_per_hour", series.average_unique_physical_senders);
  SetString(*metadata, "generated_at", util::FormatIso8601(generated_at));

  return ToJson(root);
}

std::filesystem::path ArtifactWriter::WriteGraph(const std::string& name, const Graph& graph) {
  return WriteAtomic(name, GraphJson(graph));
}

std::filesystem::path ArtifactWriter::WriteHourly(const std::string& name, const HourlySeries& series, util::TimePoint generated_at) {
  return WriteAtomic(name, HourlyJson(series, generated_at));
}

std::filesystem::path ArtifactWriter::WriteSenders(const std::string& name, const SenderSeries& series, util::TimePoint generated_at) {
  return WriteAtomic(name, SendersJson(series, generated_at));
}

std::filesystem::path ArtifactWriter::WriteMarker(const std::string& name, util::TimePoint exported_at) {
  return WriteAtomic(name, util::FormatCtime(exported_at) + "\n");
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
std::filesystem::path ArtifactWriter::WriteAtomic(const std::string& name, const std::string& content) {
  const auto final_path = output_dir_ / name;
  const auto tmp_path   = output_dir_ / ("." + name + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    out << content;
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw std::runtime_error("failed to publish " + final_path.string() + ": " + ec.message());
  }
  return final_path;
}

} // namespace meshgraph::exporter
