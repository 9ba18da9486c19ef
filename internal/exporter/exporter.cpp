#include "exporter.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/store/event_store.hpp"

namespace meshgraph::exporter {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

} // namespace

Exporter::Exporter(std::shared_ptr<store::EventStore> store, std::filesystem::path output_dir, RssiPolicy policy)
    : store_(std::move(store)), writer_(std::move(output_dir)), graphs_(policy) {
}

std::string Exporter::GraphArtifactName(ViewKind view, std::chrono::milliseconds window) {
  const auto label = util::DurationLabel(window);
  switch (view) {
    case ViewKind::kMessages:
      return "cytoscape_messages_" + label + ".json";
    case ViewKind::kPhysicalSenders:
      return "cytoscape_messages_physical_" + label + ".json";
    case ViewKind::kNeighbors:
      return "cytoscape_neighbors_" + label + ".json";
    case ViewKind::kTraceroutes:
      return "cytoscape_traceroutes_" + label + ".json";
  }
  return "cytoscape_unknown_" + label + ".json";
}

std::string Exporter::HourlyArtifactName(uint32_t days) {
  return "hourly_messages_" + std::to_string(days) + "d.json";
}

std::string Exporter::SendersArtifactName(uint32_t days) {
  return "unique_senders_" + std::to_string(days) + "d.json";
}

Graph Exporter::BuildView(ViewKind view, std::chrono::milliseconds window, util::TimePoint now) const {
  const int64_t end   = util::ToUnixSeconds(now);
  const int64_t start = end - std::chrono::duration_cast<std::chrono::seconds>(window).count();

  auto snapshot = store_->QueryRange(GraphBuilder::RequiredKinds(view), start, end);
  return graphs_.Build(view, snapshot);
}

std::filesystem::path Exporter::ExportView(ViewKind view, std::chrono::milliseconds window, util::TimePoint now) {
  const auto started = std::chrono::steady_clock::now();

  auto graph = BuildView(view, window, now);
  auto path  = writer_.WriteGraph(GraphArtifactName(view, window), graph);

  observability::Metrics::Instance().ObserveExportDurationMs(ToString(view), ElapsedMs(started));
  MESHGRAPH_LOG_INFO("graph exported", {StringField("view", ToString(view)),
                                        StringField("window", util::DurationLabel(window)),
                                        IntField("nodes", static_cast<int64_t>(graph.nodes.size())),
                                        IntField("edges", static_cast<int64_t>(graph.edges.size())),
                                        StringField("path", path.string())});
  return path;
}

std::vector<std::filesystem::path> Exporter::ExportSeries(uint32_t days, util::TimePoint now) {
  const auto started = std::chrono::steady_clock::now();

  store_->RefreshRollups();

  const auto [start, end] = SeriesBuilder::Range(now, days);
  auto snapshot = store_->QueryRange({store::EntityKind::kHourlyCounts, store::EntityKind::kHourlySenders}, start, end);

  auto hourly  = series_.BuildHourly(snapshot.hourly_counts, now, days);
  auto senders = series_.BuildSenders(snapshot.hourly_senders, now, days);

  std::vector<std::filesystem::path> written;
  written.push_back(writer_.WriteHourly(HourlyArtifactName(days), hourly, now));
  written.push_back(writer_.WriteSenders(SendersArtifactName(days), senders, now));

  observability::Metrics::Instance().ObserveExportDurationMs("series", ElapsedMs(started));
  MESHGRAPH_LOG_INFO("series exported", {IntField("days", days), IntField("messages", static_cast<int64_t>(hourly.total)),
                                         IntField("unique_senders", static_cast<int64_t>(senders.total_unique_senders)),
                                         DoubleField("senders_per_hour", senders.average_unique_senders)});
  return written;
}

std::vector<std::filesystem::path> Exporter::Run(const ExportPlan& plan, util::TimePoint now) {
  std::vector<std::filesystem::path> written;

  for (auto window : plan.windows) {
    for (auto view : plan.views) {
      written.push_back(ExportView(view, window, now));
    }
  }

  for (auto days : plan.series_days) {
    auto files = ExportSeries(days, now);
    written.insert(written.end(), files.begin(), files.end());
  }

  if (plan.write_marker) {
    written.push_back(writer_.WriteMarker(kMarkerName, now));
  }
  return written;
}

} // namespace meshgraph::exporter
