#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "artifact_writer.hpp"
#include "graph_builder.hpp"
#include "series_builder.hpp"

namespace meshgraph::store {
class EventStore;
}

namespace meshgraph::exporter {

struct ExportPlan {
  std::vector<ViewKind>                  views;
  std::vector<std::chrono::milliseconds> windows;
  std::vector<uint32_t>                  series_days;
  bool                                   write_marker = true;
};

/*
  One bounded export run over the EventStore.

  Each view/window pair reads its own snapshot [now - window, now]. A window
  without events still produces a well-formed, empty artifact.
*/
class Exporter {
 public:
  Exporter(std::shared_ptr<store::EventStore> store, std::filesystem::path output_dir, RssiPolicy policy);

  Graph BuildView(ViewKind view, std::chrono::milliseconds window, util::TimePoint now) const;

  std::filesystem::path ExportView(ViewKind view, std::chrono::milliseconds window, util::TimePoint now);

  // hourly_messages_<d>d.json and unique_senders_<d>d.json from the hourly
  // rollup, refreshed first so the current hour is included.
  std::vector<std::filesystem::path> ExportSeries(uint32_t days, util::TimePoint now);

  // Views x windows, then series, then the marker. Returns every file written.
  std::vector<std::filesystem::path> Run(const ExportPlan& plan, util::TimePoint now);

  static std::string GraphArtifactName(ViewKind view, std::chrono::milliseconds window);
  static std::string HourlyArtifactName(uint32_t days);
  static std::string SendersArtifactName(uint32_t days);
  static constexpr const char* kMarkerName = "cytoscape_data.txt";

 private:
  std::shared_ptr<store::EventStore> store_;
  ArtifactWriter                     writer_;
  GraphBuilder                       graphs_;
  SeriesBuilder                      series_;
};

} // namespace meshgraph::exporter
