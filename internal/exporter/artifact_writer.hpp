#pragma once

#include <filesystem>
#include <string>

#include "graph_builder.hpp"
#include "series_builder.hpp"

namespace meshgraph::exporter {

/*
  Serializes graphs and series to JSON artifacts in one output directory.

  Every file is written to a temporary sibling and renamed into place, so
  readers see either the previous artifact or the complete new one.
*/
class ArtifactWriter {
 public:
  explicit ArtifactWriter(std::filesystem::path output_dir);

  const std::filesystem::path& OutputDir() const {
    return output_dir_;
  }

  std::filesystem::path WriteGraph(const std::string& name, const Graph& graph);
  std::filesystem::path WriteHourly(const std::string& name, const HourlySeries& series, util::TimePoint generated_at);
  std::filesystem::path WriteSenders(const std::string& name, const SenderSeries& series, util::TimePoint generated_at);

  // Plain text marker holding the export time.
  std::filesystem::path WriteMarker(const std::string& name, util::TimePoint exported_at);

  static std::string GraphJson(const Graph& graph);
  static std::string HourlyJson(const HourlySeries& series, util::TimePoint generated_at);
  static std::string SendersJson(const SenderSeries& series, util::TimePoint generated_at);

 private:
  std::filesystem::path WriteAtomic(const std::string& name, const std::string& content);

  std::filesystem::path output_dir_;
};

} // namespace meshgraph::exporter
