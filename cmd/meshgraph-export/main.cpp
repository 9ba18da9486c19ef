#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/exporter/exporter.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using meshgraph::factory::OpenMode;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  meshgraph-export [--config <config.yaml>] [--view messages|physical|neighbors|traceroutes]\n"
            << "                   [--window <duration>] [--series-days <n>] [--output <dir>]\n"
            << "                   [--retention-days <n> [--dry-run]]\n";
}

static uint32_t ParseCount(const std::string& flag, const std::string& text) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
    throw meshgraph::util::ConfigurationError(flag + " expects a positive integer, got '" + text + "'");
  }
  return value;
}

struct Arguments {
  std::string                config_path{"meshgraph.yaml"};
  bool                       explicit_config = false;
  std::optional<std::string> view;
  std::optional<std::string> window;
  std::optional<std::string> series_days;
  std::optional<std::string> output;
  std::optional<std::string> retention_days;
  bool                       dry_run = false;
};

static std::optional<Arguments> ParseArguments(int argc, char** argv) {
  Arguments args;
  for (int i = 1; i < argc; i += 2) {
    std::string flag = argv[i];
    if (flag == "--dry-run") {
      args.dry_run = true;
      --i;
      continue;
    }
    if (i + 1 >= argc) return std::nullopt;
    std::string value = argv[i + 1];

    if (flag == "--config") {
      args.config_path     = value;
      args.explicit_config = true;
    } else if (flag == "--view") {
      args.view = value;
    } else if (flag == "--window") {
      args.window = value;
    } else if (flag == "--series-days") {
      args.series_days = value;
    } else if (flag == "--output") {
      args.output = value;
    } else if (flag == "--retention-days") {
      args.retention_days = value;
    } else {
      return std::nullopt;
    }
  }
  if (args.dry_run && !args.retention_days) return std::nullopt;
  return args;
}

int main(int argc, char** argv) {
  auto args = ParseArguments(argc, argv);
  if (!args) {
    Usage();
    return 1;
  }

  try {
    auto config = (args->explicit_config || std::filesystem::exists(args->config_path))
                      ? meshgraph::config::ConfigLoader::LoadFromYaml(args->config_path)
                      : meshgraph::config::ConfigLoader::Defaults();

    meshgraph::observability::InitializeMetrics(config);
    meshgraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Resolve the export plan
    // ------------------------------------------------------------
    auto plan = meshgraph::factory::BuildExportPlan(config);
    if (args->view) {
      auto view = meshgraph::exporter::ParseViewKind(*args->view);
      if (!view) throw meshgraph::util::ConfigurationError("unknown view: " + *args->view);
      plan.views = {*view};
    }
    if (args->window) {
      try {
        plan.windows = {meshgraph::util::ParseDuration(*args->window)};
      } catch (const std::invalid_argument& e) {
        throw meshgraph::util::ConfigurationError(std::string("--window: ") + e.what());
      }
    }
    if (args->series_days) {
      plan.series_days = {ParseCount("--series-days", *args->series_days)};
    }

    std::filesystem::path output_dir = args->output ? *args->output : config.export_().output_dir();
    auto                  policy     = meshgraph::exporter::ParseRssiPolicy(config.export_().rssi_policy());

    // ------------------------------------------------------------
    // Export
    // ------------------------------------------------------------
    auto store = meshgraph::factory::BuildEventStore(config, OpenMode::kMustExist);
    meshgraph::exporter::Exporter exporter(store, output_dir, policy);

    const auto now     = meshgraph::util::Now();
    auto       written = exporter.Run(plan, now);
    MESHGRAPH_LOG_INFO("export finished", {meshgraph::observability::IntField("artifacts", static_cast<int64_t>(written.size())),
                                           meshgraph::observability::StringField("output_dir", output_dir.string())});

    // ------------------------------------------------------------
    // Retention
    // ------------------------------------------------------------
    if (args->retention_days) {
      const auto    days   = ParseCount("--retention-days", *args->retention_days);
      const int64_t cutoff = meshgraph::util::ToUnixSeconds(now) - static_cast<int64_t>(days) * 86400;
      if (args->dry_run) {
        const auto rows = store->CountBefore(cutoff);
        MESHGRAPH_LOG_INFO("retention dry run", {meshgraph::observability::IntField("retention_days", days),
                                                 meshgraph::observability::StringField("cutoff", meshgraph::util::FormatIso8601(meshgraph::util::FromUnixSeconds(cutoff))),
                                                 meshgraph::observability::IntField("rows_to_remove", static_cast<int64_t>(rows))});
      } else {
        const auto removed = store->PurgeBefore(cutoff);
        if (removed > 0) store->Compact();
        MESHGRAPH_LOG_INFO("retention applied", {meshgraph::observability::IntField("retention_days", days),
                                                 meshgraph::observability::IntField("rows_removed", static_cast<int64_t>(removed))});
      }
    }

    meshgraph::observability::ShutdownLogging();
    meshgraph::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    MESHGRAPH_LOG_ERROR("export failed", {meshgraph::observability::StringField("error", e.what())});
    meshgraph::observability::ShutdownLogging();
    meshgraph::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
