#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using meshgraph::config::ConfigLoader;
using meshgraph::util::ConfigurationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "meshgraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestFullDocumentIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(broker:
  address: mqtt.meshtastic.org
  port: 1883
  topic: "msh/US/#"
  client_id: collector-7
  username: meshdev
  password: "1234"
  keepalive: 30s
reconnect:
  min_delay: 500ms
  max_delay: 2m
  stable_after: 10s
database:
  path: /var/lib/meshgraph/mesh.db
  write_retries: 5
  retry_backoff: 20ms
ingest:
  workers: 0
  queue_capacity: 64
export:
  output_dir: /srv/www/data
  windows: [15min, 1h]
  series_days: [7]
  rssi_policy: mean
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.broker().address() == "mqtt.meshtastic.org");
  assert(config.broker().port() == 1883);
  assert(config.broker().topic() == "msh/US/#");
  assert(config.broker().password() == "1234");
  assert(config.broker().keepalive() == "30s");
  assert(config.reconnect().max_delay() == "2m");
  assert(config.database().path() == "/var/lib/meshgraph/mesh.db");
  assert(config.database().write_retries() == 5);
  assert(config.ingest().workers() == 0);
  assert(config.ingest().queue_capacity() == 64);
  assert(config.ingest().handoff_retries() == 3);
  assert(config.export_().windows_size() == 2);
  assert(config.export_().windows(1) == "1h");
  assert(config.export_().series_days_size() == 1);
  assert(config.export_().series_days(0) == 7);
  assert(config.export_().rssi_policy() == "mean");
  assert(config.logging().level() == "debug");
}

void TestDefaultsFillMissingSections() {
  auto config = ConfigLoader::LoadFromString("broker:\n  tls: true\n");
  assert(config.broker().address() == "localhost");
  assert(config.broker().port() == 8883);
  assert(config.broker().topic() == "msh/#");
  assert(config.broker().client_id() == "meshgraph-collector");
  assert(config.reconnect().min_delay() == "1s");
  assert(config.reconnect().max_delay() == "60s");
  assert(config.database().path() == "mqtt_messages.db");
  assert(config.database().write_retries() == 3);
  assert(config.ingest().workers() == 2);
  assert(config.ingest().queue_capacity() == 10000);
  assert(config.export_().output_dir() == "data");
  assert(config.export_().windows_size() == 5);
  assert(config.export_().windows(0) == "15min");
  assert(config.export_().windows(4) == "24h");
  assert(config.export_().series_days_size() == 4);
  assert(config.export_().series_days(3) == 30);
  assert(config.export_().rssi_policy() == "latest");
  assert(config.broker().default_channel_key() == "AQ==");
  assert(config.broker().channel_keys().empty());

  auto empty = ConfigLoader::LoadFromString("");
  assert(empty.broker().port() == 1883);

  auto defaults = ConfigLoader::Defaults();
  assert(defaults.broker().topic() == "msh/#");
}

void TestChannelKeysAreLoaded() {
  auto config = ConfigLoader::LoadFromString(
      "broker:\n"
      "  default_channel_key: \"AA==\"\n"
      "  channel_keys:\n"
      "    LongFast: \"AQ==\"\n"
      "    Backhaul: \"MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=\"\n");
  assert(config.broker().default_channel_key() == "AA==");
  assert(config.broker().channel_keys().size() == 2);
  assert(config.broker().channel_keys().at("LongFast") == "AQ==");

  assert(ThrowsConfigurationError([] {
    (void)ConfigLoader::LoadFromString("broker:\n  channel_keys:\n    LongFast: \"not-base64\"\n");
  }));
  // 36 bytes is longer than an AES-256 key
  assert(ThrowsConfigurationError([] {
    (void)ConfigLoader::LoadFromString(
        "broker:\n  default_channel_key: \"MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWYwMTIz\"\n");
  }));
}

void TestUnknownFieldsAreRejected() {
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("broker:\n  hostname: x\n"); }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("unknown_section: 1\n"); }));
}

void TestInvalidValuesAreRejected() {
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("broker:\n  port: 70000\n"); }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("reconnect:\n  min_delay: soon\n"); }));
  assert(ThrowsConfigurationError([] {
    (void)ConfigLoader::LoadFromString("reconnect:\n  min_delay: 2m\n  max_delay: 1m\n");
  }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("export:\n  windows: [0s]\n"); }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("export:\n  series_days: [0]\n"); }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("export:\n  rssi_policy: max\n"); }));
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromString("- just\n- a list\n"); }));
}

void TestMissingFileIsConfigurationError() {
  assert(ThrowsConfigurationError([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/meshgraph.yaml"); }));
}

} // namespace

int main() {
  TestFullDocumentIsLoaded();
  TestDefaultsFillMissingSections();
  TestChannelKeysAreLoaded();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsConfigurationError();

  std::cout << "meshgraph_unit_config_loader: pass\n";
  return 0;
}
