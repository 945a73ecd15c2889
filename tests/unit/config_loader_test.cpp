#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "seat_inventory_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)seat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "info"
  pattern: "[%l] %v"
  file: "/tmp/seatctl.log"
store:
  sqlite:
    path: "/tmp/seat.db"
reservations:
  default_hold_ttl: "300s"
  max_hold_ttl: "1800s"
  seed_default_flights: false
)");

  auto config = seat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "info");
  assert(config.logging().file() == "/tmp/seatctl.log");
  assert(config.store().has_sqlite());
  assert(config.store().sqlite().path() == "/tmp/seat.db");
  assert(seat::config::DefaultHoldTtl(config) == 5min);
  assert(seat::config::MaxHoldTtl(config) == 30min);
  assert(!seat::config::SeedDefaultFlights(config));
}

void TestDefaultsWhenSectionsAreMissing() {
  const auto yaml_path = WriteYaml("defaults", R"(store:
  memory: {}
)");

  auto config = seat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().has_memory());
  assert(seat::config::DefaultHoldTtl(config) == seat::config::kDefaultHoldTtl);
  assert(!seat::config::MaxHoldTtl(config).has_value());
  assert(seat::config::SeedDefaultFlights(config));
}

void TestEmptyFileYieldsDefaultConfig() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = seat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.has_store());
  assert(seat::config::DefaultHoldTtl(config) == 10min);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(store:
  json_file:
    path: "C:\\seats\\\"quoted\"\\state.json"
)");

  auto config = seat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().json_file().path() == "C:\\seats\\\"quoted\"\\state.json");
}

void TestUnknownFieldsAreRejected() {
  assert(LoadThrows("unknown_field", R"(store:
  memory: {}
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidTtlsAreRejected() {
  assert(LoadThrows("zero_ttl", R"(reservations:
  default_hold_ttl: "0s"
)"));
  assert(LoadThrows("fractional_minutes", R"(reservations:
  default_hold_ttl: "90s"
)"));
  assert(LoadThrows("default_above_max", R"(reservations:
  default_hold_ttl: "1200s"
  max_hold_ttl: "600s"
)"));
}

void TestEmptyStorePathIsRejected() {
  assert(LoadThrows("empty_sqlite_path", R"(store:
  sqlite:
    path: ""
)"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)seat::config::ConfigLoader::LoadFromYaml("/nonexistent/seat-inventory.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsWhenSectionsAreMissing();
  TestEmptyFileYieldsDefaultConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestInvalidTtlsAreRejected();
  TestEmptyStorePathIsRejected();
  TestMissingFileIsReported();

  std::cout << "seat_inventory_unit_config_loader: pass\n";
  return 0;
}
