#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "aoef_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestLoadsLoggingAndIoSections() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
io:
  audio_dir: "/data/audio"
  pretty_print: true
)");

  auto config = aoef::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.io().audio_dir() == "/data/audio");
  assert(config.io().pretty_print());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = aoef::config::ConfigLoader::LoadFromYamlString(R"(io:
  audio_dir: "C:\\audio\\\"quoted\"\\site a"
)");
  assert(config.io().audio_dir() == "C:\\audio\\\"quoted\"\\site a");
}

void TestQuotedNumbersStayStrings() {
  auto config = aoef::config::ConfigLoader::LoadFromYamlString(R"(io:
  audio_dir: "2024"
)");
  assert(config.io().audio_dir() == "2024");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = aoef::config::ConfigLoader::LoadFromYamlString("");
  assert(config.logging().level().empty());
  assert(config.io().audio_dir().empty());
  assert(!config.io().pretty_print());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(io:
  audio_dir: "/data"
  compress: true
)");

  bool threw = false;
  try {
    (void)aoef::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)aoef::config::ConfigLoader::LoadFromYamlString("- logging\n- io\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownLogLevelIsRejected() {
  bool threw = false;
  try {
    (void)aoef::config::ConfigLoader::LoadFromYamlString("logging:\n  level: verbose\n");
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(std::string(e.what()).find("verbose") != std::string::npos);
  }
  assert(threw);

  const auto config = aoef::config::ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n");
  assert(config.logging().level() == "warn");
}

} // namespace

int main() {
  TestLoadsLoggingAndIoSections();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentGivesDefaults();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestUnknownLogLevelIsRejected();

  std::cout << "aoef_unit_config_loader: pass\n";
  return 0;
}
