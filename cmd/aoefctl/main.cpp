#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "api/aoef/v1.hpp"
#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

using namespace aoef::api::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aoefctl [--config <config.yaml>] info <file.json>\n"
            << "  aoefctl [--config <config.yaml>] validate <file.json> [collection_type]\n"
            << "  aoefctl [--config <config.yaml>] convert <in.json> <out.json>\n";
}

static std::optional<std::filesystem::path> AudioDir(const aoef::runtime::config::RuntimeConfig& config) {
  if (config.io().audio_dir().empty()) return std::nullopt;
  return std::filesystem::path(config.io().audio_dir());
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  aoef::runtime::config::RuntimeConfig config;
  try {
    if (!config_path.empty()) {
      config = aoef::config::ConfigLoader::LoadFromYaml(config_path);
    }
    aoef::observability::InitializeLogging(config);
  } catch (const std::exception& e) {
    std::cerr << "config error: " << e.what() << "\n";
    return 2;
  }

  const auto audio_dir = AudioDir(config);

  try {
    // ------------------------------------------------------------

    if (cmd == "info") {
      const auto doc = ReadDocument(args[1]);
      FromDocument(doc, {audio_dir, std::nullopt});

      std::cout << "version=" << doc.version() << "\n";
      std::cout << "created_on=" << doc.created_on() << "\n";
      std::cout << "collection_type=" << doc.data().collection_type() << "\n";
      std::cout << "uuid=" << doc.data().uuid() << "\n";
      for (const auto& [list, count] : RecordCounts(doc.data())) {
        std::cout << list << "=" << count << "\n";
      }
      aoef::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "validate") {
      LoadOptions options{audio_dir, std::nullopt};
      if (args.size() >= 3) {
        options.expected_kind = aoef::collections::ParseCollectionKind(args[2]);
        if (!options.expected_kind) {
          std::cerr << "unknown collection type: " << args[2] << "\n";
          return 1;
        }
      }

      try {
        Load(args[1], options);
      } catch (const AoefError& e) {
        std::cout << e.what() << "\n";
        aoef::observability::ShutdownLogging();
        return 1;
      }

      std::cout << "ok\n";
      aoef::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "convert") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }

      auto collection = Load(args[1], {audio_dir, std::nullopt});
      Save(*collection, args[2], {audio_dir, config.io().pretty_print()});

      AOEF_LOG_INFO("converted document", {aoef::observability::PathField("input", args[1]),
                                           aoef::observability::PathField("output", args[2])});
      std::cout << "converted\n";
      aoef::observability::ShutdownLogging();
      return 0;
    }
  } catch (const std::exception& e) {
    AOEF_LOG_ERROR("Fatal error", {aoef::observability::StringField("error", e.what())});
    aoef::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  aoef::observability::ShutdownLogging();
  return 1;
}
