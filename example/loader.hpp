#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "../include/mini_flow.hpp"

class Loader {
 public:
  // Simulated stage latencies of the page workflow
  struct StageTimings {
    int visual_ms = 1000;
    int text_ms = 1000;
    int parameter1_ms = 1000;
    int parameter2_ms = 4000;
    int parameter3_ms = 3000;
  };

  struct AppConfig {
    int pages = 100;
    int max_concurrency = 50;
    StageTimings timings;
    miniflow::LogLevel log_level = miniflow::LogLevel::kInfo;
  };

  static nlohmann::json Load(const std::string& filename) {
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
      throw std::runtime_error("Cannot open config file: " + filename);
    }
    return nlohmann::json::parse(ifs);
  }

  static miniflow::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "debug") return miniflow::LogLevel::kDebug;
    if (level == "info") return miniflow::LogLevel::kInfo;
    if (level == "warn") return miniflow::LogLevel::kWarn;
    if (level == "error") return miniflow::LogLevel::kError;
    throw std::runtime_error("Unknown log_level '" + level + "'");
  }

  // Missing keys keep their defaults
  static AppConfig ConvertJson(const nlohmann::json& root) {
    if (!root.is_object()) {
      throw std::runtime_error("Config root must be an object");
    }
    AppConfig app;
    app.pages = root.value("pages", app.pages);
    app.max_concurrency = root.value("max_concurrency", app.max_concurrency);
    if (app.pages < 0) {
      throw std::runtime_error("'pages' must not be negative");
    }
    if (app.max_concurrency < 1) {
      throw std::runtime_error("'max_concurrency' must be at least 1");
    }

    if (root.contains("stages_ms")) {
      const auto& stages = root["stages_ms"];
      if (!stages.is_object()) {
        throw std::runtime_error("'stages_ms' must be an object");
      }
      StageTimings& t = app.timings;
      t.visual_ms = stages.value("visual_information", t.visual_ms);
      t.text_ms = stages.value("text_extraction", t.text_ms);
      t.parameter1_ms = stages.value("parameter1", t.parameter1_ms);
      t.parameter2_ms = stages.value("parameter2", t.parameter2_ms);
      t.parameter3_ms = stages.value("parameter3", t.parameter3_ms);
    }

    if (root.contains("log_level")) {
      app.log_level = ParseLogLevel(root["log_level"].get<std::string>());
    }
    return app;
  }

  static AppConfig ParseAppConfig(const std::string& filename) {
    return ConvertJson(Load(filename));
  }
};
