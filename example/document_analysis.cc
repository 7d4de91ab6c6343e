#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "loader.hpp"
#include "pipelines.hpp"

int main(int argc, char** argv) {
  std::string config_path = "../example/example_conf.json";
  if (argc > 1) {
    config_path = argv[1];
  }

  // 1. Parse config
  Loader::AppConfig app_config;
  try {
    app_config = Loader::ParseAppConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Error loading config: " << e.what() << std::endl;
    return -1;
  }

  // 2. Fake document
  std::vector<std::string> pages(app_config.pages, "pdf page content");

  // 3. Run
  std::cout << "=== Analysing " << pages.size() << " pages, at most "
            << app_config.max_concurrency << " at a time ===" << std::endl;
  auto t_start = std::chrono::steady_clock::now();
  DocumentData data;
  DocumentRun run;
  try {
    run = RunDocumentAnalysis(Context::Background(), pages,
                              static_cast<size_t>(app_config.max_concurrency),
                              app_config.timings, &data,
                              StderrLogger(app_config.log_level));
  } catch (const std::exception& e) {
    std::cerr << "Failed to build document workflow: " << e.what()
              << std::endl;
    return -1;
  }
  auto t_end = std::chrono::steady_clock::now();

  // 4. Report
  nlohmann::json report;
  report["status"] = StatusName(run.result.status);
  if (!run.result.Ok()) report["error"] = run.result.ErrorMessage();
  report["latency_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_start)
          .count();
  report["result"] = data;

  nlohmann::json metrics = nlohmann::json::array();
  for (const auto& m : run.metrics) {
    nlohmann::json entry{{"name", m.name},
                         {"state", NodeStateName(m.state)},
                         {"wait_us", m.wait_us},
                         {"duration_us", m.duration_us}};
    if (!m.error.empty()) entry["error"] = m.error;
    metrics.push_back(std::move(entry));
  }
  report["metrics"] = std::move(metrics);

  std::cout << report.dump(2) << std::endl;
  return run.result.Ok() ? 0 : 1;
}
