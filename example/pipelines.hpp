#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../include/mini_flow.hpp"
#include "data_types.hpp"
#include "loader.hpp"

using namespace miniflow;

using PageWorkflow = Workflow<PageConfig, PageData>;
using DocumentWorkflow = Workflow<DocumentConfig, DocumentData>;

// Helper: simulate latency
inline void SleepMs(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// ==========================
// Page Analysis
// ==========================

// Parameter<i> = visual_information[i] + extracted_text[i]
inline auto MakeParameterStage(size_t which, int latency_ms) {
  return [which, latency_ms](const Context&, const std::any&,
                             PageWorkflow::Tracker& dt) {
    SleepMs(latency_ms);
    dt.Update([which](PageData& d) {
      if (d.visual_information.size() <= which ||
          d.extracted_text.size() <= which) {
        throw std::runtime_error("upstream extraction produced too few items");
      }
      std::string value = d.visual_information[which] + d.extracted_text[which];
      if (which == 0) d.parameter1 = std::move(value);
      if (which == 1) d.parameter2 = std::move(value);
      if (which == 2) d.parameter3 = std::move(value);
    });
  };
}

inline ExecuteResult<PageData> RunPageAnalysis(
    const Context& ctx, const std::string& pdf_page, PageData* data,
    const Loader::StageTimings& timings, LogFn log = {}) {
  PageWorkflow wf("page_analysis", std::move(log));

  int visual_ms = timings.visual_ms;
  auto* visual = wf.AddComponent(
      "VisualInformationExtraction", std::any{},
      [visual_ms](const Context&, const std::any&, PageWorkflow::Tracker& dt) {
        SleepMs(visual_ms);
        dt.Update([](PageData& d) {
          d.visual_information = {"visual1", "visual2", "visual3"};
        });
      });

  int text_ms = timings.text_ms;
  auto* text = wf.AddComponent(
      "TextExtractor", std::any{},
      [text_ms](const Context&, const std::any&, PageWorkflow::Tracker& dt) {
        SleepMs(text_ms);
        dt.Update([](PageData& d) {
          d.extracted_text = {"text1", "text2", "text3"};
        });
      });

  wf.AddComponent("Parameter1", std::any{},
                  MakeParameterStage(0, timings.parameter1_ms))
      ->AddDependencies(visual, text);
  wf.AddComponent("Parameter2", std::any{},
                  MakeParameterStage(1, timings.parameter2_ms))
      ->AddDependencies(visual, text);
  wf.AddComponent("Parameter3", std::any{},
                  MakeParameterStage(2, timings.parameter3_ms))
      ->AddDependencies(visual, text);

  return wf.Execute(ctx, PageConfig{pdf_page}, data);
}

// ==========================
// Document Analysis
// ==========================

struct DocumentRun {
  ExecuteResult<DocumentData> result;
  std::vector<NodeMetric> metrics;
};

// One PageAnalysis per page behind a shared limiter, then FinalAggregation.
// data->pages is resized to the page count.
inline DocumentRun RunDocumentAnalysis(const Context& ctx,
                                       const std::vector<std::string>& pages,
                                       size_t max_concurrency,
                                       const Loader::StageTimings& timings,
                                       DocumentData* data, LogFn log = {}) {
  auto page_limiter = NewConcurrencyLimiter(max_concurrency);
  DocumentWorkflow wf("document_analysis", log);

  auto* aggregation = wf.AddComponent(
      "FinalAggregation", std::any{},
      [](const Context&, const std::any&, DocumentWorkflow::Tracker& dt) {
        bool all_done = dt.Read([](const DocumentData& d) {
          return std::all_of(d.pages.begin(), d.pages.end(),
                             [](const auto& page) { return page != nullptr; });
        });
        dt.Update([all_done](DocumentData& d) { d.all_pages_done = all_done; });
      });

  for (size_t i = 0; i < pages.size(); ++i) {
    auto* page = wf.AddComponent(
        "PageAnalysis", PageInput{static_cast<int>(i)},
        [timings](const Context& page_ctx, const PageInput& input,
                  DocumentWorkflow::Tracker& dt) {
          auto page_data = std::make_shared<PageData>();
          auto res = RunPageAnalysis(
              page_ctx, dt.GetConfig().pdf_pages.at(input.index),
              page_data.get(), timings);
          res.ThrowIfFailed();
          dt.Update([&](DocumentData& d) { d.pages[input.index] = page_data; });
        },
        ComponentOptions{page_limiter});
    aggregation->AddDependencies(page);
  }

  if (data != nullptr) data->pages.assign(pages.size(), nullptr);
  DocumentRun run;
  run.result = wf.Execute(ctx, DocumentConfig{pages}, data);
  run.metrics = wf.Metrics();
  return run;
}
