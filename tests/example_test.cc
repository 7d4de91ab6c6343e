#include <chrono>
#include <string>
#include <vector>

#include "../example/pipelines.hpp"

#include <gtest/gtest.h>

static LogFn silent = [](LogLevel, const std::string&) {};

static Loader::StageTimings FastTimings() {
  Loader::StageTimings t;
  t.visual_ms = 10;
  t.text_ms = 10;
  t.parameter1_ms = 10;
  t.parameter2_ms = 40;
  t.parameter3_ms = 30;
  return t;
}

// ============================================================
// Loader Tests
// ============================================================

TEST(Loader, DefaultsWhenKeysMissing) {
  auto app = Loader::ConvertJson(nlohmann::json::object());
  EXPECT_EQ(app.pages, 100);
  EXPECT_EQ(app.max_concurrency, 50);
  EXPECT_EQ(app.timings.parameter2_ms, 4000);
  EXPECT_EQ(app.log_level, LogLevel::kInfo);
}

TEST(Loader, ParsesAllFields) {
  auto j = nlohmann::json::parse(R"({
    "pages": 8,
    "max_concurrency": 3,
    "log_level": "debug",
    "stages_ms": {"visual_information": 5, "parameter3": 7}
  })");
  auto app = Loader::ConvertJson(j);
  EXPECT_EQ(app.pages, 8);
  EXPECT_EQ(app.max_concurrency, 3);
  EXPECT_EQ(app.log_level, LogLevel::kDebug);
  EXPECT_EQ(app.timings.visual_ms, 5);
  EXPECT_EQ(app.timings.parameter3_ms, 7);
  EXPECT_EQ(app.timings.text_ms, 1000);
}

TEST(Loader, RejectsInvalidValues) {
  EXPECT_THROW(Loader::ConvertJson(nlohmann::json{{"max_concurrency", 0}}),
               std::runtime_error);
  EXPECT_THROW(Loader::ConvertJson(nlohmann::json{{"pages", -1}}),
               std::runtime_error);
  EXPECT_THROW(Loader::ConvertJson(nlohmann::json{{"log_level", "loud"}}),
               std::runtime_error);
  EXPECT_THROW(Loader::ConvertJson(nlohmann::json::array()),
               std::runtime_error);
}

TEST(Loader, MissingFileThrows) {
  EXPECT_THROW(Loader::ParseAppConfig("/nonexistent/miniflow.json"),
               std::runtime_error);
}

// ============================================================
// Pipeline Tests
// ============================================================

TEST(Pipeline, PageAnalysisFillsParameters) {
  PageData data;
  auto res = RunPageAnalysis(Context(), "pdf page content", &data,
                             FastTimings(), silent);
  ASSERT_TRUE(res.Ok()) << res.ErrorMessage();
  EXPECT_EQ(data.parameter1, "visual1text1");
  EXPECT_EQ(data.parameter2, "visual2text2");
  EXPECT_EQ(data.parameter3, "visual3text3");

  nlohmann::json j = data;
  EXPECT_EQ(j["parameter2"].get<std::string>(), "visual2text2");
  EXPECT_EQ(j.get<PageData>().parameter3, "visual3text3");
}

TEST(Pipeline, DocumentAnalysisAggregatesAllPages) {
  std::vector<std::string> pages(12, "pdf page content");
  DocumentData data;
  auto t0 = std::chrono::steady_clock::now();
  auto run = RunDocumentAnalysis(Context(), pages, 4, FastTimings(), &data,
                                 silent);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - t0)
                     .count();

  ASSERT_TRUE(run.result.Ok()) << run.result.ErrorMessage();
  EXPECT_TRUE(data.all_pages_done);
  ASSERT_EQ(data.pages.size(), 12u);
  for (const auto& page : data.pages) {
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->parameter1, "visual1text1");
  }
  // 3 waves of a 50ms page
  EXPECT_GE(elapsed, 150);
  ASSERT_EQ(run.metrics.size(), 13u);
  EXPECT_EQ(run.metrics[0].name, "FinalAggregation");

  nlohmann::json report = data;
  EXPECT_TRUE(report["all_pages_done"].get<bool>());
  EXPECT_EQ(report["pages"].size(), 12u);
}

TEST(Pipeline, CancelledDocumentLeavesPagesUnset) {
  std::vector<std::string> pages(4, "pdf page content");
  Context ctx;
  ctx.Cancel();
  DocumentData data;
  auto run = RunDocumentAnalysis(ctx, pages, 2, FastTimings(), &data, silent);
  EXPECT_EQ(run.result.status, Status::kFailed);
  EXPECT_THROW(run.result.ThrowIfFailed(), CancellationError);
  EXPECT_FALSE(data.all_pages_done);
  for (const auto& page : data.pages) EXPECT_EQ(page, nullptr);

  nlohmann::json report = data;
  EXPECT_TRUE(report["pages"][0].is_null());
}
