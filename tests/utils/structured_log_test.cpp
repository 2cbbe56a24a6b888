/**
 * @file structured_log_test.cpp
 * @brief Unit tests for StructuredLog output formats
 */

#include "utils/structured_log.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

using namespace vecscope::utils;

namespace {

// Routes the default logger into a string stream for the duration of a test
class StructuredLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_ = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
    auto logger = std::make_shared<spdlog::logger>("structured_log_test", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
  }

  void TearDown() override {
    spdlog::set_default_logger(previous_);
    StructuredLog::SetFormat(LogFormat::JSON);
  }

  std::string Line() {
    std::string line = output_.str();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    return line;
  }

  std::ostringstream output_;
  std::shared_ptr<spdlog::logger> previous_;
};

}  // namespace

TEST_F(StructuredLogTest, JsonKeepsFieldTypes) {
  StructuredLog::SetFormat(LogFormat::JSON);
  StructuredLog()
      .Event("extraction_complete")
      .Field("path", "/data/index.faiss")
      .Field("count", static_cast<uint64_t>(12))
      .Field("offset", static_cast<int64_t>(-3))
      .Field("reconstructible", false)
      .Info();

  auto parsed = nlohmann::json::parse(Line());
  EXPECT_EQ(parsed["event"], "extraction_complete");
  EXPECT_EQ(parsed["path"], "/data/index.faiss");
  EXPECT_EQ(parsed["count"], 12);
  EXPECT_EQ(parsed["offset"], -3);
  EXPECT_EQ(parsed["reconstructible"], false);
}

TEST_F(StructuredLogTest, JsonEscapesStrings) {
  StructuredLog::SetFormat(LogFormat::JSON);
  LogStoreWarning("sidecar_unreadable", "/data/\"quoted\".json", "line one\nline two");

  auto parsed = nlohmann::json::parse(Line());
  EXPECT_EQ(parsed["event"], "store_warning");
  EXPECT_EQ(parsed["message"], "line one\nline two");
  EXPECT_EQ(parsed["path"], "/data/\"quoted\".json");
}

TEST_F(StructuredLogTest, TextFormat) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  StructuredLog().Event("store_detected").Field("path", "/data/my store").Field("kind", "chroma_collection").Warn();

  EXPECT_EQ(Line(), "event=store_detected path=\"/data/my store\" kind=chroma_collection");
}

TEST_F(StructuredLogTest, TextMessageIsQuoted) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  StructuredLog().Event("store_warning").Message("Only the first collection is read").Field("skipped", true).Warn();

  EXPECT_EQ(Line(), "event=store_warning message=\"Only the first collection is read\" skipped=true");
}

TEST_F(StructuredLogTest, RespectsLevel) {
  spdlog::default_logger()->set_level(spdlog::level::info);
  LogStoreDetected("/data", "standalone_faiss_dir");
  EXPECT_TRUE(Line().empty());
}
