/**
 * @file http_server_test.cpp
 * @brief Unit tests for HTTP server
 *
 * Tests HTTP endpoints:
 * - Root and health endpoints
 * - Extraction endpoints (faiss, chroma, detect)
 * - Parameter validation and error status mapping
 * - CORS headers
 */

#include "server/http_server.h"

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

#include "store/store_fixtures.h"

using json = nlohmann::json;
using namespace vecscope;
using vecscope::store::testing::TempDir;
using vecscope::store::testing::WriteDocstorePickle;
using vecscope::store::testing::WriteFlatIndex;
using vecscope::store::testing::WriteText;

namespace {

constexpr int kTestPort = 18091;  // Use different port for testing

// Test fixture with HTTP server and a small FAISS index on disk
class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    WriteFlatIndex(dir_.File("vectors.faiss"), 2, {{1.0F, 2.0F}, {3.0F, 4.0F}, {5.0F, 6.0F}});

    server::HttpServerConfig http_config;
    http_config.bind = "127.0.0.1";
    http_config.port = kTestPort;
    http_config.cors_allow_origin = "https://example.com";
    http_config.default_max_records = 2;
    http_config.max_records_limit = 100;

    http_server_ = std::make_unique<server::HttpServer>(http_config, store::ExtractionService());

    // Start server
    auto result = http_server_->Start();
    ASSERT_TRUE(result) << "Failed to start HTTP server: " << result.error().message();

    // Wait for server to be ready
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    client_ = std::make_unique<httplib::Client>("127.0.0.1", kTestPort);
  }

  void TearDown() override {
    client_.reset();
    if (http_server_) {
      http_server_->Stop();
    }
  }

  std::string IndexPath() const { return dir_.File("vectors.faiss"); }

  TempDir dir_;
  std::unique_ptr<server::HttpServer> http_server_;
  std::unique_ptr<httplib::Client> client_;
};

}  // namespace

TEST_F(HttpServerTest, Root) {
  auto res = client_->Get("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["name"], "vecscope");
  EXPECT_TRUE(body.contains("version"));
  EXPECT_TRUE(body["endpoints"].contains("faiss"));
  EXPECT_TRUE(body["endpoints"].contains("chroma"));
  EXPECT_TRUE(body["endpoints"].contains("detect"));
}

TEST_F(HttpServerTest, Health) {
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "healthy");
}

TEST_F(HttpServerTest, FaissUsesDefaultMaxRecords) {
  auto res = client_->Get("/api/faiss?path=" + IndexPath());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");

  auto body = json::parse(res->body);
  EXPECT_EQ(body["type"], "faiss");
  EXPECT_EQ(body["count"], 2);
  EXPECT_EQ(body["dimension"], 2);
  EXPECT_EQ(body["total_vectors"], 3);
  ASSERT_EQ(body["vectors"].size(), 2U);
  EXPECT_EQ(body["vectors"][0]["id"], "chunk_0000");
  EXPECT_EQ(body["vectors"][1]["vector"], json::array({3.0, 4.0}));
  EXPECT_FALSE(body.contains("collection_name"));
}

TEST_F(HttpServerTest, DetectWithMaxRecords) {
  auto res = client_->Get("/api/detect?path=" + IndexPath() + "&max_records=3");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["count"], 3);
}

TEST_F(HttpServerTest, MissingPath) {
  auto res = client_->Get("/api/faiss");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"], "Missing required parameter: path");

  auto empty = client_->Get("/api/detect?path=");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->status, 400);
}

TEST_F(HttpServerTest, InvalidMaxRecords) {
  for (const char* value : {"0", "-5", "abc", "10x", "101"}) {
    auto res = client_->Get("/api/faiss?path=" + IndexPath() + "&max_records=" + value);
    ASSERT_TRUE(res) << value;
    EXPECT_EQ(res->status, 400) << value;
    EXPECT_EQ(json::parse(res->body)["error"], "max_records must be an integer between 1 and 100") << value;
  }
}

TEST_F(HttpServerTest, NonUtf8DocumentTextIsReplaced) {
  std::string store = dir_.Subdir("langchain");
  WriteFlatIndex(store + "/index.faiss", 2, {{1.0F, 0.0F}});
  WriteDocstorePickle(store + "/index.pkl", {{"d1", "caf\xE9", "menu.txt"}}, {"d1"});

  for (const std::string route : {"/api/faiss", "/api/detect"}) {
    auto res = client_->Get(route + "?path=" + store);
    ASSERT_TRUE(res) << route;
    EXPECT_EQ(res->status, 200) << route;

    auto body = json::parse(res->body);
    ASSERT_EQ(body["vectors"].size(), 1U) << route;
    EXPECT_EQ(body["vectors"][0]["id"], "d1") << route;
    EXPECT_EQ(body["vectors"][0]["text"], "caf\xEF\xBF\xBD") << route;
  }
}

TEST_F(HttpServerTest, NonexistentPathIs404) {
  auto res = client_->Get("/api/faiss?path=/nonexistent/vecscope.faiss");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body)["error"], "Path not found: /nonexistent/vecscope.faiss");
}

TEST_F(HttpServerTest, UnsupportedFormatIs400) {
  WriteText(dir_.File("notes.txt"), "plain text");

  auto res = client_->Get("/api/detect?path=" + dir_.File("notes.txt"));
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_TRUE(json::parse(res->body).contains("error"));
}

TEST_F(HttpServerTest, ChromaOnFileIs400) {
  auto res = client_->Get("/api/chroma?path=" + IndexPath());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
}

TEST_F(HttpServerTest, CorsHeaders) {
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "https://example.com");

  auto preflight = client_->Options("/api/faiss");
  ASSERT_TRUE(preflight);
  EXPECT_EQ(preflight->status, 204);
  EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Methods"), "GET, OPTIONS");
}

TEST_F(HttpServerTest, Stats) {
  client_->Get("/health");
  client_->Get("/api/faiss?path=" + IndexPath());
  client_->Get("/api/faiss?path=/nonexistent/vecscope.faiss");

  const auto& stats = http_server_->GetStats();
  EXPECT_EQ(stats.total_requests.load(), 3U);
  EXPECT_EQ(stats.extractions.load(), 2U);
  EXPECT_EQ(stats.failed_extractions.load(), 1U);
  EXPECT_TRUE(http_server_->IsRunning());
  EXPECT_EQ(http_server_->GetPort(), kTestPort);
}

TEST(HttpServerLifecycleTest, StartTwiceFails) {
  server::HttpServerConfig http_config;
  http_config.port = kTestPort + 1;
  server::HttpServer http_server(http_config, store::ExtractionService());

  ASSERT_TRUE(http_server.Start());
  auto second = http_server.Start();
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code(), utils::ErrorCode::kNetworkAlreadyRunning);

  http_server.Stop();
  EXPECT_FALSE(http_server.IsRunning());
}
