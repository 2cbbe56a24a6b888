/**
 * @file http_server.h
 * @brief HTTP server for the extraction JSON API
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "config/config.h"
#include "store/extraction_service.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::server {

/**
 * @brief HTTP server configuration
 */
struct HttpServerConfig {
  std::string bind = "127.0.0.1";
  int port = config::defaults::kHttpPort;
  int read_timeout_sec = config::defaults::kHttpReadTimeoutSec;
  int write_timeout_sec = config::defaults::kHttpWriteTimeoutSec;
  bool enable_cors = true;
  std::string cors_allow_origin = "*";
  uint32_t default_max_records = config::defaults::kDefaultMaxRecords;
  uint32_t max_records_limit = config::defaults::kMaxRecordsLimit;
};

/**
 * @brief Request counters
 */
struct HttpServerStats {
  std::atomic<uint64_t> total_requests{0};
  std::atomic<uint64_t> extractions{0};
  std::atomic<uint64_t> failed_extractions{0};
};

/**
 * @brief HTTP server for JSON API
 *
 * Provides a read-only JSON API:
 * - GET / - Service name, version and endpoint list
 * - GET /health - Health check
 * - GET /api/faiss?path=&max_records= - Load a FAISS index or LangChain pair
 * - GET /api/chroma?path=&max_records= - Load a Chroma directory
 * - GET /api/detect?path=&max_records= - Detect the store kind and load it
 */
class HttpServer {
 public:
  /**
   * @brief Construct HTTP server
   * @param config Server configuration
   * @param service Extraction operations served by the API
   */
  HttpServer(HttpServerConfig config, store::ExtractionService service);

  ~HttpServer();

  // Non-copyable and non-movable (manages server thread)
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * @brief Start server (non-blocking)
   * @return Expected<void, Error> - Success or error details
   */
  utils::Expected<void, utils::Error> Start();

  /**
   * @brief Stop server
   */
  void Stop();

  /**
   * @brief Check if server is running
   */
  bool IsRunning() const { return running_; }

  /**
   * @brief Get server port
   */
  int GetPort() const { return config_.port; }

  /**
   * @brief Get total requests handled
   */
  uint64_t GetTotalRequests() const { return stats_.total_requests.load(); }

  /**
   * @brief Get server statistics
   */
  const HttpServerStats& GetStats() const { return stats_; }

 private:
  using ExtractionCall = utils::Expected<store::VectorDataset, utils::Error> (store::ExtractionService::*)(
      const std::string&, size_t) const;

  HttpServerConfig config_;
  store::ExtractionService service_;

  std::atomic<bool> running_{false};

  std::string bind_error_;
  std::mutex bind_error_mutex_;

  HttpServerStats stats_;

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;

  /**
   * @brief Setup routes
   */
  void SetupRoutes();

  /**
   * @brief Setup CORS middleware
   */
  void SetupCors();

  /**
   * @brief Handle GET /
   */
  void HandleRoot(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Handle GET /health
   */
  void HandleHealth(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Handle GET /api/faiss, /api/chroma and /api/detect
   *
   * Validates path and max_records, runs the extraction and replies with
   * the dataset payload or the error payload.
   */
  void HandleExtraction(const httplib::Request& req, httplib::Response& res, ExtractionCall call);

  /**
   * @brief Parse the max_records query parameter
   * @return Record cap, or kInvalidArgument naming the accepted range
   */
  utils::Expected<size_t, utils::Error> ParseMaxRecords(const httplib::Request& req) const;

  /**
   * @brief Send JSON response
   */
  static void SendJson(httplib::Response& res, int status_code, const nlohmann::json& body);

  /**
   * @brief Send error response
   */
  static void SendError(httplib::Response& res, int status_code, const std::string& message);
};

}  // namespace vecscope::server
