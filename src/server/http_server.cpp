/**
 * @file http_server.cpp
 * @brief HTTP server implementation
 */

#include "server/http_server.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <utility>

#include "utils/structured_log.h"
#include "version.h"

using json = nlohmann::json;

namespace vecscope::server {

namespace {
// HTTP status codes
constexpr int kHttpOk = 200;
constexpr int kHttpNoContent = 204;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpInternalServerError = 500;

// Server startup delay (milliseconds)
constexpr int kStartupDelayMs = 100;
}  // namespace

HttpServer::HttpServer(HttpServerConfig config, store::ExtractionService service)
    : config_(std::move(config)), service_(std::move(service)) {
  server_ = std::make_unique<httplib::Server>();

  server_->set_read_timeout(config_.read_timeout_sec, 0);
  server_->set_write_timeout(config_.write_timeout_sec, 0);

  server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    utils::StructuredLog()
        .Event("http_request")
        .Field("method", req.method)
        .Field("path", req.path)
        .Field("status", static_cast<int64_t>(res.status))
        .Debug();
  });

  SetupRoutes();

  if (config_.enable_cors) {
    SetupCors();
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::SetupRoutes() {
  server_->Get("/", [this](const httplib::Request& req, httplib::Response& res) { HandleRoot(req, res); });

  server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });

  server_->Get("/api/faiss", [this](const httplib::Request& req, httplib::Response& res) {
    HandleExtraction(req, res, &store::ExtractionService::LoadFaiss);
  });

  server_->Get("/api/chroma", [this](const httplib::Request& req, httplib::Response& res) {
    HandleExtraction(req, res, &store::ExtractionService::LoadChroma);
  });

  server_->Get("/api/detect", [this](const httplib::Request& req, httplib::Response& res) {
    HandleExtraction(req, res, &store::ExtractionService::DetectAndLoad);
  });
}

void HttpServer::SetupCors() {
  const std::string allow_origin = config_.cors_allow_origin.empty() ? "null" : config_.cors_allow_origin;

  // CORS preflight
  server_->Options(".*", [allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
    res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.status = kHttpNoContent;
  });

  // Add CORS headers to all responses
  server_->set_post_routing_handler([allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
  });
}

utils::Expected<void, utils::Error> HttpServer::Start() {
  using utils::ErrorCode;
  using utils::MakeError;
  using utils::MakeUnexpected;

  if (running_) {
    auto error = MakeError(ErrorCode::kNetworkAlreadyRunning, "HTTP server already running");
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_start")
        .Field("error", error.to_string())
        .Error();
    return MakeUnexpected(error);
  }

  {
    std::lock_guard<std::mutex> lock(bind_error_mutex_);
    bind_error_.clear();
  }

  // Set running flag before starting thread to avoid race condition
  running_ = true;

  server_thread_ = std::make_unique<std::thread>([this]() {
    spdlog::info("Starting HTTP server on {}:{}", config_.bind, config_.port);

    if (!server_->listen(config_.bind, config_.port)) {
      std::string message = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
      utils::StructuredLog()
          .Event("server_error")
          .Field("operation", "http_server_listen")
          .Field("bind", config_.bind)
          .Field("port", static_cast<uint64_t>(config_.port))
          .Field("error", message)
          .Error();
      {
        std::lock_guard<std::mutex> lock(bind_error_mutex_);
        bind_error_ = std::move(message);
      }
      running_ = false;
    }
  });

  // Wait a bit for server to start
  std::this_thread::sleep_for(std::chrono::milliseconds(kStartupDelayMs));

  if (!running_) {
    if (server_thread_ && server_thread_->joinable()) {
      server_thread_->join();
    }
    std::lock_guard<std::mutex> lock(bind_error_mutex_);
    return MakeUnexpected(
        MakeError(ErrorCode::kNetworkBindFailed, bind_error_.empty() ? "Failed to start HTTP server" : bind_error_));
  }

  spdlog::info("HTTP server started successfully on {}:{}", config_.bind, config_.port);
  return {};
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }

  spdlog::info("Stopping HTTP server...");
  running_ = false;

  if (server_) {
    server_->stop();
  }

  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }

  spdlog::info("HTTP server stopped");
}

void HttpServer::SendJson(httplib::Response& res, int status_code, const nlohmann::json& body) {
  res.status = status_code;
  res.set_content(store::DumpJson(body), "application/json");
}

void HttpServer::SendError(httplib::Response& res, int status_code, const std::string& message) {
  json error_obj;
  error_obj["error"] = message;
  SendJson(res, status_code, error_obj);
}

void HttpServer::HandleRoot(const httplib::Request& /*req*/, httplib::Response& res) {
  stats_.total_requests++;

  json response;
  response["name"] = "vecscope";
  response["version"] = Version::String();
  response["endpoints"] = {
      {"faiss", "/api/faiss?path=<index file or directory>&max_records=<n>"},
      {"chroma", "/api/chroma?path=<chroma directory>&max_records=<n>"},
      {"detect", "/api/detect?path=<store path>&max_records=<n>"},
      {"health", "/health"},
  };

  SendJson(res, kHttpOk, response);
}

void HttpServer::HandleHealth(const httplib::Request& /*req*/, httplib::Response& res) {
  stats_.total_requests++;

  json response;
  response["status"] = "healthy";
  SendJson(res, kHttpOk, response);
}

utils::Expected<size_t, utils::Error> HttpServer::ParseMaxRecords(const httplib::Request& req) const {
  if (!req.has_param("max_records")) {
    return static_cast<size_t>(config_.default_max_records);
  }

  const std::string raw = req.get_param_value("max_records");
  const std::string range_message =
      "max_records must be an integer between 1 and " + std::to_string(config_.max_records_limit);

  long long value = 0;
  try {
    size_t consumed = 0;
    value = std::stoll(raw, &consumed);
    if (consumed != raw.size()) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, range_message, raw));
    }
  } catch (const std::invalid_argument&) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, range_message, raw));
  } catch (const std::out_of_range&) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, range_message, raw));
  }

  if (value < 1 || value > static_cast<long long>(config_.max_records_limit)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, range_message, raw));
  }
  return static_cast<size_t>(value);
}

void HttpServer::HandleExtraction(const httplib::Request& req, httplib::Response& res, ExtractionCall call) {
  stats_.total_requests++;

  try {
    if (!req.has_param("path") || req.get_param_value("path").empty()) {
      SendError(res, kHttpBadRequest, "Missing required parameter: path");
      return;
    }
    const std::string path = req.get_param_value("path");

    auto max_records = ParseMaxRecords(req);
    if (!max_records) {
      SendError(res, kHttpBadRequest, max_records.error().message());
      return;
    }

    stats_.extractions++;
    auto dataset = (service_.*call)(path, *max_records);
    if (!dataset) {
      stats_.failed_extractions++;
      SendJson(res, store::HttpStatusFor(dataset.error()), store::ToErrorPayload(dataset.error()));
      return;
    }

    SendJson(res, kHttpOk, store::ToJson(*dataset));
  } catch (const std::exception& e) {
    stats_.failed_extractions++;
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_extraction")
        .Field("path", req.path)
        .Field("error", e.what())
        .Error();
    SendError(res, kHttpInternalServerError, std::string("Internal error: ") + e.what());
  }
}

}  // namespace vecscope::server
