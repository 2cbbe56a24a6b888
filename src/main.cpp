/**
 * @file main.cpp
 * @brief Entry point for vecscoped, the extraction HTTP service
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/config.h"
#include "server/http_server.h"
#include "store/extraction_service.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kShutdownPollIntervalMs = 100;  // Main loop poll interval

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number
 *
 * This handler is async-signal-safe: it only sets an atomic flag.
 */
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested = 1;
  }
}

/**
 * @brief Apply logging configuration to spdlog and StructuredLog
 * @return false if the log file could not be opened
 */
bool ConfigureLogging(const vecscope::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      auto logger = spdlog::basic_logger_mt("vecscoped", logging.file);
      spdlog::set_default_logger(logger);
      spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: Failed to open log file " << logging.file << ": " << e.what() << "\n";
      return false;
    }
  }

  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  vecscope::utils::StructuredLog::SetFormat(logging.json ? vecscope::utils::LogFormat::JSON
                                                         : vecscope::utils::LogFormat::TEXT);
  return true;
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] [<config.yaml>]\n";
  std::cout << "       " << program << " -c <config.yaml> [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c /etc/vecscope/config.yaml\n";
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "vecscoped version " << vecscope::Version::String() << "\n";
      std::cout << "Read-only extraction service for FAISS and Chroma vector stores\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      if (config_path == nullptr) {
        config_path = argv[i];
      } else {
        std::cerr << "Error: Multiple config files specified\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  vecscope::config::Config config;
  if (config_path != nullptr) {
    auto config_result = vecscope::config::LoadConfig(config_path);
    if (!config_result) {
      spdlog::error("Failed to load config: {}", config_result.error().to_string());
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      std::cout << "Configuration file is valid\n";
      std::cout << "\nConfiguration summary:\n";
      std::cout << "  Extraction:\n";
      std::cout << "    default_max_records: " << config.extraction.default_max_records << "\n";
      std::cout << "    max_records_limit: " << config.extraction.max_records_limit << "\n";
      std::cout << "  Detection:\n";
      std::cout << "    search_depth: " << config.detection.search_depth << "\n";
      std::cout << "  API:\n";
      std::cout << "    http.bind: " << config.api.http.bind << "\n";
      std::cout << "    http.port: " << config.api.http.port << "\n";
      std::cout << "    http.enable_cors: " << (config.api.http.enable_cors ? "true" : "false") << "\n";
      std::cout << "  Logging:\n";
      std::cout << "    level: " << config.logging.level << "\n";
      std::cout << "    json: " << (config.logging.json ? "true" : "false") << "\n";
      return 0;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires a configuration file\n";
    return 1;
  }

  if (!ConfigureLogging(config.logging)) {
    return 1;
  }

  spdlog::info("vecscoped starting...");
  spdlog::info("Version: {}", vecscope::Version::String());
  if (config_path != nullptr) {
    spdlog::info("Configuration loaded from: {}", config_path);
  } else {
    spdlog::info("No configuration file specified, using defaults");
  }

  vecscope::server::HttpServerConfig http_config;
  http_config.bind = config.api.http.bind;
  http_config.port = config.api.http.port;
  http_config.read_timeout_sec = config.api.http.read_timeout_sec;
  http_config.write_timeout_sec = config.api.http.write_timeout_sec;
  http_config.enable_cors = config.api.http.enable_cors;
  http_config.cors_allow_origin = config.api.http.cors_allow_origin;
  http_config.default_max_records = config.extraction.default_max_records;
  http_config.max_records_limit = config.extraction.max_records_limit;

  vecscope::store::ExtractionOptions options;
  options.search_depth = config.detection.search_depth;

  vecscope::server::HttpServer server(http_config, vecscope::store::ExtractionService(options));

  auto start_result = server.Start();
  if (!start_result) {
    spdlog::error("Failed to start server: {}", start_result.error().to_string());
    return 1;
  }

  spdlog::info("Server is running. Press Ctrl+C to stop.");

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownPollIntervalMs));
  }

  spdlog::info("Shutdown signal received");
  server.Stop();
  spdlog::info("Server stopped gracefully");

  return 0;
}
