/**
 * @file vecscope-cli.cpp
 * @brief Command-line extraction tool: prints a store as the canonical JSON payload
 */

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config.h"
#include "store/extraction_service.h"
#include "store/vector_dataset.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {

constexpr int kJsonIndent = 2;

struct Config {
  std::string path;
  std::string store_type = "auto";  // auto, faiss or chroma
  size_t max_records = vecscope::config::defaults::kDefaultMaxRecords;
  int search_depth = vecscope::config::defaults::kSearchDepth;
  std::string csv_path;
  std::string log_level = "warn";
  bool pretty = false;
};

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] PATH" << '\n';
  std::cout << '\n';
  std::cout << "Options:" << '\n';
  std::cout << "  -n N                Maximum records to return (default: 1000, max: 10000)" << '\n';
  std::cout << "  -t TYPE             Store type: auto, faiss or chroma (default: auto)" << '\n';
  std::cout << "  --csv FILE          Also export the records as CSV" << '\n';
  std::cout << "  --search-depth N    Subdirectory levels searched in auto mode (default: 0, max: 3)" << '\n';
  std::cout << "  --pretty            Indent JSON output" << '\n';
  std::cout << "  --log-level LEVEL   trace, debug, info, warn or error (default: warn)" << '\n';
  std::cout << "  --version           Show version information" << '\n';
  std::cout << "  --help              Show this help" << '\n';
  std::cout << '\n';
  std::cout << "Examples:" << '\n';
  std::cout << "  " << program_name << " ./faiss_index                  # Detect and load" << '\n';
  std::cout << "  " << program_name << " -t chroma -n 50 ./chroma_db    # First 50 Chroma records" << '\n';
  std::cout << "  " << program_name << " --csv out.csv index.faiss      # Export to CSV" << '\n';
}

/**
 * @brief Parse a non-negative integer option value
 * @return false if the value is not an integer in [min_value, max_value]
 */
bool ParseBounded(const std::string& text, long long min_value, long long max_value, long long& out) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size() || value < min_value || value > max_value) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void PrintJson(const nlohmann::json& payload, bool pretty) {
  std::cout << vecscope::store::DumpJson(payload, pretty ? kJsonIndent : -1) << '\n';
  std::cout << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
  // Logs go to stderr so stdout carries only the JSON payload
  spdlog::set_default_logger(spdlog::stderr_color_mt("vecscope-cli"));

  Config config;

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      return 0;
    }
    if (arg == "--version") {
      std::cout << "vecscope-cli version " << vecscope::Version::String() << '\n';
      return 0;
    }

    const bool takes_value =
        arg == "-n" || arg == "-t" || arg == "--csv" || arg == "--search-depth" || arg == "--log-level";
    if (takes_value && i + 1 >= argc) {
      std::cerr << "Error: " << arg << " requires an argument" << '\n';
      return 1;
    }

    if (arg == "-n") {
      std::string text(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      long long value = 0;
      if (!ParseBounded(text, 1, vecscope::config::defaults::kMaxRecordsLimit, value)) {
        std::cerr << "Error: -n must be between 1 and " << vecscope::config::defaults::kMaxRecordsLimit << '\n';
        return 1;
      }
      config.max_records = static_cast<size_t>(value);
    } else if (arg == "-t") {
      config.store_type = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      if (config.store_type != "auto" && config.store_type != "faiss" && config.store_type != "chroma") {
        std::cerr << "Error: -t must be one of: auto, faiss, chroma" << '\n';
        return 1;
      }
    } else if (arg == "--csv") {
      config.csv_path = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else if (arg == "--search-depth") {
      std::string text(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      long long value = 0;
      if (!ParseBounded(text, 0, vecscope::config::defaults::kMaxSearchDepth, value)) {
        std::cerr << "Error: --search-depth must be between 0 and " << vecscope::config::defaults::kMaxSearchDepth
                  << '\n';
        return 1;
      }
      config.search_depth = static_cast<int>(value);
    } else if (arg == "--log-level") {
      config.log_level = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else if (arg == "--pretty") {
      config.pretty = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown option: " << arg << '\n';
      return 1;
    } else if (config.path.empty()) {
      config.path = arg;
    } else {
      std::cerr << "Error: Multiple paths specified" << '\n';
      return 1;
    }
  }

  if (config.path.empty()) {
    PrintUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return 1;
  }

  spdlog::set_level(spdlog::level::from_str(config.log_level));
  vecscope::utils::StructuredLog::SetFormat(vecscope::utils::LogFormat::TEXT);

  vecscope::store::ExtractionOptions options;
  options.search_depth = config.search_depth;
  vecscope::store::ExtractionService service(options);

  auto dataset = config.store_type == "faiss"    ? service.LoadFaiss(config.path, config.max_records)
                 : config.store_type == "chroma" ? service.LoadChroma(config.path, config.max_records)
                                                 : service.DetectAndLoad(config.path, config.max_records);
  if (!dataset) {
    PrintJson(vecscope::store::ToErrorPayload(dataset.error()), config.pretty);
    return 1;
  }

  if (!config.csv_path.empty()) {
    std::ofstream csv(config.csv_path, std::ios::binary | std::ios::trunc);
    if (!csv) {
      std::cerr << "Error: Cannot open " << config.csv_path << " for writing" << '\n';
      return 1;
    }
    csv << vecscope::store::ToCsv(*dataset);
    if (!csv) {
      std::cerr << "Error: Failed to write " << config.csv_path << '\n';
      return 1;
    }
  }

  PrintJson(vecscope::store::ToJson(*dataset), config.pretty);
  return 0;
}
