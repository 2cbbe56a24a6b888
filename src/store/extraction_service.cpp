/**
 * @file extraction_service.cpp
 * @brief Extraction facade implementation
 */

#include "store/extraction_service.h"

#include <chrono>
#include <filesystem>
#include <utility>

#include "store/format_detector.h"
#include "store/record_assembler.h"
#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace vecscope::store {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpInternalError = 500;

bool Exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

bool IsDirectory(const std::string& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

bool IsRegularFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

utils::Error PathNotFound(const std::string& path) {
  return MakeError(ErrorCode::kPathNotFound, "Path not found: " + path);
}

/**
 * @brief Detection for an index file: a linked pair when index.pkl sits beside it
 */
Detection IndexFileDetection(const std::string& path) {
  Detection detection;
  detection.path = path;
  detection.index_path = path;
  const fs::path companion = fs::path(path).parent_path() / kDocstoreFile;
  if (IsRegularFile(companion)) {
    detection.kind = StoreKind::kLinkedDocstoreFaiss;
    detection.companion_path = companion.string();
  } else {
    detection.kind = StoreKind::kStandaloneFaissFile;
  }
  return detection;
}

}  // namespace

utils::Expected<VectorDataset, utils::Error> ExtractionService::LoadFaiss(const std::string& path,
                                                                          size_t max_records) const {
  if (!Exists(path)) {
    return MakeUnexpected(PathNotFound(path));
  }

  if (!IsDirectory(path)) {
    return Extract(IndexFileDetection(path), max_records);
  }

  Detection detection;
  detection.path = path;
  const fs::path dir(path);
  detection.index_path = (dir / kFaissIndexFile).string();
  if (IsRegularFile(dir / kFaissIndexFile) && IsRegularFile(dir / kDocstoreFile)) {
    detection.kind = StoreKind::kLinkedDocstoreFaiss;
    detection.companion_path = (dir / kDocstoreFile).string();
  } else {
    detection.kind = StoreKind::kStandaloneFaissDir;
  }
  return Extract(detection, max_records);
}

utils::Expected<VectorDataset, utils::Error> ExtractionService::LoadChroma(const std::string& path,
                                                                           size_t max_records) const {
  if (!Exists(path)) {
    return MakeUnexpected(PathNotFound(path));
  }
  if (!IsDirectory(path)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Path is not a directory: " + path));
  }

  Detection detection;
  detection.kind = StoreKind::kChromaCollection;
  detection.path = path;
  detection.companion_path = (fs::path(path) / kChromaMarkerFile).string();
  return Extract(detection, max_records);
}

utils::Expected<VectorDataset, utils::Error> ExtractionService::DetectAndLoad(const std::string& path,
                                                                              size_t max_records) const {
  auto detection = options_.search_depth > 0 ? LocateStore(path, options_.search_depth) : Detect(path);
  if (!detection) {
    utils::LogStoreError("detect", path, detection.error().to_string());
    return MakeUnexpected(detection.error());
  }
  if (detection->kind == StoreKind::kStandaloneFaissFile) {
    // Same reading as LoadFaiss on the file
    return Extract(IndexFileDetection(detection->index_path), max_records);
  }
  return Extract(*detection, max_records);
}

utils::Expected<VectorDataset, utils::Error> ExtractionService::Extract(const Detection& detection,
                                                                        size_t max_records) const {
  auto start_time = std::chrono::steady_clock::now();
  utils::LogStoreDetected(detection.path, StoreKindToString(detection.kind));

  auto reader = MakeReader(detection);
  if (!reader) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "No reader for store kind",
                                    StoreKindToString(detection.kind)));
  }

  auto contents = reader->Read(max_records);
  if (!contents) {
    utils::LogStoreError("extract", detection.path, contents.error().to_string());
    return MakeUnexpected(contents.error());
  }

  VectorDataset dataset = Assemble(std::move(*contents), max_records);

  auto end_time = std::chrono::steady_clock::now();
  double latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
  utils::LogExtractionComplete(dataset.type, detection.path, dataset.count, dataset.dimension,
                               dataset.total_vectors, latency_ms);
  return dataset;
}

nlohmann::json ToErrorPayload(const utils::Error& error) {
  nlohmann::json payload;
  payload["error"] = error.message();
  if (!error.context().empty()) {
    payload["details"] = error.context();
  }
  return payload;
}

int HttpStatusFor(const utils::Error& error) {
  switch (error.code()) {
    case ErrorCode::kPathNotFound:
    case ErrorCode::kNotFound:
      return kHttpNotFound;
    case ErrorCode::kDependencyMissing:
    case ErrorCode::kInternalError:
    case ErrorCode::kUnknown:
      return kHttpInternalError;
    default:
      return kHttpBadRequest;
  }
}

}  // namespace vecscope::store
