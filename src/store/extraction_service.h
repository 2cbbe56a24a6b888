/**
 * @file extraction_service.h
 * @brief Public extraction operations: load a FAISS store, a Chroma store, or detect and load
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

#include "store/store_reader.h"
#include "store/vector_dataset.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

struct ExtractionOptions {
  int search_depth = 0;  ///< Subdirectory levels searched by DetectAndLoad (0 = path only)
};

/**
 * @brief Stateless extraction facade
 *
 * Every call detects, opens, reads and assembles from scratch on the
 * caller's thread. Concurrent calls are safe; they share no handles.
 */
class ExtractionService {
 public:
  explicit ExtractionService(ExtractionOptions options = ExtractionOptions()) : options_(options) {}

  /**
   * @brief Load a FAISS index file, an index directory, or a LangChain index.faiss/index.pkl pair
   *
   * A directory holding both index.faiss and index.pkl, or an index file
   * with an index.pkl beside it, is read as a LangChain docstore pair.
   */
  utils::Expected<VectorDataset, utils::Error> LoadFaiss(const std::string& path, size_t max_records) const;

  /**
   * @brief Load the first collection of a Chroma directory
   * @return kInvalidArgument if path is not a directory
   */
  utils::Expected<VectorDataset, utils::Error> LoadChroma(const std::string& path, size_t max_records) const;

  /**
   * @brief Detect the store kind at path and load it
   *
   * A detected index file is read exactly as LoadFaiss reads it, so an
   * index with index.pkl beside it loads as a linked pair.
   */
  utils::Expected<VectorDataset, utils::Error> DetectAndLoad(const std::string& path, size_t max_records) const;

  const ExtractionOptions& options() const { return options_; }

 private:
  utils::Expected<VectorDataset, utils::Error> Extract(const Detection& detection, size_t max_records) const;

  ExtractionOptions options_;
};

/**
 * @brief Error payload {"error": message, "details": context}
 *
 * "details" is omitted when the error carries no context.
 */
nlohmann::json ToErrorPayload(const utils::Error& error);

/**
 * @brief HTTP status for an extraction error
 *
 * kPathNotFound -> 404, kDependencyMissing and internal errors -> 500,
 * everything else -> 400.
 */
int HttpStatusFor(const utils::Error& error);

}  // namespace vecscope::store
