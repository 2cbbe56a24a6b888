/**
 * @file vector_dataset.h
 * @brief Canonical record and dataset shapes every store kind is normalized into
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vecscope::store {

/**
 * @brief One normalized item
 */
struct VectorRecord {
  std::string id;                                      ///< Unique within one dataset
  std::vector<float> vector;                           ///< Length == dataset dimension
  std::string text;                                    ///< Associated text (may be empty)
  std::string source;                                  ///< Best-effort source (may be empty)
  nlohmann::json metadata = nlohmann::json::object();  ///< Free-form metadata mapping
};

/**
 * @brief Extraction result, built fresh on every call
 *
 * Invariants:
 * - count == vectors.size() == min(total_vectors, max_records)
 * - every vectors[i].vector has dimension elements
 * - dimension == 0 only when count == 0
 */
struct VectorDataset {
  std::string type;                              ///< "faiss" or "chroma"
  size_t count = 0;                              ///< Records returned
  size_t dimension = 0;                          ///< Shared vector length
  size_t total_vectors = 0;                      ///< True size of the store
  std::optional<std::string> collection_name;    ///< Set for collection stores only
  std::vector<VectorRecord> vectors;             ///< Store iteration order
};

/**
 * @brief Positional placeholder id ("chunk_0000", "chunk_0001", ...)
 */
std::string FormatPositionalId(size_t position);

/**
 * @brief Serialize to the canonical JSON payload
 */
nlohmann::json ToJson(const VectorDataset& dataset);

/**
 * @brief Serialize JSON for output; invalid UTF-8 in store text becomes U+FFFD
 * @param indent -1 for compact output
 */
std::string DumpJson(const nlohmann::json& value, int indent = -1);

/**
 * @brief Export as CSV with columns id,text,source,vector,dimension,metadata
 *
 * The vector and metadata columns hold compact JSON. Fields containing a
 * comma, quote, CR or LF are quoted with embedded quotes doubled.
 */
std::string ToCsv(const VectorDataset& dataset);

}  // namespace vecscope::store
