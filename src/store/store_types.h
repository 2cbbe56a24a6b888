/**
 * @file store_types.h
 * @brief Shared types passed between detection, readers and assembly
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vecscope::store {

/**
 * @brief Closed set of on-disk store layouts
 */
enum class StoreKind : std::uint8_t {
  kStandaloneFaissFile,  ///< Single index file (.faiss / .index)
  kLinkedDocstoreFaiss,  ///< index.faiss + index.pkl docstore pair
  kChromaCollection,     ///< Directory holding chroma.sqlite3
  kStandaloneFaissDir,   ///< Directory holding only index.faiss
};

/**
 * @brief Name used in logs ("standalone_faiss_file", ...)
 */
const char* StoreKindToString(StoreKind kind);

/**
 * @brief Payload type tag for a store kind ("faiss" or "chroma")
 */
const char* StoreKindToType(StoreKind kind);

/**
 * @brief Result of format detection
 */
struct Detection {
  StoreKind kind = StoreKind::kStandaloneFaissFile;
  std::string path;            ///< Path the store was detected at
  std::string index_path;      ///< Index file (FAISS kinds only)
  std::string companion_path;  ///< index.pkl (linked docstore) or chroma.sqlite3
};

/**
 * @brief Store-level facts reported by a reader
 */
struct StoreFacts {
  std::string type;                            ///< "faiss" or "chroma"
  size_t declared_dimension = 0;               ///< Dimension declared by the store
  size_t total = 0;                            ///< True number of items in the store
  bool reconstructible = true;                 ///< Whether real vectors could be read
  std::optional<std::string> collection_name;  ///< Collection stores only
};

/**
 * @brief Text and metadata resolved for one position
 *
 * Fields left at their defaults mean "nothing known"; the assembler
 * substitutes the positional id when id is unset.
 */
struct RecordMetadata {
  std::optional<std::string> id;
  std::string text;
  std::string source;
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Metadata indexed by store position
 *
 * May be shorter than the record count; positions past the end keep defaults.
 */
using PositionalMetadata = std::vector<RecordMetadata>;

/**
 * @brief Everything a reader extracted from one store
 */
struct StoreContents {
  StoreFacts facts;
  std::vector<std::vector<float>> vectors;  ///< One entry per position in [0, count)
  PositionalMetadata metadata;              ///< Native metadata (empty for standalone indexes)
};

}  // namespace vecscope::store
