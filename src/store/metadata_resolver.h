/**
 * @file metadata_resolver.h
 * @brief Sidecar metadata lookup for standalone FAISS indexes
 *
 * A standalone index carries no text. Text, ids and sources are looked up in
 * a JSON sidecar next to the index file, under one of several naming
 * conventions, and parsed under one of several legacy document shapes.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "store/store_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

/**
 * @brief Sidecar file names to try, in precedence order
 *
 * For /data/index.faiss:
 *   /data/index.json, /data/index_metadata.json, /data/metadata.json,
 *   /data/chunks.json, /data/documents.json
 */
std::vector<std::string> SidecarCandidates(const std::string& index_path);

/**
 * @brief First existing sidecar for an index file
 */
std::optional<std::string> FindSidecar(const std::string& index_path);

/**
 * @brief Map a parsed sidecar document to positional metadata
 *
 * Shapes, tried in order:
 * 1. {"chunks": [{id, text, source, metadata}, ...]}
 * 2. {"documents": ["text", ...]}
 * 3. {"texts": ["text", ...]}
 * 4. {"sources": [...], "ids": [...]} applied on top of 1-3
 * 5. [ "text" | {id, text|content, source|file, metadata}, ... ]
 *
 * Entries of the wrong type keep their defaults.
 */
PositionalMetadata ParseSidecar(const nlohmann::json& document);

/**
 * @brief Read and parse one sidecar file
 * @return kMetadataParseFailure on unreadable file or invalid JSON
 */
utils::Expected<PositionalMetadata, utils::Error> LoadSidecar(const std::string& sidecar_path);

/**
 * @brief Resolve metadata for a standalone index
 *
 * Never fails: a missing sidecar or a parse failure is logged as a warning
 * and yields empty metadata.
 */
PositionalMetadata ResolveSidecarMetadata(const std::string& index_path);

}  // namespace vecscope::store
