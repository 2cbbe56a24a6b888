/**
 * @file format_detector.h
 * @brief Classify a filesystem path into a store kind by marker files
 *
 * Detection only stats the filesystem; it never opens a store.
 */

#pragma once

#include <string>

#include "store/store_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

// Marker file names
constexpr const char* kFaissIndexFile = "index.faiss";
constexpr const char* kDocstoreFile = "index.pkl";
constexpr const char* kChromaMarkerFile = "chroma.sqlite3";

/**
 * @brief Check whether a file name carries a recognized index suffix (.faiss, .index)
 */
bool HasIndexSuffix(const std::string& filename);

/**
 * @brief Detect the store kind at path
 *
 * Rules, first match wins:
 * 1. regular file with an index suffix -> kStandaloneFaissFile
 * 2. directory with index.faiss and index.pkl -> kLinkedDocstoreFaiss
 * 3. directory with chroma.sqlite3 -> kChromaCollection
 * 4. directory with index.faiss -> kStandaloneFaissDir
 *
 * @param path File or directory
 * @return Detection, kPathNotFound if path does not exist,
 *         kUnsupportedFormat naming the searched markers otherwise
 */
utils::Expected<Detection, utils::Error> Detect(const std::string& path);

/**
 * @brief Search path and its subdirectories for a store
 *
 * Tries Detect() on path first, then walks subdirectories level by level
 * (sorted by name, ".git" skipped) down to max_depth. Within one directory a
 * store directory is preferred over a loose index file.
 *
 * @param path Root directory
 * @param max_depth Levels below path to search (0 = path only)
 */
utils::Expected<Detection, utils::Error> LocateStore(const std::string& path, int max_depth);

}  // namespace vecscope::store
