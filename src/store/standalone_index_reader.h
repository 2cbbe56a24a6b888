/**
 * @file standalone_index_reader.h
 * @brief Reader for a FAISS index file with optional JSON sidecar metadata
 */

#pragma once

#include <string>
#include <utility>

#include "store/store_reader.h"

namespace vecscope::store {

/**
 * @brief Read the vectors of a FAISS index file
 *
 * count = min(ntotal, max_records). Rows that cannot be reconstructed stay
 * zero-filled. The metadata of the returned contents is empty.
 *
 * @return kPathNotFound if the file is absent, kCorruptIndex if unreadable
 */
utils::Expected<StoreContents, utils::Error> ReadFaissVectors(const std::string& index_path, size_t max_records);

/**
 * @brief Standalone index file, text and ids from a sidecar
 */
class StandaloneIndexReader : public VectorStoreReader {
 public:
  explicit StandaloneIndexReader(std::string index_path) : index_path_(std::move(index_path)) {}

  utils::Expected<StoreContents, utils::Error> Read(size_t max_records) const override;

 private:
  std::string index_path_;
};

}  // namespace vecscope::store
