/**
 * @file collection_store_reader.h
 * @brief Reader for a Chroma persistent directory (chroma.sqlite3)
 *
 * Only the first collection, in creation order, is read. Documents and
 * metadata come from the METADATA segment tables; embeddings come from the
 * write-ahead embeddings_queue and, for ids already flushed out of it, from
 * the persisted HNSW vector segment.
 */

#pragma once

#include <string>
#include <utility>

#include "store/store_reader.h"

namespace vecscope::store {

/// Metadata key holding the document text of a Chroma item
constexpr const char* kChromaDocumentKey = "chroma:document";

/// embeddings_queue.operation value of a delete
constexpr int kChromaDeleteOperation = 3;

class CollectionStoreReader : public VectorStoreReader {
 public:
  explicit CollectionStoreReader(std::string db_dir) : db_dir_(std::move(db_dir)) {}

  /**
   * @return kPathNotFound if the directory or database is missing,
   *         kNoCollections if the database holds no collection,
   *         kCorruptIndex on SQLite failures or when no embedding can be read
   */
  utils::Expected<StoreContents, utils::Error> Read(size_t max_records) const override;

 private:
  std::string db_dir_;
};

}  // namespace vecscope::store
