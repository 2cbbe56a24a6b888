/**
 * @file linked_docstore_reader.h
 * @brief Reader for an index.faiss + index.pkl pair saved by LangChain
 *
 * index.pkl holds the pickled tuple (docstore, index_to_docstore_id).
 * Text and metadata of position i are found through two lookups:
 * position -> document id -> document.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

#include "store/store_reader.h"

namespace vecscope::store {

/**
 * @brief Positional lookup into a decoded (docstore, index_to_docstore_id) pair
 */
class DocstoreIndex {
 public:
  /**
   * @brief Validate the decoded pickle shape
   * @return kMetadataParseFailure unless the value is a sequence of at least two items
   */
  static utils::Expected<DocstoreIndex, utils::Error> FromPickle(nlohmann::json decoded);

  /**
   * @brief Metadata of the document at a position
   *
   * Every missing hop yields empty fields; the id is left unset.
   */
  RecordMetadata Lookup(size_t position) const;

  /**
   * @brief Number of entries in the position mapping
   */
  size_t size() const;

 private:
  DocstoreIndex(nlohmann::json documents, nlohmann::json positions)
      : documents_(std::move(documents)), positions_(std::move(positions)) {}

  const nlohmann::json* FindDocument(size_t position) const;

  nlohmann::json documents_;  ///< document id -> document
  nlohmann::json positions_;  ///< position -> document id
};

class LinkedDocstoreReader : public VectorStoreReader {
 public:
  LinkedDocstoreReader(std::string index_path, std::string docstore_path)
      : index_path_(std::move(index_path)), docstore_path_(std::move(docstore_path)) {}

  utils::Expected<StoreContents, utils::Error> Read(size_t max_records) const override;

 private:
  std::string index_path_;
  std::string docstore_path_;
};

}  // namespace vecscope::store
