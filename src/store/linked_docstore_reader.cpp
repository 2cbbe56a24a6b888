/**
 * @file linked_docstore_reader.cpp
 * @brief LangChain FAISS docstore reading
 */

#include "store/linked_docstore_reader.h"

#include <filesystem>
#include <string>
#include <utility>

#include "store/pickle_decoder.h"
#include "store/source_keys.h"
#include "store/standalone_index_reader.h"
#include "utils/structured_log.h"

namespace vecscope::store {

using json = nlohmann::json;

namespace {

/**
 * @brief Document mapping held by a docstore
 *
 * InMemoryDocstore keeps its documents in the "_dict" attribute; a plain
 * dict is accepted as well.
 */
json DocumentsOf(const json& docstore) {
  if (!docstore.is_object()) {
    return json::object();
  }
  auto dict = docstore.find("_dict");
  if (dict != docstore.end() && dict->is_object()) {
    return *dict;
  }
  if (PickleClassName(docstore).empty()) {
    return docstore;
  }
  return json::object();
}

const json* StringField(const json& document, const char* key) {
  auto iter = document.find(key);
  if (iter == document.end() || !iter->is_string()) {
    return nullptr;
  }
  return &*iter;
}

}  // namespace

utils::Expected<DocstoreIndex, utils::Error> DocstoreIndex::FromPickle(json decoded) {
  if (!decoded.is_array() || decoded.size() < 2) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMetadataParseFailure,
                                                  "Unexpected pickle format - not a LangChain FAISS index"));
  }
  return DocstoreIndex(DocumentsOf(decoded[0]), std::move(decoded[1]));
}

size_t DocstoreIndex::size() const {
  return positions_.is_object() || positions_.is_array() ? positions_.size() : 0;
}

const json* DocstoreIndex::FindDocument(size_t position) const {
  const json* doc_id = nullptr;
  if (positions_.is_object()) {
    auto iter = positions_.find(std::to_string(position));
    if (iter != positions_.end()) {
      doc_id = &*iter;
    }
  } else if (positions_.is_array() && position < positions_.size()) {
    doc_id = &positions_[position];
  }
  if (doc_id == nullptr || doc_id->is_null()) {
    return nullptr;
  }

  auto document = documents_.find(PickleKeyString(*doc_id));
  if (document == documents_.end()) {
    return nullptr;
  }
  return &*document;
}

RecordMetadata DocstoreIndex::Lookup(size_t position) const {
  RecordMetadata record;

  const json* document = FindDocument(position);
  if (document == nullptr) {
    return record;
  }

  if (document->is_string()) {
    record.text = document->get<std::string>();
    return record;
  }
  if (!document->is_object()) {
    return record;
  }

  if (const json* text = StringField(*document, "page_content")) {
    record.text = text->get<std::string>();
  } else if (const json* body = StringField(*document, "text")) {
    record.text = body->get<std::string>();
  }

  auto metadata = document->find("metadata");
  if (metadata != document->end() && metadata->is_object()) {
    record.metadata = *metadata;
    record.source = ResolveSource(record.metadata);
  }
  return record;
}

utils::Expected<StoreContents, utils::Error> LinkedDocstoreReader::Read(size_t max_records) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(index_path_, ec)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kPathNotFound, "FAISS index file not found: " + index_path_));
  }
  if (!std::filesystem::is_regular_file(docstore_path_, ec)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kPathNotFound, "Pickle file not found: " + docstore_path_));
  }

  auto contents = ReadFaissVectors(index_path_, max_records);
  if (!contents) {
    return contents;
  }

  auto decoded = PickleDecoder::DecodeFile(docstore_path_);
  if (!decoded) {
    return utils::MakeUnexpected(decoded.error());
  }
  auto docstore = DocstoreIndex::FromPickle(std::move(*decoded));
  if (!docstore) {
    return utils::MakeUnexpected(utils::MakeError(docstore.error().code(), docstore.error().message(), docstore_path_));
  }

  utils::StructuredLog()
      .Event("docstore_loaded")
      .Field("path", docstore_path_)
      .Field("documents", static_cast<uint64_t>(docstore->size()))
      .Debug();

  const size_t count = contents->vectors.size();
  contents->metadata.reserve(count);
  size_t unresolved = 0;
  for (size_t i = 0; i < count; ++i) {
    RecordMetadata record = docstore->Lookup(i);
    if (record.text.empty() && record.metadata.empty()) {
      ++unresolved;
    }
    contents->metadata.push_back(std::move(record));
  }

  if (unresolved > 0) {
    utils::StructuredLog()
        .Event("docstore_unresolved")
        .Field("path", docstore_path_)
        .Field("positions", static_cast<uint64_t>(unresolved))
        .Debug();
  }
  return contents;
}

}  // namespace vecscope::store
