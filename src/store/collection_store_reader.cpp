/**
 * @file collection_store_reader.cpp
 * @brief Chroma collection reading through the SQLite C API
 */

#include "store/collection_store_reader.h"

#include <sqlite3.h>

#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "store/format_detector.h"
#include "store/hnsw_segment.h"
#include "store/source_keys.h"
#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace vecscope::store {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

struct DatabaseCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using DatabasePtr = std::unique_ptr<sqlite3, DatabaseCloser>;
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

struct CollectionRow {
  std::string id;
  std::string name;
  size_t dimension = 0;  ///< 0 when the column is absent or NULL
};

struct ItemRow {
  int64_t row_id = 0;
  std::string embedding_id;
};

utils::Error SqliteError(sqlite3* db, const std::string& operation) {
  return MakeError(ErrorCode::kCorruptIndex,
                   "Failed to load Chroma database: " + operation + ": " + sqlite3_errmsg(db));
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                     static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

/**
 * @brief Prepared-statement helpers bound to one open database
 */
class ChromaDatabase {
 public:
  static utils::Expected<ChromaDatabase, utils::Error> Open(const std::string& path) {
    sqlite3* raw = nullptr;
    int result = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    DatabasePtr db(raw);
    if (result != SQLITE_OK) {
      if (!db) {
        return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to open Chroma database", path));
      }
      return MakeUnexpected(SqliteError(db.get(), "open"));
    }
    return ChromaDatabase(std::move(db));
  }

  utils::Expected<StatementPtr, utils::Error> Prepare(const char* sql) const {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
      return MakeUnexpected(SqliteError(db_.get(), "prepare"));
    }
    return StatementPtr(raw);
  }

  bool HasTable(const char* table) const {
    auto stmt = Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt) {
      return false;
    }
    sqlite3_bind_text(stmt->get(), 1, table, -1, SQLITE_STATIC);
    return sqlite3_step(stmt->get()) == SQLITE_ROW;
  }

  bool HasColumn(const char* table, const char* column) const {
    std::string sql = std::string("PRAGMA table_info(") + table + ")";
    auto stmt = Prepare(sql.c_str());
    if (!stmt) {
      return false;
    }
    while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
      if (ColumnText(stmt->get(), 1) == column) {
        return true;
      }
    }
    return false;
  }

  utils::Expected<std::vector<CollectionRow>, utils::Error> ListCollections() const {
    const bool has_dimension = HasColumn("collections", "dimension");
    auto stmt = Prepare(has_dimension ? "SELECT id, name, dimension FROM collections ORDER BY rowid"
                                      : "SELECT id, name, NULL FROM collections ORDER BY rowid");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }

    std::vector<CollectionRow> collections;
    int step = SQLITE_ROW;
    while ((step = sqlite3_step(stmt->get())) == SQLITE_ROW) {
      CollectionRow row;
      row.id = ColumnText(stmt->get(), 0);
      row.name = ColumnText(stmt->get(), 1);
      if (sqlite3_column_type(stmt->get(), 2) == SQLITE_INTEGER) {
        int64_t dimension = sqlite3_column_int64(stmt->get(), 2);
        row.dimension = dimension > 0 ? static_cast<size_t>(dimension) : 0;
      }
      collections.push_back(std::move(row));
    }
    if (step != SQLITE_DONE) {
      return MakeUnexpected(SqliteError(db_.get(), "list collections"));
    }
    return collections;
  }

  /**
   * @brief Segment id of a collection for a scope ("METADATA" or "VECTOR")
   */
  utils::Expected<std::optional<std::string>, utils::Error> FindSegment(const std::string& collection_id,
                                                                        const char* scope) const {
    auto stmt = Prepare("SELECT id FROM segments WHERE collection = ? AND scope = ? LIMIT 1");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, collection_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt->get(), 2, scope, -1, SQLITE_STATIC);

    int step = sqlite3_step(stmt->get());
    if (step == SQLITE_ROW) {
      return std::optional<std::string>(ColumnText(stmt->get(), 0));
    }
    if (step != SQLITE_DONE) {
      return MakeUnexpected(SqliteError(db_.get(), "find segment"));
    }
    return std::optional<std::string>();
  }

  utils::Expected<size_t, utils::Error> CountItems(const std::string& segment_id) const {
    auto stmt = Prepare("SELECT COUNT(*) FROM embeddings WHERE segment_id = ?");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, segment_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
      return MakeUnexpected(SqliteError(db_.get(), "count embeddings"));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt->get(), 0));
  }

  utils::Expected<std::vector<ItemRow>, utils::Error> ListItems(const std::string& segment_id, size_t limit) const {
    auto stmt = Prepare("SELECT id, embedding_id FROM embeddings WHERE segment_id = ? ORDER BY id LIMIT ?");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    sqlite3_bind_text(stmt->get(), 1, segment_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt->get(), 2, static_cast<sqlite3_int64>(limit));

    std::vector<ItemRow> items;
    int step = SQLITE_ROW;
    while ((step = sqlite3_step(stmt->get())) == SQLITE_ROW) {
      ItemRow item;
      item.row_id = sqlite3_column_int64(stmt->get(), 0);
      item.embedding_id = ColumnText(stmt->get(), 1);
      items.push_back(std::move(item));
    }
    if (step != SQLITE_DONE) {
      return MakeUnexpected(SqliteError(db_.get(), "list embeddings"));
    }
    return items;
  }

  /**
   * @brief Document text and typed metadata of every item
   */
  utils::Expected<PositionalMetadata, utils::Error> ReadMetadata(const std::vector<ItemRow>& items) const {
    const bool has_bool = HasColumn("embedding_metadata", "bool_value");
    auto stmt = Prepare(has_bool ? "SELECT key, string_value, int_value, float_value, bool_value "
                                   "FROM embedding_metadata WHERE id = ? ORDER BY key"
                                 : "SELECT key, string_value, int_value, float_value, NULL "
                                   "FROM embedding_metadata WHERE id = ? ORDER BY key");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }

    PositionalMetadata records(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
      RecordMetadata& record = records[i];
      record.id = items[i].embedding_id;

      sqlite3_reset(stmt->get());
      sqlite3_bind_int64(stmt->get(), 1, items[i].row_id);

      int step = SQLITE_ROW;
      while ((step = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        std::string key = ColumnText(stmt->get(), 0);
        if (key == kChromaDocumentKey) {
          record.text = ColumnText(stmt->get(), 1);
          continue;
        }
        if (key.rfind("chroma:", 0) == 0) {
          continue;
        }

        if (sqlite3_column_type(stmt->get(), 4) != SQLITE_NULL) {
          record.metadata[key] = sqlite3_column_int(stmt->get(), 4) != 0;
        } else if (sqlite3_column_type(stmt->get(), 1) != SQLITE_NULL) {
          record.metadata[key] = ColumnText(stmt->get(), 1);
        } else if (sqlite3_column_type(stmt->get(), 2) != SQLITE_NULL) {
          record.metadata[key] = sqlite3_column_int64(stmt->get(), 2);
        } else if (sqlite3_column_type(stmt->get(), 3) != SQLITE_NULL) {
          record.metadata[key] = sqlite3_column_double(stmt->get(), 3);
        } else {
          record.metadata[key] = nullptr;
        }
      }
      if (step != SQLITE_DONE) {
        return MakeUnexpected(SqliteError(db_.get(), "read metadata"));
      }
      record.source = ResolveSource(record.metadata);
    }
    return records;
  }

  /**
   * @brief Latest queued embedding of each item, std::nullopt where none is queued
   */
  utils::Expected<std::vector<std::optional<std::vector<float>>>, utils::Error> ReadQueuedVectors(
      const std::vector<ItemRow>& items, const std::string& collection_id) const {
    std::vector<std::optional<std::vector<float>>> vectors(items.size());
    if (!HasTable("embeddings_queue")) {
      return vectors;
    }

    const bool has_encoding = HasColumn("embeddings_queue", "encoding");
    // Topics are "persistent://<tenant>/<namespace>/<collection id>" or the bare id
    auto stmt = Prepare(has_encoding ? "SELECT operation, vector, encoding FROM embeddings_queue "
                                       "WHERE id = ?1 AND substr(topic, -length(?2)) = ?2 "
                                       "ORDER BY seq_id DESC LIMIT 1"
                                     : "SELECT operation, vector, NULL FROM embeddings_queue "
                                       "WHERE id = ?1 AND substr(topic, -length(?2)) = ?2 "
                                       "ORDER BY seq_id DESC LIMIT 1");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }

    for (size_t i = 0; i < items.size(); ++i) {
      sqlite3_reset(stmt->get());
      sqlite3_bind_text(stmt->get(), 1, items[i].embedding_id.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(stmt->get(), 2, collection_id.c_str(), -1, SQLITE_TRANSIENT);

      int step = sqlite3_step(stmt->get());
      if (step == SQLITE_DONE) {
        continue;
      }
      if (step != SQLITE_ROW) {
        return MakeUnexpected(SqliteError(db_.get(), "read embeddings queue"));
      }
      if (sqlite3_column_int(stmt->get(), 0) == kChromaDeleteOperation ||
          sqlite3_column_type(stmt->get(), 1) != SQLITE_BLOB) {
        continue;
      }
      vectors[i] = DecodeVector(sqlite3_column_blob(stmt->get(), 1),
                                static_cast<size_t>(sqlite3_column_bytes(stmt->get(), 1)),
                                ColumnText(stmt->get(), 2));
    }
    return vectors;
  }

 private:
  explicit ChromaDatabase(DatabasePtr db) : db_(std::move(db)) {}

  /**
   * @brief Decode a queued vector blob (FLOAT32 by default, INT32 converted)
   */
  static std::vector<float> DecodeVector(const void* blob, size_t bytes, const std::string& encoding) {
    const size_t count = bytes / sizeof(float);
    std::vector<float> vector(count);
    if (count == 0 || blob == nullptr) {
      return vector;
    }
    if (encoding == "INT32") {
      std::vector<int32_t> values(count);
      std::memcpy(values.data(), blob, count * sizeof(int32_t));
      for (size_t i = 0; i < count; ++i) {
        vector[i] = static_cast<float>(values[i]);
      }
    } else {
      std::memcpy(vector.data(), blob, count * sizeof(float));
    }
    return vector;
  }

  DatabasePtr db_;
};

/**
 * @brief Fill vectors missing from the queue out of the persisted HNSW segment
 */
size_t FillFromSegment(const std::string& segment_dir, const std::vector<ItemRow>& items,
                       std::vector<std::optional<std::vector<float>>>& vectors) {
  std::vector<std::string> missing_ids;
  std::vector<size_t> missing_positions;
  for (size_t i = 0; i < items.size(); ++i) {
    if (!vectors[i]) {
      missing_ids.push_back(items[i].embedding_id);
      missing_positions.push_back(i);
    }
  }
  if (missing_ids.empty()) {
    return 0;
  }

  std::error_code ec;
  if (!fs::is_directory(segment_dir, ec)) {
    return 0;
  }

  auto segment = HnswSegment::Open(segment_dir);
  if (!segment) {
    utils::LogStoreWarning("hnsw_segment_unreadable", segment_dir, segment.error().to_string());
    return 0;
  }

  auto found = segment->ReadVectors(missing_ids);
  size_t filled = 0;
  for (size_t i = 0; i < found.size(); ++i) {
    if (found[i]) {
      vectors[missing_positions[i]] = std::move(found[i]);
      ++filled;
    }
  }
  return filled;
}

}  // namespace

utils::Expected<StoreContents, utils::Error> CollectionStoreReader::Read(size_t max_records) const {
  std::error_code ec;
  if (!fs::exists(db_dir_, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "Database path not found: " + db_dir_));
  }
  if (!fs::is_directory(db_dir_, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "Path is not a directory: " + db_dir_));
  }
  const std::string db_path = (fs::path(db_dir_) / kChromaMarkerFile).string();
  if (!fs::is_regular_file(db_path, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "Chroma database not found: " + db_path));
  }

  auto db = ChromaDatabase::Open(db_path);
  if (!db) {
    return MakeUnexpected(db.error());
  }

  auto collections = db->ListCollections();
  if (!collections) {
    return MakeUnexpected(collections.error());
  }
  if (collections->empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kNoCollections, "No collections found in Chroma database"));
  }
  const CollectionRow& collection = collections->front();
  if (collections->size() > 1) {
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "collections_skipped")
        .Field("path", db_dir_)
        .Field("collection", collection.name)
        .Field("skipped", static_cast<uint64_t>(collections->size() - 1))
        .Message("Only the first collection is read")
        .Warn();
  }

  StoreContents contents;
  contents.facts.type = "chroma";
  contents.facts.collection_name = collection.name;

  auto metadata_segment = db->FindSegment(collection.id, "METADATA");
  if (!metadata_segment) {
    return MakeUnexpected(metadata_segment.error());
  }
  if (!*metadata_segment) {
    // A collection without a metadata segment has never received an item
    return contents;
  }

  auto total = db->CountItems(**metadata_segment);
  if (!total) {
    return MakeUnexpected(total.error());
  }
  contents.facts.total = *total;
  if (*total == 0) {
    return contents;
  }

  auto items = db->ListItems(**metadata_segment, max_records);
  if (!items) {
    return MakeUnexpected(items.error());
  }

  auto metadata = db->ReadMetadata(*items);
  if (!metadata) {
    return MakeUnexpected(metadata.error());
  }
  contents.metadata = std::move(*metadata);

  auto queued = db->ReadQueuedVectors(*items, collection.id);
  if (!queued) {
    return MakeUnexpected(queued.error());
  }
  std::vector<std::optional<std::vector<float>>> vectors = std::move(*queued);

  auto vector_segment = db->FindSegment(collection.id, "VECTOR");
  if (!vector_segment) {
    return MakeUnexpected(vector_segment.error());
  }
  if (*vector_segment) {
    FillFromSegment((fs::path(db_dir_) / **vector_segment).string(), *items, vectors);
  }

  // Dimension of the first embedding returned
  size_t dimension = 0;
  for (const auto& vector : vectors) {
    if (vector && !vector->empty()) {
      dimension = vector->size();
      break;
    }
  }
  if (dimension == 0) {
    if (collection.dimension == 0) {
      return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex,
                                      "Failed to load Chroma database: no embedding could be read", db_path));
    }
    dimension = collection.dimension;
  }
  contents.facts.declared_dimension = dimension;

  size_t missing = 0;
  contents.vectors.reserve(vectors.size());
  for (auto& vector : vectors) {
    if (!vector) {
      ++missing;
      contents.vectors.emplace_back(dimension, 0.0F);
    } else {
      contents.vectors.push_back(std::move(*vector));
    }
  }

  if (missing > 0) {
    contents.facts.reconstructible = false;
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "partial_reconstruction")
        .Field("path", db_dir_)
        .Field("missing", static_cast<uint64_t>(missing))
        .Field("requested", static_cast<uint64_t>(vectors.size()))
        .Warn();
  }
  return contents;
}

}  // namespace vecscope::store
