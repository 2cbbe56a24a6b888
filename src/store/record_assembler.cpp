/**
 * @file record_assembler.cpp
 * @brief Dataset assembly
 */

#include "store/record_assembler.h"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

#include "utils/structured_log.h"

namespace vecscope::store {

VectorDataset Assemble(const StoreFacts& facts, std::vector<std::vector<float>> vectors,
                       const PositionalMetadata& metadata, size_t max_records) {
  VectorDataset dataset;
  dataset.type = facts.type;
  dataset.count = std::min(facts.total, max_records);
  dataset.dimension = facts.declared_dimension;
  dataset.total_vectors = facts.total;
  dataset.collection_name = facts.collection_name;
  dataset.vectors.reserve(dataset.count);

  size_t reshaped = 0;
  std::unordered_set<std::string> seen_ids;

  for (size_t i = 0; i < dataset.count; ++i) {
    VectorRecord record;

    if (i < vectors.size()) {
      record.vector = std::move(vectors[i]);
    }
    if (record.vector.size() != dataset.dimension) {
      if (!record.vector.empty()) {
        ++reshaped;
      }
      record.vector.resize(dataset.dimension, 0.0F);
    }

    if (i < metadata.size()) {
      const RecordMetadata& resolved = metadata[i];
      record.id = resolved.id.value_or(std::string());
      record.text = resolved.text;
      record.source = resolved.source;
      record.metadata = resolved.metadata.is_object() ? resolved.metadata : nlohmann::json::object();
    }
    if (record.id.empty()) {
      record.id = FormatPositionalId(i);
    }

    while (!seen_ids.insert(record.id).second) {
      record.id += "_" + std::to_string(i);
    }

    dataset.vectors.push_back(std::move(record));
  }

  if (reshaped > 0) {
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "dimension_mismatch")
        .Field("records", static_cast<uint64_t>(reshaped))
        .Field("dimension", static_cast<uint64_t>(dataset.dimension))
        .Warn();
  }
  return dataset;
}

VectorDataset Assemble(StoreContents contents, size_t max_records) {
  return Assemble(contents.facts, std::move(contents.vectors), contents.metadata, max_records);
}

}  // namespace vecscope::store
