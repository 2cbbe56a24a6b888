/**
 * @file vector_dataset.cpp
 * @brief Canonical dataset serialization
 */

#include "store/vector_dataset.h"

#include <sstream>

namespace vecscope::store {

namespace {

constexpr int kPositionalIdDigits = 4;

std::string QuoteCsvField(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string quoted = "\"";
  for (char chr : field) {
    if (chr == '"') {
      quoted += "\"\"";
    } else {
      quoted += chr;
    }
  }
  quoted += "\"";
  return quoted;
}

}  // namespace

std::string FormatPositionalId(size_t position) {
  std::ostringstream oss;
  oss << "chunk_";
  oss.width(kPositionalIdDigits);
  oss.fill('0');
  oss << position;
  return oss.str();
}

nlohmann::json ToJson(const VectorDataset& dataset) {
  nlohmann::json payload;
  payload["type"] = dataset.type;
  payload["count"] = dataset.count;
  payload["dimension"] = dataset.dimension;
  payload["total_vectors"] = dataset.total_vectors;
  if (dataset.collection_name) {
    payload["collection_name"] = *dataset.collection_name;
  }

  nlohmann::json records = nlohmann::json::array();
  for (const auto& record : dataset.vectors) {
    nlohmann::json item;
    item["id"] = record.id;
    item["vector"] = record.vector;
    item["text"] = record.text;
    item["source"] = record.source;
    item["metadata"] = record.metadata.is_object() ? record.metadata : nlohmann::json::object();
    records.push_back(std::move(item));
  }
  payload["vectors"] = std::move(records);

  return payload;
}

std::string ToCsv(const VectorDataset& dataset) {
  std::ostringstream csv;
  csv << "id,text,source,vector,dimension,metadata\r\n";

  for (const auto& record : dataset.vectors) {
    nlohmann::json vector_json = record.vector;
    const auto& metadata = record.metadata.is_object() ? record.metadata : nlohmann::json::object();

    csv << QuoteCsvField(record.id) << ',' << QuoteCsvField(record.text) << ',' << QuoteCsvField(record.source) << ','
        << QuoteCsvField(DumpJson(vector_json)) << ',' << record.vector.size() << ','
        << QuoteCsvField(DumpJson(metadata)) << "\r\n";
  }

  return csv.str();
}

std::string DumpJson(const nlohmann::json& value, int indent) {
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace vecscope::store
