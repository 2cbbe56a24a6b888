/**
 * @file metadata_resolver.cpp
 * @brief Sidecar metadata lookup and shape matching
 */

#include "store/metadata_resolver.h"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <utility>

#include "store/source_keys.h"
#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace vecscope::store {

using json = nlohmann::json;

namespace {

/**
 * @brief Value of the first present key, or nullptr
 */
const json* FirstOf(const json& object, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto iter = object.find(key);
    if (iter != object.end()) {
      return &*iter;
    }
  }
  return nullptr;
}

const json* ListField(const json& document, const char* key) {
  auto iter = document.find(key);
  if (iter == document.end() || !iter->is_array()) {
    return nullptr;
  }
  return &*iter;
}

void ApplyId(RecordMetadata& record, const json* value) {
  if (value == nullptr) {
    return;
  }
  if (value->is_string() || value->is_number_integer()) {
    record.id = ScalarToString(*value);
  }
}

void ApplyString(std::string& field, const json* value) {
  if (value != nullptr && value->is_string()) {
    field = value->get<std::string>();
  }
}

void ApplyMetadata(RecordMetadata& record, const json* value) {
  if (value != nullptr && value->is_object()) {
    record.metadata = *value;
  }
}

/**
 * @brief Apply a list of plain strings to one field of each position
 */
template <typename Setter>
void ApplyStringList(PositionalMetadata& records, const json& list, Setter setter) {
  if (records.size() < list.size()) {
    records.resize(list.size());
  }
  for (size_t i = 0; i < list.size(); ++i) {
    setter(records[i], list[i]);
  }
}

PositionalMetadata ParseObjectShape(const json& document) {
  PositionalMetadata records;

  if (const json* chunks = ListField(document, "chunks")) {
    records.resize(chunks->size());
    for (size_t i = 0; i < chunks->size(); ++i) {
      const json& chunk = (*chunks)[i];
      if (!chunk.is_object()) {
        continue;
      }
      ApplyId(records[i], FirstOf(chunk, {"id"}));
      ApplyString(records[i].text, FirstOf(chunk, {"text"}));
      ApplyString(records[i].source, FirstOf(chunk, {"source"}));
      ApplyMetadata(records[i], FirstOf(chunk, {"metadata"}));
    }
  } else {
    const json* texts = ListField(document, "documents");
    if (texts == nullptr) {
      texts = ListField(document, "texts");
    }
    if (texts != nullptr) {
      ApplyStringList(records, *texts,
                      [](RecordMetadata& record, const json& value) { ApplyString(record.text, &value); });
    }
  }

  // Overrides regardless of the shape above
  if (const json* sources = ListField(document, "sources")) {
    ApplyStringList(records, *sources,
                    [](RecordMetadata& record, const json& value) { ApplyString(record.source, &value); });
  }
  if (const json* ids = ListField(document, "ids")) {
    ApplyStringList(records, *ids, [](RecordMetadata& record, const json& value) { ApplyId(record, &value); });
  }

  return records;
}

PositionalMetadata ParseListShape(const json& document) {
  PositionalMetadata records(document.size());
  for (size_t i = 0; i < document.size(); ++i) {
    const json& item = document[i];
    if (item.is_string()) {
      records[i].text = item.get<std::string>();
    } else if (item.is_object()) {
      ApplyId(records[i], FirstOf(item, {"id"}));
      ApplyString(records[i].text, FirstOf(item, {"text", "content"}));
      ApplyString(records[i].source, FirstOf(item, {"source", "file"}));
      ApplyMetadata(records[i], FirstOf(item, {"metadata"}));
    }
  }
  return records;
}

}  // namespace

std::vector<std::string> SidecarCandidates(const std::string& index_path) {
  fs::path index(index_path);
  fs::path dir = index.parent_path();
  fs::path base = index;
  base.replace_extension();

  return {base.string() + ".json",
          base.string() + "_metadata.json",
          (dir / "metadata.json").string(),
          (dir / "chunks.json").string(),
          (dir / "documents.json").string()};
}

std::optional<std::string> FindSidecar(const std::string& index_path) {
  for (const auto& candidate : SidecarCandidates(index_path)) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

PositionalMetadata ParseSidecar(const json& document) {
  if (document.is_object()) {
    return ParseObjectShape(document);
  }
  if (document.is_array()) {
    return ParseListShape(document);
  }
  return {};
}

utils::Expected<PositionalMetadata, utils::Error> LoadSidecar(const std::string& sidecar_path) {
  std::ifstream input(sidecar_path);
  if (!input) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kMetadataParseFailure, "Cannot open metadata file", sidecar_path));
  }

  try {
    json document = json::parse(input);
    return ParseSidecar(document);
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMetadataParseFailure,
                                                  std::string("Failed to parse metadata: ") + e.what(),
                                                  sidecar_path));
  }
}

PositionalMetadata ResolveSidecarMetadata(const std::string& index_path) {
  auto sidecar = FindSidecar(index_path);
  if (!sidecar) {
    std::ostringstream searched;
    for (const auto& candidate : SidecarCandidates(index_path)) {
      if (searched.tellp() > 0) {
        searched << ", ";
      }
      searched << candidate;
    }
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "sidecar_missing")
        .Field("path", index_path)
        .Field("searched", searched.str())
        .Message("No metadata file found, text fields will be empty")
        .Warn();
    return {};
  }

  auto metadata = LoadSidecar(*sidecar);
  if (!metadata) {
    utils::LogStoreWarning("metadata_parse_failure", *sidecar, metadata.error().to_string());
    return {};
  }

  utils::StructuredLog()
      .Event("sidecar_loaded")
      .Field("path", *sidecar)
      .Field("records", static_cast<uint64_t>(metadata->size()))
      .Debug();
  return std::move(*metadata);
}

}  // namespace vecscope::store
