/**
 * @file hnsw_segment.cpp
 * @brief Chroma HNSW segment reading
 */

#include "store/hnsw_segment.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

#include "store/pickle_decoder.h"
#include "utils/binary_reader.h"
#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace vecscope::store {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr uint64_t kLabelSize = sizeof(uint64_t);

bool ReadHeader(std::istream& input, HnswHeader& header) {
  return utils::ReadBinary(input, header.offset_level0) && utils::ReadBinary(input, header.max_elements) &&
         utils::ReadBinary(input, header.cur_element_count) &&
         utils::ReadBinary(input, header.size_data_per_element) && utils::ReadBinary(input, header.label_offset) &&
         utils::ReadBinary(input, header.offset_data) && utils::ReadBinary(input, header.max_level) &&
         utils::ReadBinary(input, header.enter_point) && utils::ReadBinary(input, header.max_m) &&
         utils::ReadBinary(input, header.max_m0) && utils::ReadBinary(input, header.m) &&
         utils::ReadBinary(input, header.mult) && utils::ReadBinary(input, header.ef_construction);
}

bool ValidLayout(const HnswHeader& header) {
  return header.size_data_per_element > 0 && header.offset_data < header.label_offset &&
         (header.label_offset - header.offset_data) % sizeof(float) == 0 &&
         header.label_offset + kLabelSize <= header.size_data_per_element &&
         header.cur_element_count <= header.max_elements;
}

/**
 * @brief Extract embedding id -> label from the decoded PersistentData object
 */
bool ParseIdMapping(const json& persistent, std::unordered_map<std::string, uint64_t>& id_to_label) {
  if (!persistent.is_object()) {
    return false;
  }

  auto forward = persistent.find("id_to_label");
  if (forward != persistent.end() && forward->is_object()) {
    for (auto iter = forward->begin(); iter != forward->end(); ++iter) {
      if (iter.value().is_number_integer()) {
        id_to_label[iter.key()] = iter.value().get<uint64_t>();
      }
    }
    return true;
  }

  auto reverse = persistent.find("label_to_id");
  if (reverse != persistent.end() && reverse->is_object()) {
    for (auto iter = reverse->begin(); iter != reverse->end(); ++iter) {
      if (!iter.value().is_string()) {
        continue;
      }
      try {
        id_to_label[iter.value().get<std::string>()] = std::stoull(iter.key());
      } catch (const std::exception&) {
        continue;
      }
    }
    return true;
  }
  return false;
}

}  // namespace

utils::Expected<HnswSegment, utils::Error> HnswSegment::Open(const std::string& segment_dir) {
  const fs::path dir(segment_dir);
  const std::string header_path = (dir / kHnswHeaderFile).string();
  const std::string data_path = (dir / kHnswDataFile).string();
  const std::string metadata_path = (dir / kHnswMetadataFile).string();

  std::error_code ec;
  for (const auto& required : {header_path, data_path, metadata_path}) {
    if (!fs::is_regular_file(required, ec)) {
      return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "HNSW segment file not found: " + required));
    }
  }

  HnswSegment segment;
  segment.data_path_ = data_path;

  std::ifstream header_input(header_path, std::ios::binary);
  if (!header_input || !ReadHeader(header_input, segment.header_)) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Truncated HNSW header", header_path));
  }
  if (!ValidLayout(segment.header_)) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Invalid HNSW element layout", header_path));
  }
  segment.dimension_ =
      static_cast<size_t>((segment.header_.label_offset - segment.header_.offset_data) / sizeof(float));

  auto persistent = PickleDecoder::DecodeFile(metadata_path);
  if (!persistent) {
    return MakeUnexpected(persistent.error());
  }
  if (!ParseIdMapping(*persistent, segment.id_to_label_)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMetadataParseFailure, "HNSW metadata holds no id mapping", metadata_path));
  }

  // Labels live inside each element; map them back to rows
  std::ifstream data_input(data_path, std::ios::binary);
  if (!data_input) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Cannot open HNSW data", data_path));
  }
  data_input.seekg(0, std::ios::end);
  const auto file_size = static_cast<uint64_t>(data_input.tellg());
  const uint64_t rows = std::min(segment.header_.cur_element_count, file_size / segment.header_.size_data_per_element);

  for (uint64_t row = 0; row < rows; ++row) {
    data_input.seekg(static_cast<std::streamoff>(row * segment.header_.size_data_per_element +
                                                 segment.header_.label_offset),
                     std::ios::beg);
    uint64_t label = 0;
    if (!utils::ReadBinary(data_input, label)) {
      break;
    }
    segment.label_to_row_.emplace(label, row);
  }

  if (rows < segment.header_.cur_element_count) {
    utils::LogStoreWarning("partial_storage", data_path,
                           "HNSW data holds " + std::to_string(rows) + " of " +
                               std::to_string(segment.header_.cur_element_count) + " elements");
  }
  return segment;
}

std::vector<std::optional<std::vector<float>>> HnswSegment::ReadVectors(const std::vector<std::string>& ids) const {
  std::vector<std::optional<std::vector<float>>> vectors(ids.size());

  std::ifstream input(data_path_, std::ios::binary);
  if (!input) {
    return vectors;
  }

  for (size_t i = 0; i < ids.size(); ++i) {
    auto label = id_to_label_.find(ids[i]);
    if (label == id_to_label_.end()) {
      continue;
    }
    auto row = label_to_row_.find(label->second);
    if (row == label_to_row_.end()) {
      continue;
    }

    input.clear();
    input.seekg(static_cast<std::streamoff>(row->second * header_.size_data_per_element + header_.offset_data),
                std::ios::beg);
    std::vector<float> vector;
    if (utils::ReadFloats(input, vector, dimension_)) {
      vectors[i] = std::move(vector);
    }
  }
  return vectors;
}

}  // namespace vecscope::store
