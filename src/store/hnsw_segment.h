/**
 * @file hnsw_segment.h
 * @brief Read-only access to a persisted Chroma HNSW vector segment
 *
 * A segment directory holds the hnswlib index split into header.bin,
 * data_level0.bin, length.bin and link_lists.bin, plus index_metadata.pickle
 * mapping embedding ids to hnswlib labels. Only header.bin, data_level0.bin
 * and the pickle are read.
 *
 * Collections created with the cosine space store normalized vectors.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

constexpr const char* kHnswHeaderFile = "header.bin";
constexpr const char* kHnswDataFile = "data_level0.bin";
constexpr const char* kHnswMetadataFile = "index_metadata.pickle";

/**
 * @brief hnswlib HierarchicalNSW persisted header (saveIndex field order)
 */
struct HnswHeader {
  uint64_t offset_level0 = 0;
  uint64_t max_elements = 0;
  uint64_t cur_element_count = 0;
  uint64_t size_data_per_element = 0;
  uint64_t label_offset = 0;
  uint64_t offset_data = 0;
  int32_t max_level = 0;
  uint32_t enter_point = 0;
  uint64_t max_m = 0;
  uint64_t max_m0 = 0;
  uint64_t m = 0;
  double mult = 0.0;
  uint64_t ef_construction = 0;
};

class HnswSegment {
 public:
  /**
   * @brief Open a segment directory
   * @return kPathNotFound if a required file is absent, kCorruptIndex if the
   *         header is malformed, kMetadataParseFailure if the id mapping
   *         cannot be decoded
   */
  static utils::Expected<HnswSegment, utils::Error> Open(const std::string& segment_dir);

  const HnswHeader& header() const { return header_; }

  /**
   * @brief Vector length derived from the element layout
   */
  size_t dimension() const { return dimension_; }

  /**
   * @brief Number of elements in the segment
   */
  size_t size() const { return static_cast<size_t>(header_.cur_element_count); }

  /**
   * @brief Fetch vectors by embedding id
   *
   * @return One entry per requested id, std::nullopt where the id is unknown
   *         or its row cannot be read
   */
  std::vector<std::optional<std::vector<float>>> ReadVectors(const std::vector<std::string>& ids) const;

 private:
  HnswSegment() = default;

  std::string data_path_;
  HnswHeader header_;
  size_t dimension_ = 0;
  std::unordered_map<std::string, uint64_t> id_to_label_;
  std::unordered_map<uint64_t, uint64_t> label_to_row_;
};

}  // namespace vecscope::store
