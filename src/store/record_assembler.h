/**
 * @file record_assembler.h
 * @brief Merge reader output into the canonical dataset
 */

#pragma once

#include <cstddef>
#include <vector>

#include "store/store_types.h"
#include "store/vector_dataset.h"

namespace vecscope::store {

/**
 * @brief Build a dataset from store facts, positional vectors and metadata
 *
 * - count = min(facts.total, max_records)
 * - dimension = facts.declared_dimension
 * - vectors missing or of the wrong length are zero-padded or truncated
 * - metadata missing for a position leaves empty fields
 * - ids default to "chunk_%04d" of the position; a duplicate id gets
 *   "_<position>" appended
 *
 * Never fails.
 */
VectorDataset Assemble(const StoreFacts& facts, std::vector<std::vector<float>> vectors,
                       const PositionalMetadata& metadata, size_t max_records);

/**
 * @brief Assemble everything a reader returned
 */
VectorDataset Assemble(StoreContents contents, size_t max_records);

}  // namespace vecscope::store
