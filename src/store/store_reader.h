/**
 * @file store_reader.h
 * @brief Common interface of the per-layout store readers
 */

#pragma once

#include <cstddef>
#include <memory>

#include "store/store_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

/**
 * @brief Reads positional vectors, store facts and native metadata from one store
 *
 * Each Read() opens the store afresh and releases every handle before
 * returning. Readers hold no state between calls.
 */
class VectorStoreReader {
 public:
  virtual ~VectorStoreReader() = default;

  /**
   * @brief Read at most max_records items
   *
   * Non-fatal problems (unreadable rows, undecodable documents) are logged
   * and absorbed; only failures that make the store unusable are returned.
   */
  virtual utils::Expected<StoreContents, utils::Error> Read(size_t max_records) const = 0;
};

/**
 * @brief Create the reader for a detected store
 */
std::unique_ptr<VectorStoreReader> MakeReader(const Detection& detection);

}  // namespace vecscope::store
