/**
 * @file faiss_index_file.h
 * @brief FAISS index loading and vector reconstruction through libfaiss
 *
 * Any index type faiss::read_index understands can be opened. Vectors are
 * read back by position with Index::reconstruct; index types that cannot
 * reconstruct yield zero vectors.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace faiss {
struct Index;
}  // namespace faiss

namespace vecscope::store {

/**
 * @brief Outcome of reading vectors back from an index
 */
struct ReconstructionReport {
  size_t reconstructed = 0;  ///< Rows filled from the index
  bool supported = true;     ///< false when the index type cannot reconstruct at all
  std::string error;         ///< First faiss error message, if any row failed
};

/**
 * @brief An opened FAISS index
 *
 * Owns the faiss::Index. IndexIDMap wrappers are read through their inner
 * index so that row i is the i-th stored vector, not the vector with
 * external id i.
 */
class FaissIndexFile {
 public:
  /**
   * @brief Load an index with faiss::read_index
   * @return kPathNotFound if the file is absent, kCorruptIndex if faiss
   *         rejects the file
   */
  static utils::Expected<FaissIndexFile, utils::Error> Open(const std::string& path);

  /**
   * @brief Wrap an index that is already in memory
   */
  explicit FaissIndexFile(std::unique_ptr<faiss::Index> index);

  ~FaissIndexFile();
  FaissIndexFile(FaissIndexFile&&) noexcept;
  FaissIndexFile& operator=(FaissIndexFile&&) noexcept;
  FaissIndexFile(const FaissIndexFile&) = delete;
  FaissIndexFile& operator=(const FaissIndexFile&) = delete;

  size_t dimension() const;
  int64_t ntotal() const;

  /**
   * @brief "l2", "inner_product" or the numeric faiss::MetricType
   */
  std::string MetricName() const;

  /**
   * @brief Read rows [0, count) into vectors
   *
   * vectors is resized to count entries of dimension zeros first; rows that
   * faiss cannot reconstruct stay zero. Reading stops at the first failure
   * when no row could be read, since the index type then has no
   * reconstruction at all.
   */
  ReconstructionReport Reconstruct(size_t count, std::vector<std::vector<float>>& vectors) const;

 private:
  std::unique_ptr<faiss::Index> index_;
  const faiss::Index* storage_ = nullptr;  // index_ or the index an IDMap wraps
};

}  // namespace vecscope::store
