/**
 * @file faiss_index_file.cpp
 * @brief FAISS index loading through libfaiss
 */

#include "store/faiss_index_file.h"

#include <faiss/IVFlib.h>
#include <faiss/Index.h>
#include <faiss/IndexIDMap.h>
#include <faiss/IndexIVF.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <filesystem>
#include <new>
#include <utility>

#include "utils/structured_log.h"

namespace vecscope::store {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

const faiss::Index* StorageOf(const faiss::Index* index) {
  // IndexIDMap2 derives from IndexIDMap
  if (const auto* id_map = dynamic_cast<const faiss::IndexIDMap*>(index)) {
    return id_map->index;
  }
  return index;
}

/**
 * @brief Give IVF indexes a position -> list entry map so reconstruct() works
 *
 * IVF indexes loaded from disk carry no direct map. Without one every
 * reconstruct() call throws, even though the vectors (or their codes) are
 * in the inverted lists.
 */
void EnableIvfReconstruction(faiss::Index* index, const std::string& path) {
  faiss::IndexIVF* ivf = faiss::ivflib::try_extract_index_ivf(index);
  if (ivf == nullptr) {
    return;
  }
  try {
    ivf->make_direct_map(true);
  } catch (const faiss::FaissException& e) {
    utils::LogStoreWarning("direct_map_unavailable", path, e.what());
  }
}

}  // namespace

FaissIndexFile::FaissIndexFile(std::unique_ptr<faiss::Index> index)
    : index_(std::move(index)), storage_(StorageOf(index_.get())) {}

FaissIndexFile::~FaissIndexFile() = default;
FaissIndexFile::FaissIndexFile(FaissIndexFile&&) noexcept = default;
FaissIndexFile& FaissIndexFile::operator=(FaissIndexFile&&) noexcept = default;

utils::Expected<FaissIndexFile, utils::Error> FaissIndexFile::Open(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "FAISS index file not found: " + path));
  }

  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(path.c_str()));
  } catch (const faiss::FaissException& e) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index", e.what()));
  } catch (const std::bad_alloc&) {
    // Garbage sizes in a damaged header surface as huge allocations
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index", "allocation failed"));
  }

  if (!index) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index", "null index"));
  }
  if (index->d <= 0 || index->ntotal < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index",
                                    "d=" + std::to_string(index->d) + " ntotal=" + std::to_string(index->ntotal)));
  }

  EnableIvfReconstruction(index.get(), path);
  return FaissIndexFile(std::move(index));
}

size_t FaissIndexFile::dimension() const {
  return static_cast<size_t>(index_->d);
}

int64_t FaissIndexFile::ntotal() const {
  return static_cast<int64_t>(index_->ntotal);
}

std::string FaissIndexFile::MetricName() const {
  switch (index_->metric_type) {
    case faiss::METRIC_L2:
      return "l2";
    case faiss::METRIC_INNER_PRODUCT:
      return "inner_product";
    default:
      return std::to_string(static_cast<int>(index_->metric_type));
  }
}

ReconstructionReport FaissIndexFile::Reconstruct(size_t count, std::vector<std::vector<float>>& vectors) const {
  const size_t dim = dimension();
  vectors.assign(count, std::vector<float>(dim, 0.0F));

  ReconstructionReport report;
  const size_t available = std::min(count, static_cast<size_t>(storage_->ntotal));
  for (size_t i = 0; i < available; ++i) {
    try {
      storage_->reconstruct(static_cast<faiss::idx_t>(i), vectors[i].data());
      ++report.reconstructed;
    } catch (const faiss::FaissException& e) {
      std::fill(vectors[i].begin(), vectors[i].end(), 0.0F);
      if (report.error.empty()) {
        report.error = e.what();
      }
      if (report.reconstructed == 0) {
        report.supported = false;
        break;
      }
    }
  }
  return report;
}

}  // namespace vecscope::store
