/**
 * @file standalone_index_reader.cpp
 * @brief Standalone FAISS index reading
 */

#include "store/standalone_index_reader.h"

#include <algorithm>

#include "store/faiss_index_file.h"
#include "store/metadata_resolver.h"
#include "utils/structured_log.h"

namespace vecscope::store {

utils::Expected<StoreContents, utils::Error> ReadFaissVectors(const std::string& index_path, size_t max_records) {
  auto index = FaissIndexFile::Open(index_path);
  if (!index) {
    return utils::MakeUnexpected(index.error());
  }

  const auto total = static_cast<size_t>(index->ntotal());
  const size_t count = std::min(total, max_records);

  StoreContents contents;
  contents.facts.type = "faiss";
  contents.facts.declared_dimension = index->dimension();
  contents.facts.total = total;

  ReconstructionReport report = index->Reconstruct(count, contents.vectors);
  contents.facts.reconstructible = report.supported;
  if (!report.supported) {
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "reconstruction_unavailable")
        .Field("path", index_path)
        .Field("records", static_cast<uint64_t>(count))
        .Message(report.error)
        .Warn();
  } else if (report.reconstructed < count) {
    utils::StructuredLog()
        .Event("store_warning")
        .Field("type", "partial_reconstruction")
        .Field("path", index_path)
        .Field("reconstructed", static_cast<uint64_t>(report.reconstructed))
        .Field("requested", static_cast<uint64_t>(count))
        .Message(report.error)
        .Warn();
  }

  utils::StructuredLog()
      .Event("index_opened")
      .Field("path", index_path)
      .Field("metric", index->MetricName())
      .Field("dimension", static_cast<uint64_t>(index->dimension()))
      .Field("ntotal", index->ntotal())
      .Debug();

  return contents;
}

utils::Expected<StoreContents, utils::Error> StandaloneIndexReader::Read(size_t max_records) const {
  auto contents = ReadFaissVectors(index_path_, max_records);
  if (!contents) {
    return contents;
  }
  contents->metadata = ResolveSidecarMetadata(index_path_);
  return contents;
}

}  // namespace vecscope::store
