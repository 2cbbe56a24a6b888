/**
 * @file store_reader.cpp
 * @brief Reader selection by store kind
 */

#include "store/store_reader.h"

#include "store/collection_store_reader.h"
#include "store/linked_docstore_reader.h"
#include "store/standalone_index_reader.h"

namespace vecscope::store {

std::unique_ptr<VectorStoreReader> MakeReader(const Detection& detection) {
  switch (detection.kind) {
    case StoreKind::kStandaloneFaissFile:
    case StoreKind::kStandaloneFaissDir:
      return std::make_unique<StandaloneIndexReader>(detection.index_path);
    case StoreKind::kLinkedDocstoreFaiss:
      return std::make_unique<LinkedDocstoreReader>(detection.index_path, detection.companion_path);
    case StoreKind::kChromaCollection:
      return std::make_unique<CollectionStoreReader>(detection.path);
  }
  return nullptr;
}

}  // namespace vecscope::store
