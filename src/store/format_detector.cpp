/**
 * @file format_detector.cpp
 * @brief Store format detection
 */

#include "store/format_detector.h"

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace vecscope::store {

namespace {

bool IsRegularFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

Detection MakeDetection(StoreKind kind, const fs::path& path) {
  Detection detection;
  detection.kind = kind;
  detection.path = path.string();

  switch (kind) {
    case StoreKind::kStandaloneFaissFile:
      detection.index_path = path.string();
      break;
    case StoreKind::kLinkedDocstoreFaiss:
      detection.index_path = (path / kFaissIndexFile).string();
      detection.companion_path = (path / kDocstoreFile).string();
      break;
    case StoreKind::kChromaCollection:
      detection.companion_path = (path / kChromaMarkerFile).string();
      break;
    case StoreKind::kStandaloneFaissDir:
      detection.index_path = (path / kFaissIndexFile).string();
      break;
  }
  return detection;
}

std::vector<fs::path> SortedEntries(const fs::path& dir) {
  std::vector<fs::path> entries;
  std::error_code ec;
  for (fs::directory_iterator iter(dir, ec), end; !ec && iter != end; iter.increment(ec)) {
    entries.push_back(iter->path());
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

}  // namespace

const char* StoreKindToString(StoreKind kind) {
  switch (kind) {
    case StoreKind::kStandaloneFaissFile:
      return "standalone_faiss_file";
    case StoreKind::kLinkedDocstoreFaiss:
      return "linked_docstore_faiss";
    case StoreKind::kChromaCollection:
      return "chroma_collection";
    case StoreKind::kStandaloneFaissDir:
      return "standalone_faiss_dir";
  }
  return "unknown";
}

const char* StoreKindToType(StoreKind kind) {
  return kind == StoreKind::kChromaCollection ? "chroma" : "faiss";
}

bool HasIndexSuffix(const std::string& filename) {
  std::string lower = filename;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

  auto ends_with = [&lower](const std::string& suffix) {
    return lower.size() >= suffix.size() && lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  return ends_with(".faiss") || ends_with(".index");
}

utils::Expected<Detection, utils::Error> Detect(const std::string& path) {
  std::error_code ec;
  fs::path store_path(path);
  auto status = fs::status(store_path, ec);

  if (ec || !fs::exists(status)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kPathNotFound, "Path not found: " + path));
  }

  if (fs::is_regular_file(status)) {
    if (HasIndexSuffix(store_path.filename().string())) {
      return MakeDetection(StoreKind::kStandaloneFaissFile, store_path);
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kUnsupportedFormat,
                                                  "Unsupported file type: expected a .faiss or .index file", path));
  }

  if (fs::is_directory(status)) {
    bool has_index = IsRegularFile(store_path / kFaissIndexFile);

    if (has_index && IsRegularFile(store_path / kDocstoreFile)) {
      return MakeDetection(StoreKind::kLinkedDocstoreFaiss, store_path);
    }
    if (IsRegularFile(store_path / kChromaMarkerFile)) {
      return MakeDetection(StoreKind::kChromaCollection, store_path);
    }
    if (has_index) {
      return MakeDetection(StoreKind::kStandaloneFaissDir, store_path);
    }
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kUnsupportedFormat,
                         "Could not detect database type. Looking for chroma.sqlite3 or index.faiss (with optional "
                         "index.pkl)",
                         path));
  }

  return utils::MakeUnexpected(
      utils::MakeError(utils::ErrorCode::kUnsupportedFormat, "Path is neither a file nor a directory", path));
}

utils::Expected<Detection, utils::Error> LocateStore(const std::string& path, int max_depth) {
  auto direct = Detect(path);
  if (direct || direct.error().code() != utils::ErrorCode::kUnsupportedFormat || max_depth <= 0) {
    return direct;
  }

  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    return direct;
  }

  // Breadth-first: (directory, depth)
  std::deque<std::pair<fs::path, int>> pending;
  pending.emplace_back(fs::path(path), 0);

  while (!pending.empty()) {
    auto [dir, depth] = pending.front();
    pending.pop_front();

    if (depth > 0) {
      auto found = Detect(dir.string());
      if (found) {
        utils::StructuredLog()
            .Event("store_located")
            .Field("root", path)
            .Field("path", found->path)
            .Field("depth", static_cast<int64_t>(depth))
            .Info();
        return found;
      }
    }

    std::vector<fs::path> subdirs;
    for (const auto& entry : SortedEntries(dir)) {
      if (fs::is_directory(entry, ec)) {
        if (entry.filename() != ".git") {
          subdirs.push_back(entry);
        }
      } else if (IsRegularFile(entry) && HasIndexSuffix(entry.filename().string())) {
        return MakeDetection(StoreKind::kStandaloneFaissFile, entry);
      }
    }

    if (depth < max_depth) {
      for (auto& subdir : subdirs) {
        pending.emplace_back(std::move(subdir), depth + 1);
      }
    }
  }

  return direct;
}

}  // namespace vecscope::store
