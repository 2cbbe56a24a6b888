/**
 * @file format_detector_test.cpp
 * @brief Unit tests for store format detection
 */

#include "store/format_detector.h"

#include <gtest/gtest.h>

#include "store/store_fixtures.h"

using namespace vecscope::store;
using vecscope::store::testing::TempDir;
using vecscope::store::testing::WriteText;
using vecscope::utils::ErrorCode;

TEST(FormatDetectorTest, MissingPath) {
  auto result = Detect("/nonexistent/vecscope/store");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kPathNotFound);
  EXPECT_EQ(result.error().message(), "Path not found: /nonexistent/vecscope/store");
}

TEST(FormatDetectorTest, IndexFileBySuffix) {
  TempDir dir;
  WriteText(dir.File("vectors.faiss"), "x");
  WriteText(dir.File("other.INDEX"), "x");

  auto faiss = Detect(dir.File("vectors.faiss"));
  ASSERT_TRUE(faiss);
  EXPECT_EQ(faiss->kind, StoreKind::kStandaloneFaissFile);
  EXPECT_EQ(faiss->index_path, dir.File("vectors.faiss"));

  auto index = Detect(dir.File("other.INDEX"));
  ASSERT_TRUE(index);
  EXPECT_EQ(index->kind, StoreKind::kStandaloneFaissFile);
}

TEST(FormatDetectorTest, UnsupportedFile) {
  TempDir dir;
  WriteText(dir.File("notes.txt"), "x");

  auto result = Detect(dir.File("notes.txt"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUnsupportedFormat);
}

TEST(FormatDetectorTest, LinkedDocstoreDirectory) {
  TempDir dir;
  WriteText(dir.File(kFaissIndexFile), "x");
  WriteText(dir.File(kDocstoreFile), "x");

  auto result = Detect(dir.path().string());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->kind, StoreKind::kLinkedDocstoreFaiss);
  EXPECT_EQ(result->index_path, dir.File(kFaissIndexFile));
  EXPECT_EQ(result->companion_path, dir.File(kDocstoreFile));
}

TEST(FormatDetectorTest, ChromaDirectory) {
  TempDir dir;
  WriteText(dir.File(kChromaMarkerFile), "x");

  auto result = Detect(dir.path().string());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->kind, StoreKind::kChromaCollection);
  EXPECT_EQ(result->companion_path, dir.File(kChromaMarkerFile));
}

TEST(FormatDetectorTest, LinkedPairWinsOverChromaMarker) {
  TempDir dir;
  WriteText(dir.File(kFaissIndexFile), "x");
  WriteText(dir.File(kDocstoreFile), "x");
  WriteText(dir.File(kChromaMarkerFile), "x");

  auto result = Detect(dir.path().string());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->kind, StoreKind::kLinkedDocstoreFaiss);
}

TEST(FormatDetectorTest, ChromaMarkerWinsOverLoneIndex) {
  TempDir dir;
  WriteText(dir.File(kFaissIndexFile), "x");
  WriteText(dir.File(kChromaMarkerFile), "x");

  auto result = Detect(dir.path().string());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->kind, StoreKind::kChromaCollection);
}

TEST(FormatDetectorTest, StandaloneIndexDirectory) {
  TempDir dir;
  WriteText(dir.File(kFaissIndexFile), "x");

  auto result = Detect(dir.path().string());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->kind, StoreKind::kStandaloneFaissDir);
  EXPECT_EQ(result->index_path, dir.File(kFaissIndexFile));
}

TEST(FormatDetectorTest, UnrecognizedDirectory) {
  TempDir dir;
  WriteText(dir.File("readme.md"), "x");

  auto result = Detect(dir.path().string());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kUnsupportedFormat);
}

TEST(FormatDetectorTest, LocateStoreFindsNestedStore) {
  TempDir dir;
  std::string nested = dir.Subdir("project/db");
  WriteText(nested + "/" + kChromaMarkerFile, "x");

  // Depth 0 only looks at the path itself
  auto shallow = LocateStore(dir.path().string(), 0);
  ASSERT_FALSE(shallow);
  EXPECT_EQ(shallow.error().code(), ErrorCode::kUnsupportedFormat);

  auto too_shallow = LocateStore(dir.path().string(), 1);
  ASSERT_FALSE(too_shallow);

  auto found = LocateStore(dir.path().string(), 2);
  ASSERT_TRUE(found) << found.error().to_string();
  EXPECT_EQ(found->kind, StoreKind::kChromaCollection);
  EXPECT_EQ(found->path, nested);
}

TEST(FormatDetectorTest, LocateStoreFindsLooseIndexFile) {
  TempDir dir;
  WriteText(dir.File("embeddings.index"), "x");

  auto found = LocateStore(dir.path().string(), 1);
  ASSERT_TRUE(found);
  EXPECT_EQ(found->kind, StoreKind::kStandaloneFaissFile);
  EXPECT_EQ(found->index_path, dir.File("embeddings.index"));
}

TEST(FormatDetectorTest, KindNames) {
  EXPECT_STREQ(StoreKindToString(StoreKind::kLinkedDocstoreFaiss), "linked_docstore_faiss");
  EXPECT_STREQ(StoreKindToType(StoreKind::kChromaCollection), "chroma");
  EXPECT_STREQ(StoreKindToType(StoreKind::kStandaloneFaissDir), "faiss");
  EXPECT_TRUE(HasIndexSuffix("a.Faiss"));
  EXPECT_FALSE(HasIndexSuffix("faiss"));
}
