/**
 * @file faiss_index_file_test.cpp
 * @brief Unit tests for FAISS index loading and reconstruction
 */

#include "store/faiss_index_file.h"

#include <faiss/impl/FaissAssert.h>
#include <gtest/gtest.h>

#include <memory>

#include "store/standalone_index_reader.h"
#include "store/store_fixtures.h"

using namespace vecscope::store;
using namespace vecscope::store::testing;
using vecscope::utils::ErrorCode;

namespace {

const std::vector<std::vector<float>> kRows = {{1.0F, 2.0F, 3.0F}, {4.0F, 5.0F, 6.0F}, {7.0F, 8.0F, 9.0F}};

// Flat index whose reconstruct() is unavailable, like codec-less index types
struct NoReconstructIndex : faiss::IndexFlatL2 {
  using faiss::IndexFlatL2::IndexFlatL2;

  void reconstruct(faiss::idx_t /*key*/, float* /*recons*/) const override {
    FAISS_THROW_MSG("reconstruct not implemented for this type of index");
  }
};

// Flat index that fails from row 2 onwards
struct FailingTailIndex : faiss::IndexFlatL2 {
  using faiss::IndexFlatL2::IndexFlatL2;

  void reconstruct(faiss::idx_t key, float* recons) const override {
    if (key >= 2) {
      FAISS_THROW_MSG("row unavailable");
    }
    faiss::IndexFlatL2::reconstruct(key, recons);
  }
};

template <typename IndexT>
FaissIndexFile WrapRows(const std::vector<std::vector<float>>& rows) {
  auto index = std::make_unique<IndexT>(static_cast<faiss::idx_t>(rows.front().size()));
  std::vector<float> flat = Flatten(rows);
  index->add(static_cast<faiss::idx_t>(rows.size()), flat.data());
  return FaissIndexFile(std::move(index));
}

}  // namespace

TEST(FaissIndexFileTest, FlatIndexHeaderAndVectors) {
  TempDir dir;
  WriteFlatIndex(dir.File("flat.faiss"), 3, kRows);

  auto index = FaissIndexFile::Open(dir.File("flat.faiss"));
  ASSERT_TRUE(index) << index.error().to_string();
  EXPECT_EQ(index->dimension(), 3U);
  EXPECT_EQ(index->ntotal(), 3);
  EXPECT_EQ(index->MetricName(), "l2");

  std::vector<std::vector<float>> vectors;
  auto report = index->Reconstruct(2, vectors);
  EXPECT_TRUE(report.supported);
  EXPECT_EQ(report.reconstructed, 2U);
  ASSERT_EQ(vectors.size(), 2U);
  EXPECT_EQ(vectors[0], kRows[0]);
  EXPECT_EQ(vectors[1], kRows[1]);
}

TEST(FaissIndexFileTest, InnerProductIndex) {
  TempDir dir;
  WriteFlatIndex(dir.File("ip.faiss"), 3, kRows, true);

  auto index = FaissIndexFile::Open(dir.File("ip.faiss"));
  ASSERT_TRUE(index) << index.error().to_string();
  EXPECT_EQ(index->MetricName(), "inner_product");

  std::vector<std::vector<float>> vectors;
  EXPECT_EQ(index->Reconstruct(3, vectors).reconstructed, 3U);
  EXPECT_EQ(vectors[2], kRows[2]);
}

TEST(FaissIndexFileTest, IdMapReadsByPosition) {
  TempDir dir;
  WriteIdMapIndex(dir.File("idmap.faiss"), 3, kRows, {100, 200, 300});

  auto index = FaissIndexFile::Open(dir.File("idmap.faiss"));
  ASSERT_TRUE(index) << index.error().to_string();

  std::vector<std::vector<float>> vectors;
  auto report = index->Reconstruct(3, vectors);
  EXPECT_TRUE(report.supported);
  EXPECT_EQ(report.reconstructed, 3U);
  EXPECT_EQ(vectors[0], kRows[0]);
  EXPECT_EQ(vectors[1], kRows[1]);
}

TEST(FaissIndexFileTest, HnswFlatIndex) {
  TempDir dir;
  WriteHnswFlatIndex(dir.File("hnsw.faiss"), 3, kRows);

  auto index = FaissIndexFile::Open(dir.File("hnsw.faiss"));
  ASSERT_TRUE(index) << index.error().to_string();

  std::vector<std::vector<float>> vectors;
  EXPECT_EQ(index->Reconstruct(3, vectors).reconstructed, 3U);
  EXPECT_EQ(vectors[2], kRows[2]);
}

TEST(FaissIndexFileTest, ScalarQuantizerIndexReconstructs) {
  TempDir dir;
  WriteScalarQuantizerIndex(dir.File("sq.faiss"), 3, kRows);

  auto contents = ReadFaissVectors(dir.File("sq.faiss"), 10);
  ASSERT_TRUE(contents) << contents.error().to_string();
  EXPECT_TRUE(contents->facts.reconstructible);
  ASSERT_EQ(contents->vectors.size(), 3U);
  for (size_t i = 0; i < kRows.size(); ++i) {
    for (size_t j = 0; j < kRows[i].size(); ++j) {
      EXPECT_NEAR(contents->vectors[i][j], kRows[i][j], 1e-3) << i << "," << j;
    }
  }
}

TEST(FaissIndexFileTest, IvfIndexReconstructsAfterLoad) {
  TempDir dir;
  WriteIvfFlatIndex(dir.File("ivf.faiss"), 3, kRows);

  auto contents = ReadFaissVectors(dir.File("ivf.faiss"), 10);
  ASSERT_TRUE(contents) << contents.error().to_string();
  EXPECT_TRUE(contents->facts.reconstructible);
  EXPECT_EQ(contents->facts.total, 3U);
  ASSERT_EQ(contents->vectors.size(), 3U);
  EXPECT_EQ(contents->vectors[1], kRows[1]);
}

TEST(FaissIndexFileTest, UnsupportedReconstructionYieldsZeroVectors) {
  FaissIndexFile index = WrapRows<NoReconstructIndex>(kRows);

  std::vector<std::vector<float>> vectors;
  auto report = index.Reconstruct(3, vectors);
  EXPECT_FALSE(report.supported);
  EXPECT_EQ(report.reconstructed, 0U);
  EXPECT_NE(report.error.find("not implemented"), std::string::npos);
  ASSERT_EQ(vectors.size(), 3U);
  for (const auto& vector : vectors) {
    EXPECT_EQ(vector, std::vector<float>(3, 0.0F));
  }
}

TEST(FaissIndexFileTest, FailedRowsStayZero) {
  FaissIndexFile index = WrapRows<FailingTailIndex>(kRows);

  std::vector<std::vector<float>> vectors;
  auto report = index.Reconstruct(3, vectors);
  EXPECT_TRUE(report.supported);
  EXPECT_EQ(report.reconstructed, 2U);
  EXPECT_EQ(report.error, "row unavailable");
  EXPECT_EQ(vectors[1], kRows[1]);
  EXPECT_EQ(vectors[2], std::vector<float>(3, 0.0F));
}

TEST(FaissIndexFileTest, CountBeyondTotalIsZeroPadded) {
  FaissIndexFile index = WrapRows<faiss::IndexFlatL2>({kRows[0]});

  std::vector<std::vector<float>> vectors;
  auto report = index.Reconstruct(2, vectors);
  EXPECT_EQ(report.reconstructed, 1U);
  ASSERT_EQ(vectors.size(), 2U);
  EXPECT_EQ(vectors[1], std::vector<float>(3, 0.0F));
}

TEST(FaissIndexFileTest, MissingFile) {
  auto index = FaissIndexFile::Open("/nonexistent/index.faiss");
  ASSERT_FALSE(index);
  EXPECT_EQ(index.error().code(), ErrorCode::kPathNotFound);
}

TEST(FaissIndexFileTest, GarbageFileIsCorrupt) {
  TempDir dir;
  WriteText(dir.File("bad.faiss"), "this is not a faiss index");

  auto index = FaissIndexFile::Open(dir.File("bad.faiss"));
  ASSERT_FALSE(index);
  EXPECT_EQ(index.error().code(), ErrorCode::kCorruptIndex);
  EXPECT_EQ(index.error().message(), "Failed to load FAISS index");
  EXPECT_FALSE(index.error().context().empty());
}

TEST(FaissIndexFileTest, EmptyFileIsCorrupt) {
  TempDir dir;
  WriteText(dir.File("empty.faiss"), "");

  auto index = FaissIndexFile::Open(dir.File("empty.faiss"));
  ASSERT_FALSE(index);
  EXPECT_EQ(index.error().code(), ErrorCode::kCorruptIndex);
}

TEST(FaissIndexFileTest, TruncatedFileIsCorrupt) {
  TempDir dir;
  WriteFlatIndex(dir.File("full.faiss"), 3, kRows);
  std::filesystem::resize_file(dir.File("full.faiss"), std::filesystem::file_size(dir.File("full.faiss")) - 8);

  auto index = FaissIndexFile::Open(dir.File("full.faiss"));
  ASSERT_FALSE(index);
  EXPECT_EQ(index.error().code(), ErrorCode::kCorruptIndex);
}
