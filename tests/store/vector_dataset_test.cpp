/**
 * @file vector_dataset_test.cpp
 * @brief Unit tests for dataset serialization
 */

#include "store/vector_dataset.h"

#include <gtest/gtest.h>

using namespace vecscope::store;
using json = nlohmann::json;

namespace {

VectorDataset SampleDataset() {
  VectorDataset dataset;
  dataset.type = "faiss";
  dataset.count = 2;
  dataset.dimension = 2;
  dataset.total_vectors = 5;

  VectorRecord first;
  first.id = "chunk_0000";
  first.vector = {0.5F, -1.0F};
  first.text = "plain";
  first.source = "a.txt";
  dataset.vectors.push_back(first);

  VectorRecord second;
  second.id = "chunk_0001";
  second.vector = {1.0F, 2.0F};
  second.text = "has, comma and \"quotes\"";
  second.metadata = {{"page", 2}};
  dataset.vectors.push_back(second);
  return dataset;
}

}  // namespace

TEST(VectorDatasetTest, PositionalIdFormat) {
  EXPECT_EQ(FormatPositionalId(0), "chunk_0000");
  EXPECT_EQ(FormatPositionalId(42), "chunk_0042");
  EXPECT_EQ(FormatPositionalId(12345), "chunk_12345");
}

TEST(VectorDatasetTest, JsonPayload) {
  json payload = ToJson(SampleDataset());

  EXPECT_EQ(payload["type"], "faiss");
  EXPECT_EQ(payload["count"], 2);
  EXPECT_EQ(payload["dimension"], 2);
  EXPECT_EQ(payload["total_vectors"], 5);
  EXPECT_FALSE(payload.contains("collection_name"));
  ASSERT_EQ(payload["vectors"].size(), 2U);

  const json& first = payload["vectors"][0];
  EXPECT_EQ(first["id"], "chunk_0000");
  EXPECT_EQ(first["text"], "plain");
  EXPECT_EQ(first["source"], "a.txt");
  EXPECT_DOUBLE_EQ(first["vector"][1].get<double>(), -1.0);
  EXPECT_TRUE(first["metadata"].is_object());
  EXPECT_TRUE(first["metadata"].empty());
  EXPECT_EQ(payload["vectors"][1]["metadata"]["page"], 2);
}

TEST(VectorDatasetTest, JsonPayloadCollectionName) {
  VectorDataset dataset;
  dataset.type = "chroma";
  dataset.collection_name = "docs";

  json payload = ToJson(dataset);
  EXPECT_EQ(payload["collection_name"], "docs");
  EXPECT_EQ(payload["count"], 0);
  EXPECT_TRUE(payload["vectors"].is_array());
  EXPECT_TRUE(payload["vectors"].empty());
}

TEST(VectorDatasetTest, CsvExport) {
  std::string csv = ToCsv(SampleDataset());

  EXPECT_EQ(csv.find("id,text,source,vector,dimension,metadata\r\n"), 0U);
  EXPECT_NE(csv.find("chunk_0000,plain,a.txt,\"[0.5,-1.0]\",2,{}\r\n"), std::string::npos);
  EXPECT_NE(csv.find("chunk_0001,\"has, comma and \"\"quotes\"\"\",,\"[1.0,2.0]\",2,\"{\"\"page\"\":2}\"\r\n"),
            std::string::npos);
}

TEST(VectorDatasetTest, DumpReplacesInvalidUtf8) {
  VectorDataset dataset = SampleDataset();
  dataset.vectors[0].text = "caf\xE9";
  dataset.vectors[0].metadata = json{{"title", "men\xFC"}};

  std::string compact;
  ASSERT_NO_THROW(compact = DumpJson(ToJson(dataset)));
  json parsed = json::parse(compact);
  EXPECT_EQ(parsed["vectors"][0]["text"], "caf\xEF\xBF\xBD");
  EXPECT_EQ(parsed["vectors"][0]["metadata"]["title"], "men\xEF\xBF\xBD");

  std::string pretty = DumpJson(ToJson(dataset), 2);
  EXPECT_NE(pretty.find("\n  \"count\""), std::string::npos);
  EXPECT_EQ(json::parse(pretty), parsed);
}
