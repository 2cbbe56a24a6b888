/**
 * @file expected_test.cpp
 * @brief Unit tests for Expected<T, E> class
 */

#include "utils/expected.h"

#include <gtest/gtest.h>

#include <string>

#include "utils/error.h"

using namespace vecscope::utils;

// ========== Test Expected<T, E> with value ==========

TEST(ExpectedTest, DefaultConstructor) {
  Expected<int, Error> result;
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 0);  // Default-constructed int is 0
}

TEST(ExpectedTest, ValueConstructor) {
  Expected<int, Error> result(42);
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(result.value(), 42);
}

TEST(ExpectedTest, ErrorConstructor) {
  auto error = MakeError(ErrorCode::kInvalidArgument, "Test error");
  Expected<int, Error> result(MakeUnexpected(error));
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(result.error().message(), "Test error");
}

TEST(ExpectedTest, BoolConversion) {
  Expected<int, Error> success(42);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_TRUE(static_cast<bool>(success));
  EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ExpectedTest, ValueAccess) {
  Expected<std::string, Error> result("Hello");
  EXPECT_EQ(result.value(), "Hello");
  EXPECT_EQ(*result, "Hello");
  EXPECT_EQ(result->length(), 5);
}

TEST(ExpectedTest, ValueAccessThrows) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  EXPECT_THROW({ (void)result.value(); }, BadExpectedAccess<Error>);
}

TEST(ExpectedTest, ErrorAccess) {
  auto error = MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index");
  Expected<int, Error> result(MakeUnexpected(error));

  EXPECT_EQ(result.error().code(), ErrorCode::kCorruptIndex);
  EXPECT_EQ(result.error().message(), "Failed to load FAISS index");
}

TEST(ExpectedTest, ValueOr) {
  Expected<int, Error> success(42);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_EQ(success.value_or(0), 42);
  EXPECT_EQ(failure.value_or(99), 99);
}

// ========== Test Expected<void, E> ==========

TEST(ExpectedVoidTest, DefaultConstructor) {
  Expected<void, Error> result;
  EXPECT_TRUE(result.has_value());
}

TEST(ExpectedVoidTest, ErrorConstructor) {
  auto error = MakeError(ErrorCode::kInvalidArgument);
  Expected<void, Error> result(MakeUnexpected(error));
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedVoidTest, ValueAccess) {
  Expected<void, Error> success;
  EXPECT_NO_THROW(success.value());

  Expected<void, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));
  EXPECT_THROW(failure.value(), BadExpectedAccess<Error>);
}

// ========== Test monadic operations ==========

TEST(ExpectedTest, Transform) {
  Expected<int, Error> result(42);

  auto doubled = result.transform([](int x) { return x * 2; });
  EXPECT_TRUE(doubled.has_value());
  EXPECT_EQ(*doubled, 84);

  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kUnknown)));
  auto transformed = error.transform([](int x) { return x * 2; });
  EXPECT_FALSE(transformed.has_value());
}

TEST(ExpectedTest, AndThen) {
  auto divide = [](int a, int b) -> Expected<int, Error> {
    if (b == 0) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Division by zero"));
    }
    return a / b;
  };

  Expected<int, Error> numerator(10);

  auto result = numerator.and_then([&](int a) { return divide(a, 2); });
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 5);

  auto error_result = numerator.and_then([&](int a) { return divide(a, 0); });
  EXPECT_FALSE(error_result.has_value());
  EXPECT_EQ(error_result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedTest, OrElse) {
  auto recover = [](const Error& err) -> Expected<int, Error> {
    if (err.code() == ErrorCode::kNotFound) {
      return 0;  // Return default value
    }
    return MakeUnexpected(err);  // Propagate other errors
  };

  Expected<int, Error> not_found(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  auto recovered = not_found.or_else(recover);
  EXPECT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 0);

  Expected<int, Error> other_error(MakeUnexpected(MakeError(ErrorCode::kUnsupportedFormat)));
  auto not_recovered = other_error.or_else(recover);
  EXPECT_FALSE(not_recovered.has_value());
  EXPECT_EQ(not_recovered.error().code(), ErrorCode::kUnsupportedFormat);
}

TEST(ExpectedTest, TransformError) {
  auto add_context = [](const Error& err) { return MakeError(err.code(), err.message(), "Additional context"); };

  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Failed to load FAISS index")));
  auto with_context = error.transform_error(add_context);

  EXPECT_FALSE(with_context.has_value());
  EXPECT_EQ(with_context.error().code(), ErrorCode::kCorruptIndex);
  EXPECT_EQ(with_context.error().context(), "Additional context");
}

// ========== Test practical use cases ==========

// Simulated store lookup
Expected<std::string, Error> OpenStore(const std::string& path) {
  if (path.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Empty path"));
  }
  if (path == "/nonexistent") {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "Path not found: " + path));
  }
  return std::string("faiss");
}

TEST(ExpectedTest, StoreLookupExample) {
  auto kind = OpenStore("/data/index.faiss");
  EXPECT_TRUE(kind.has_value());
  EXPECT_EQ(*kind, "faiss");

  auto not_found = OpenStore("/nonexistent");
  EXPECT_FALSE(not_found.has_value());
  EXPECT_EQ(not_found.error().code(), ErrorCode::kPathNotFound);

  auto invalid = OpenStore("");
  EXPECT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().code(), ErrorCode::kInvalidArgument);
}

// Simulated header read
Expected<int, Error> ReadDimension(const std::string& fourcc) {
  if (fourcc.size() != 4) {
    return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "Truncated index header"));
  }
  if (fourcc == "IxF2") {
    return 384;
  }
  return MakeUnexpected(MakeError(ErrorCode::kCorruptIndex, "index type not recognized", fourcc));
}

TEST(ExpectedTest, HeaderReadExample) {
  auto dimension = ReadDimension("IxF2");
  EXPECT_TRUE(dimension.has_value());
  EXPECT_EQ(*dimension, 384);

  auto unknown = ReadDimension("ZZZZ");
  EXPECT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code(), ErrorCode::kCorruptIndex);
  EXPECT_EQ(unknown.error().context(), "ZZZZ");
}

// Chaining operations
Expected<std::string, Error> DescribeIndex(const std::string& fourcc) {
  return ReadDimension(fourcc).transform([&](int dim) { return fourcc + " d=" + std::to_string(dim); });
}

TEST(ExpectedTest, ChainingExample) {
  auto info = DescribeIndex("IxF2");
  EXPECT_TRUE(info.has_value());
  EXPECT_EQ(*info, "IxF2 d=384");

  auto error = DescribeIndex("bad");
  EXPECT_FALSE(error.has_value());
  EXPECT_EQ(error.error().code(), ErrorCode::kCorruptIndex);
}

TEST(ErrorTest, ToStringIncludesNameAndContext) {
  auto error = MakeError(ErrorCode::kNoCollections, "No collections found in Chroma database");
  EXPECT_EQ(error.to_string(), "[NoCollections] No collections found in Chroma database");

  auto with_context = MakeError(ErrorCode::kPathNotFound, "Path not found", "/tmp/x");
  EXPECT_EQ(with_context.to_string(), "[PathNotFound] Path not found (/tmp/x)");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kNotFound), "NotFound");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kInternalError), "InternalError");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kConfigValidationError), "ConfigValidationError");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kUnsupportedFormat), "UnsupportedFormat");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kDependencyMissing), "DependencyMissing");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kPartialReconstruction), "PartialReconstructionWarning");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kNetworkBindFailed), "NetworkBindFailed");

  // Numeric values are stable
  EXPECT_EQ(static_cast<int>(ErrorCode::kInternalError), 6);
  EXPECT_EQ(static_cast<int>(ErrorCode::kCorruptIndex), 2003);
}

// ========== Test BadExpectedAccess exception ==========

TEST(ExpectedTest, BadExpectedAccessException) {
  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kMetadataParseFailure, "Unreadable sidecar")));

  try {
    int value = error.value();
    FAIL() << "Expected BadExpectedAccess exception, got value: " << value;
  } catch (const BadExpectedAccess<Error>& e) {
    EXPECT_EQ(e.error().code(), ErrorCode::kMetadataParseFailure);
    EXPECT_STREQ(e.what(), "Bad Expected access: contains error");
  }
}
