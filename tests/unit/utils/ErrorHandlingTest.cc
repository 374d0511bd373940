#include "strata/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <string>
#include <type_traits>
#include <vector>

class ErrorHandlingTest : public ::testing::Test {};

TEST_F(ErrorHandlingTest, ExceptionCarriesMessageAndCode) {
  strata::StrataException plain("bad binding");
  EXPECT_STREQ("bad binding", plain.what());
  EXPECT_EQ(plain.code(), strata::ErrorCode::InvalidState);

  strata::StrataException coded("block id 9", strata::ErrorCode::OutOfRange);
  EXPECT_EQ(coded.code(), strata::ErrorCode::OutOfRange);
}

TEST_F(ErrorHandlingTest, ThrowErrorKeepsCode) {
  try {
    strata::throwError(strata::ErrorCode::NotFound, "instance 4 missing");
    FAIL() << "Expected StrataException";
  } catch (const strata::StrataException &e) {
    EXPECT_STREQ("instance 4 missing", e.what());
    EXPECT_EQ(e.code(), strata::ErrorCode::NotFound);
  }

  EXPECT_THROW(strata::throwError("pool stopped"), strata::StrataException);
}

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::Ok), "Ok");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::InvalidState), "InvalidState");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::AlreadyExists), "AlreadyExists");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::ResourceExhausted), "ResourceExhausted");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::TypeMismatch), "TypeMismatch");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::OutOfRange), "OutOfRange");
  EXPECT_EQ(strata::errorCodeToString(strata::ErrorCode::ParseError), "ParseError");
}

// Result<T>

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = strata::Result<float>::ok(0.5f);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), strata::ErrorCode::Ok);
  EXPECT_FLOAT_EQ(r.value(), 0.5f);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = strata::Result<float>::error(strata::ErrorCode::OutOfRange, "material.metallic must be within [0, 1]");
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), strata::ErrorCode::OutOfRange);
  EXPECT_EQ(r.message(), "material.metallic must be within [0, 1]");
  EXPECT_FLOAT_EQ(r.valueOr(1.0f), 1.0f);
}

TEST_F(ErrorHandlingTest, ValueOnErrorThrowsWithSameCode) {
  auto r = strata::Result<int>::error(strata::ErrorCode::TypeMismatch, "not an integer");
  try {
    (void)r.value();
    FAIL() << "Expected StrataException";
  } catch (const strata::StrataException &e) {
    EXPECT_EQ(e.code(), strata::ErrorCode::TypeMismatch);
    EXPECT_NE(std::string(e.what()).find("not an integer"), std::string::npos);
  }
}

TEST_F(ErrorHandlingTest, ErrorFromCrossesTypes) {
  auto inner = strata::Result<std::vector<double>>::error(strata::ErrorCode::NotFound, "color not found");
  auto outer = strata::Result<int>::errorFrom(inner);
  EXPECT_EQ(outer.code(), strata::ErrorCode::NotFound);
  EXPECT_EQ(outer.message(), "color not found");

  auto asVoid = strata::Result<void>::errorFrom(outer);
  EXPECT_EQ(asVoid.code(), strata::ErrorCode::NotFound);
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = strata::Result<std::vector<uint32_t>>::ok({0x07694285u, 0u, 1u});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
  EXPECT_FALSE(std::is_copy_constructible_v<strata::Result<int>>);
}

// Result<void>

TEST_F(ErrorHandlingTest, ResultVoidCheck) {
  auto ok = strata::Result<void>::ok();
  EXPECT_TRUE(ok.isOk());
  EXPECT_NO_THROW(ok.check());

  auto dup = strata::Result<void>::error(strata::ErrorCode::AlreadyExists, "block 'stone' already registered");
  EXPECT_EQ(dup.code(), strata::ErrorCode::AlreadyExists);
  EXPECT_THROW(dup.check(), strata::StrataException);
}
