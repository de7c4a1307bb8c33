#include "ledge/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <stdexcept>
#include <string>
#include <vector>

// Test fixture for ErrorHandling tests
class ErrorHandlingTest : public ::testing::Test {};

// Test LedgeException construction
TEST_F(ErrorHandlingTest, TestLedgeExceptionConstruction) {
  ledge::LedgeException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
}

// Test throwError function
TEST_F(ErrorHandlingTest, TestThrowError) {
  try {
    ledge::throwError("Test error message");
    FAIL() << "Expected LedgeException";
  } catch (const ledge::LedgeException &e) {
    ASSERT_STREQ("Test error message", e.what());
  } catch (const std::exception &e) {
    FAIL() << "Expected LedgeException, got " << e.what();
  }
}

TEST_F(ErrorHandlingTest, LedgeExceptionIsStdException) {
  EXPECT_THROW(ledge::throwError("boom"), std::exception);
}

// ErrorCode tests

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::Ok), "Ok");
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::InvalidArgument), "InvalidArgument");
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::InvalidState), "InvalidState");
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::ParseError), "ParseError");
  EXPECT_EQ(ledge::errorCodeToString(ledge::ErrorCode::Internal), "Internal");
}

// Result<T> tests

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = ledge::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), ledge::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = ledge::Result<int>::error(ledge::ErrorCode::NotFound, "missing");
  EXPECT_FALSE(r.isOk());
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), ledge::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsOnError) {
  auto r = ledge::Result<int>::error(ledge::ErrorCode::Internal, "broken");
  EXPECT_THROW(r.value(), ledge::LedgeException);
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = ledge::Result<int>::ok(10);
  EXPECT_EQ(ok.valueOr(99), 10);

  auto err = ledge::Result<int>::error(ledge::ErrorCode::ParseError);
  EXPECT_EQ(err.valueOr(99), 99);
}

TEST_F(ErrorHandlingTest, ResultForwardKeepsError) {
  auto err = ledge::Result<int>::error(ledge::ErrorCode::InvalidState, "bad type");
  auto forwarded = err.forward<std::string>();
  EXPECT_TRUE(forwarded.isError());
  EXPECT_EQ(forwarded.code(), ledge::ErrorCode::InvalidState);
  EXPECT_EQ(forwarded.message(), "bad type");
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = ledge::Result<std::vector<int>>::ok({1, 2, 3});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
}

// Result<void> tests

TEST_F(ErrorHandlingTest, ResultVoidOk) {
  auto r = ledge::Result<void>::ok();
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), ledge::ErrorCode::Ok);
}

TEST_F(ErrorHandlingTest, ResultVoidError) {
  auto r = ledge::Result<void>::error(ledge::ErrorCode::InvalidArgument, "nope");
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), ledge::ErrorCode::InvalidArgument);
  EXPECT_EQ(r.message(), "nope");
}

TEST_F(ErrorHandlingTest, ResultVoidForwardKeepsError) {
  auto r = ledge::Result<void>::error(ledge::ErrorCode::NotFound, "no file");
  auto forwarded = r.forward<int>();
  EXPECT_TRUE(forwarded.isError());
  EXPECT_EQ(forwarded.code(), ledge::ErrorCode::NotFound);
  EXPECT_EQ(forwarded.message(), "no file");
  EXPECT_EQ(forwarded.valueOr(7), 7);
}
