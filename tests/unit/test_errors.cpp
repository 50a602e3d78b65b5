#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace dnsaudit::common;

TEST(ErrorsTest, AppErrorCarriesExitCodeAndCode) {
  AppError err(1, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iExitCode, 1);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ConfigErrorExitsWith2) {
  ConfigError err("conflicting_sources", "Two sources");
  EXPECT_EQ(err._iExitCode, 2);
  EXPECT_EQ(err._sErrorCode, "conflicting_sources");
}

TEST(ErrorsTest, ValidationErrorExitsWith2) {
  ValidationError err("invalid_type", "Unknown record type: PTR");
  EXPECT_EQ(err._iExitCode, 2);
}

TEST(ErrorsTest, ProviderErrorExitsWith3) {
  ProviderError err("no_records", "Nothing for contoso.com");
  EXPECT_EQ(err._iExitCode, 3);
}

TEST(ErrorsTest, QueryErrorExitsWith4) {
  QueryError err("malformed_response", "Truncated answer");
  EXPECT_EQ(err._iExitCode, 4);
}

TEST(ErrorsTest, AllErrorsInheritFromAppError) {
  EXPECT_THROW(throw ConfigError("x", "y"), AppError);
  EXPECT_THROW(throw ValidationError("x", "y"), AppError);
  EXPECT_THROW(throw ProviderError("x", "y"), AppError);
  EXPECT_THROW(throw QueryError("x", "y"), AppError);
}

TEST(ErrorsTest, AllErrorsInheritFromRuntimeError) {
  EXPECT_THROW(throw ConfigError("x", "y"), std::runtime_error);
  EXPECT_THROW(throw QueryError("x", "y"), std::runtime_error);
}
