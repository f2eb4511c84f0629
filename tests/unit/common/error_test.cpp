/// @file error_test.cpp
/// @brief Tests for error code mapping

#include <gtest/gtest.h>

#include "common/error.h"

namespace promptguard {
namespace {

TEST(ErrorTest, ProjectCodesMapToAbsl) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kValidationError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kPatternCompileError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(ToAbslCode(ErrorCode::kPayloadTooLarge), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
}

TEST(ErrorTest, MakeErrorKeepsMessage) {
    auto status = ValidationError("Input text is required");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "Input text is required");

    auto config = ConfigurationError("bad port");
    EXPECT_EQ(config.code(), absl::StatusCode::kFailedPrecondition);
}

TEST(ErrorTest, HttpStatusMapping) {
    EXPECT_EQ(HttpStatusFromStatus(absl::OkStatus()), 200);
    EXPECT_EQ(HttpStatusFromStatus(ValidationError("x")), 400);
    EXPECT_EQ(HttpStatusFromStatus(ConfigurationError("x")), 400);
    EXPECT_EQ(HttpStatusFromStatus(absl::NotFoundError("x")), 404);
    EXPECT_EQ(HttpStatusFromStatus(MakeError(ErrorCode::kPayloadTooLarge, "x")), 413);
    EXPECT_EQ(HttpStatusFromStatus(InternalError("x")), 500);
    EXPECT_EQ(HttpStatusFromStatus(absl::UnavailableError("x")), 500);
}

}  // namespace
}  // namespace promptguard
