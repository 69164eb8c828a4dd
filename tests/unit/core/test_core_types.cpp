/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and transfer status
 */

#include <gtest/gtest.h>

#include <kcenon/blob_upload/core/transfer_status.h>
#include <kcenon/blob_upload/core/types.h>

#include <memory>
#include <string>

namespace kcenon::blob_upload::test {

class CoreTypesTest : public ::testing::Test {};

// Error codes

TEST_F(CoreTypesTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::source_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_size), -120);
    EXPECT_EQ(static_cast<int>(error_code::missing_destination), -142);
    EXPECT_EQ(static_cast<int>(error_code::remote_error), -160);
    EXPECT_EQ(static_cast<int>(error_code::transfer_cancelled), -200);
    EXPECT_EQ(static_cast<int>(error_code::internal_consistency), -221);
}

TEST_F(CoreTypesTest, ErrorCodeToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::blob_not_found), "blob not found");
    EXPECT_STREQ(to_string(error_code::internal_consistency), "internal consistency fault");
}

TEST_F(CoreTypesTest, StatusCodeMapping) {
    EXPECT_EQ(error_code_from_status(403), error_code::remote_auth_failed);
    EXPECT_EQ(error_code_from_status(404), error_code::blob_not_found);
    EXPECT_EQ(error_code_from_status(409), error_code::blob_already_exists);
    EXPECT_EQ(error_code_from_status(429), error_code::remote_throttled);
    EXPECT_EQ(error_code_from_status(503), error_code::remote_unavailable);
    EXPECT_EQ(error_code_from_status(500), error_code::remote_error);
}

TEST_F(CoreTypesTest, ErrorKeepsStatusCode) {
    error err{error_code::remote_error, "boom", 500};
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.status_code, 500);
    EXPECT_FALSE(err.is_not_found());

    error missing{error_code::remote_error, "gone", 404};
    EXPECT_TRUE(missing.is_not_found());

    error default_constructed;
    EXPECT_FALSE(static_cast<bool>(default_constructed));
}

TEST_F(CoreTypesTest, ExplicitErrorUsesCodeDescription) {
    error err{error_code::pool_stopped};
    EXPECT_EQ(err.message, "worker pool stopped");
    EXPECT_EQ(err.status_code, 0);
}

// result

TEST_F(CoreTypesTest, ResultHoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(CoreTypesTest, ResultHoldsError) {
    result<int> r = unexpected{error{error_code::source_not_found, "missing"}};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::source_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(CoreTypesTest, ResultOfMoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r);
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 7);
}

TEST_F(CoreTypesTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok);

    result<void> failed = unexpected{error{error_code::remote_error, "x", 503}};
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().status_code, 503);
}

// transfer_status

TEST_F(CoreTypesTest, FailureVariants) {
    EXPECT_FALSE(is_failure(transfer_status::in_progress));
    EXPECT_FALSE(is_failure(transfer_status::success));
    EXPECT_TRUE(is_failure(transfer_status::failed));
    EXPECT_TRUE(is_failure(transfer_status::blob_already_exists));
    EXPECT_TRUE(is_failure(transfer_status::tier_set_failure));
    EXPECT_TRUE(is_failure(transfer_status::cancelled));
}

TEST_F(CoreTypesTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(transfer_status::in_progress));
    EXPECT_TRUE(is_terminal(transfer_status::success));
    EXPECT_TRUE(is_terminal(transfer_status::cancelled));
}

TEST_F(CoreTypesTest, StatusNames) {
    EXPECT_EQ(to_string(transfer_status::in_progress), "InProgress");
    EXPECT_EQ(to_string(transfer_status::blob_already_exists), "BlobAlreadyExists");
    EXPECT_EQ(to_string(transfer_status::tier_set_failure), "TierSetFailure");
}

}  // namespace kcenon::blob_upload::test
