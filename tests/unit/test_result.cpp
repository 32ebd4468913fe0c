/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the ErrorKind taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace model_mesh;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorCarriesKind) {
    Result<int> r = Error{"checksum mismatch", ErrorKind::IntegrityFailure};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "checksum mismatch");
    EXPECT_EQ(r.error().kind, ErrorKind::IntegrityFailure);
}

TEST(ResultTest, DefaultKindIsInternal) {
    Error e{"boom"};
    EXPECT_EQ(e.kind, ErrorKind::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPreservesErrorKind) {
    Result<int> r = Error{"offline", ErrorKind::TransientTransport};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().kind, ErrorKind::TransientTransport);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v < 0) return Error{"negative", ErrorKind::InvalidInput};
        return std::to_string(v + 1);
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "21");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> denied = Error{"license expired", ErrorKind::LicenseDenied};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ(denied.error().kind, ErrorKind::LicenseDenied);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>("no capacity", ErrorKind::CapacityUnavailable);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::CapacityUnavailable);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::InvalidInput), "invalid_input");
    EXPECT_EQ(to_string(ErrorKind::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorKind::CapacityUnavailable), "capacity_unavailable");
}
