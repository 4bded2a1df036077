#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>

#pragma GCC diagnostic ignored "-Wunused-result"

using namespace switchboard;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
  Result<int, std::string> r = 42;
  EXPECT_TRUE(r.has_value());
  EXPECT_TRUE(static_cast<bool>(r));
  EXPECT_EQ(r.value(), 42);
  EXPECT_EQ(*r, 42);
  EXPECT_EQ(r.value_or(7), 42);
  EXPECT_THROW(r.error(), std::runtime_error);
}

TEST_F(ResultTest, HoldsError) {
  Result<int, std::string> r = Unexpected(std::string("boom"));
  EXPECT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), "boom");
  EXPECT_EQ(r.value_or(7), 7);
  EXPECT_THROW(r.value(), std::runtime_error);
}

TEST_F(ResultTest, MovesOutValue) {
  Result<std::unique_ptr<int>, std::string> r = std::make_unique<int>(5);
  auto owned = std::move(r).value();
  ASSERT_NE(owned, nullptr);
  EXPECT_EQ(*owned, 5);
}

TEST_F(ResultTest, ArrowAccess) {
  Result<std::string, int> r = std::string("switchboard");
  EXPECT_EQ(r->size(), 11u);
}

TEST_F(ResultTest, VoidSpecialization) {
  Result<void, RoutingError> ok;
  EXPECT_TRUE(ok.has_value());
  EXPECT_NO_THROW(ok.value());

  Result<void, RoutingError> failed = Unexpected(make_error(ErrorCode::Cancelled, "stopped"));
  EXPECT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().code, ErrorCode::Cancelled);
  EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST_F(ResultTest, RoutingErrorDescribeAndStatus) {
  auto err = make_error(ErrorCode::QuotaExhausted, "daily limit reached");
  EXPECT_EQ(err.describe(), "quota_exhausted: daily limit reached");
  EXPECT_EQ(http_status(ErrorCode::QuotaExhausted), 429);
  EXPECT_EQ(http_status(ErrorCode::NoEligibleProvider), 422);
  EXPECT_EQ(http_status(ErrorCode::DuplicateOutcome), 409);
  EXPECT_EQ(http_status(ErrorCode::ProviderDispatchFailed), 502);
  EXPECT_EQ(to_string(Urgency::Critical), "critical");
}
