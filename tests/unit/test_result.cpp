/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace fleet_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::NotFound, "instance not found"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "instance not found");
    EXPECT_TRUE(r.error().is(ErrorCode::NotFound));
}

TEST(ResultTest, DefaultErrorCodeIsInternal) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapAndChain) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    auto chained = r.and_then([](int v) -> Result<int> {
        if (v > 10) return Error{ErrorCode::InvalidArgument, "too large"};
        return v;
    });
    ASSERT_FALSE(chained.has_value());
    EXPECT_EQ(chained.error().code, ErrorCode::InvalidArgument);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> r = Error{ErrorCode::PersistenceFailure, "disk full"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::PersistenceFailure);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::InvalidState, "bad transition"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidState);
}

TEST(ErrorTest, Retryable) {
    EXPECT_TRUE(Error(ErrorCode::PersistenceFailure, "").retryable());
    EXPECT_TRUE(Error(ErrorCode::ResourceExhausted, "").retryable());
    EXPECT_FALSE(Error(ErrorCode::NotFound, "").retryable());
    EXPECT_FALSE(Error(ErrorCode::DeploymentFailure, "").retryable());
}

TEST(ErrorTest, InsufficientCapacityCarriesShortfall) {
    auto err = insufficient_capacity(CapacityShortfall{
        .requested_cpu = 16,
        .requested_memory_gb = 64,
        .max_cpu_available = 8,
        .max_memory_available_gb = 16,
    });
    EXPECT_EQ(err.code, ErrorCode::InsufficientCapacity);
    ASSERT_TRUE(err.shortfall.has_value());
    EXPECT_EQ(err.shortfall->max_cpu_available, 8u);
    EXPECT_EQ(err.message,
              "Requested 16 vCPU and 64 GB RAM, but max available is 8 vCPU and 16 GB RAM");
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(to_string(ErrorCode::InsufficientCapacity), "insufficient_capacity");
    EXPECT_EQ(to_string(ErrorCode::ResourceExhausted), "resource_exhausted");
    EXPECT_EQ(to_string(ErrorCode::PersistenceFailure), "persistence_failure");
}
