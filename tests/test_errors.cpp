//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed protocol errors and failure aggregation helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "dorismcp/errors/Errors.h"

using namespace dorismcp;

TEST(Errors, ProtocolErrorMapsToResponse) {
    errors::ProtocolError err(JSONRPCErrorCodes::InvalidParams, "Missing tool name");
    EXPECT_STREQ(err.what(), "Missing tool name");
    auto response = errors::makeErrorResponse(JSONRPCId{static_cast<int64_t>(4)}, err.Error());
    ASSERT_TRUE(response->IsError());
    JSONValue expected = ParseJSON(R"({"code":-32602,"message":"Missing tool name"})");
    EXPECT_EQ(response->error.value(), expected);
}

TEST(Errors, CollectorRethrowsSingleFailureUnchanged) {
    errors::FailureCollector collector;
    EXPECT_TRUE(collector.Empty());
    EXPECT_NO_THROW(collector.RethrowIfAny("nothing"));

    collector.Add(std::make_exception_ptr(std::invalid_argument("bad port")));
    collector.Add(nullptr);
    EXPECT_EQ(collector.Size(), 1u);
    EXPECT_THROW(collector.RethrowIfAny("listener failed"), std::invalid_argument);
    EXPECT_TRUE(collector.Empty());
}

TEST(Errors, CollectorAggregatesSeveralFailures) {
    errors::FailureCollector collector;
    collector.Add(std::make_exception_ptr(std::runtime_error("accept failed")));
    collector.Add(std::make_exception_ptr(std::logic_error("loop broke")));
    try {
        collector.RethrowIfAny("HTTP listener failed");
        FAIL() << "expected AggregateError";
    } catch (const errors::AggregateError& agg) {
        EXPECT_EQ(agg.Causes().size(), 2u);
        EXPECT_EQ(std::string(agg.what()), "HTTP listener failed (2 exceptions)");
    }
}

TEST(Errors, DescribeExceptionNamesType) {
    std::string described = errors::DescribeException(std::make_exception_ptr(std::out_of_range("index 7")));
    EXPECT_NE(described.find("std::out_of_range"), std::string::npos);
    EXPECT_NE(described.find("index 7"), std::string::npos);
    EXPECT_EQ(errors::DescribeException(std::make_exception_ptr(42)), "unknown exception");
    EXPECT_EQ(errors::DescribeException(nullptr), "no exception");
}

TEST(Errors, LogFailureDetailHandlesNestedGroups) {
    std::vector<std::exception_ptr> inner{std::make_exception_ptr(std::runtime_error("a")),
                                          std::make_exception_ptr(std::runtime_error("b"))};
    std::vector<std::exception_ptr> outer{
        std::make_exception_ptr(errors::AggregateError("inner", std::move(inner))),
        std::make_exception_ptr(std::runtime_error("c"))};
    auto ep = std::make_exception_ptr(errors::AggregateError("outer", std::move(outer)));
    EXPECT_NO_THROW(errors::LogFailureDetail("startup failed", ep));
    EXPECT_NO_THROW(errors::LogFailureDetail("nothing", nullptr));
}
