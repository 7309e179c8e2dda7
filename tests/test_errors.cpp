//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "guidemcp/JSONRPCTypes.h"
#include "guidemcp/errors/Errors.h"

using namespace guidemcp;

TEST(Errors, CategoryMapping) {
    using guidemcp::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::SessionNotFound), ErrorCategory::SessionNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::UnsupportedProtocolVersion),
              ErrorCategory::UnsupportedProtocolVersion);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::ResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ResponseRoundTripKeepsData) {
    JSONValue::Object data;
    data["detail"] = std::make_shared<JSONValue>("missing");
    auto err = errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad params", JSONValue(data));
    auto resp = errors::makeErrorResponse(JSONRPCId(int64_t{3}), err);
    ASSERT_TRUE(resp != nullptr);
    EXPECT_TRUE(resp->IsError());
    EXPECT_EQ(std::get<int64_t>(resp->id), 3);

    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, "bad params");
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(parsed->data.has_value());
    const JSONValue* detail = parsed->data->Find("detail");
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(std::get<std::string>(detail->value), "missing");
}

TEST(Errors, SuccessResponseHasNoError) {
    JSONRPCResponse ok(JSONRPCId(int64_t{1}), JSONValue(JSONValue::Object{}));
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
    EXPECT_EQ(ok.ErrorCode(), 0);
}

TEST(Errors, MalformedErrorValueIsRejected) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>("not-a-number");
    obj["message"] = std::make_shared<JSONValue>("m");
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(obj)).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(std::string("x"))).has_value());
}

TEST(Errors, McpExceptionCarriesTypedError) {
    try {
        throw errors::McpException(JSONRPCErrorCodes::SessionNotFound, "Session not found");
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::SessionNotFound);
        EXPECT_EQ(e.error().category, errors::ErrorCategory::SessionNotFound);
        EXPECT_STREQ(e.what(), "Session not found");
    }
}

TEST(Errors, GuidelineErrorMapping) {
    using Kind = errors::GuidelineError::Kind;
    auto unknownTool = errors::fromGuidelineError(errors::GuidelineError(Kind::UnknownTool, "Unknown tool: x"));
    EXPECT_EQ(unknownTool.code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(unknownTool.message, "Unknown tool: x");

    auto badArgs = errors::fromGuidelineError(errors::GuidelineError(Kind::InvalidArguments, "category must be a string"));
    EXPECT_EQ(badArgs.code, JSONRPCErrorCodes::InvalidParams);

    auto missing = errors::fromGuidelineError(errors::GuidelineError(Kind::ResourceNotFound, "Unknown resource"));
    EXPECT_EQ(missing.code, JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(missing.category, errors::ErrorCategory::ResourceNotFound);
}
