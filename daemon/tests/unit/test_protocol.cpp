/**
 * @file test_protocol.cpp
 * @brief Unit tests for IPC request parsing and response encoding
 */

#include <gtest/gtest.h>
#include "wardend/ipc/protocol.h"
#include "wardend/logger.h"

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        wardend::Logger::init(wardend::LogLevel::CRITICAL, false);
    }
    
    void TearDown() override {
        wardend::Logger::shutdown();
    }
};

TEST_F(ProtocolTest, ParsesMethodAndParams) {
    auto request = wardend::Request::parse(R"({"method": "watcher.incr", "params": {"name": "web", "count": 2}})");
    
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "watcher.incr");
    EXPECT_EQ(request->params["name"], "web");
    EXPECT_EQ(request->params["count"], 2);
    EXPECT_FALSE(request->id.has_value());
}

TEST_F(ProtocolTest, MissingParamsBecomeEmptyObject) {
    auto request = wardend::Request::parse(R"({"method": "ping"})");
    
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->params.is_object());
    EXPECT_TRUE(request->params.empty());
}

TEST_F(ProtocolTest, AcceptsStringAndIntegerIds) {
    auto by_string = wardend::Request::parse(R"({"method": "ping", "id": "abc"})");
    auto by_number = wardend::Request::parse(R"({"method": "ping", "id": 17})");
    
    ASSERT_TRUE(by_string.has_value());
    ASSERT_TRUE(by_number.has_value());
    EXPECT_EQ(by_string->id.value_or(""), "abc");
    EXPECT_EQ(by_number->id.value_or(""), "17");
}

TEST_F(ProtocolTest, RejectsMalformedRequests) {
    EXPECT_FALSE(wardend::Request::parse("").has_value());
    EXPECT_FALSE(wardend::Request::parse("{not json").has_value());
    EXPECT_FALSE(wardend::Request::parse(R"(["ping"])").has_value());
    EXPECT_FALSE(wardend::Request::parse(R"({"params": {}})").has_value());
    EXPECT_FALSE(wardend::Request::parse(R"({"method": 42})").has_value());
    EXPECT_FALSE(wardend::Request::parse(R"({"method": "ping", "params": [1, 2]})").has_value());
}

TEST_F(ProtocolTest, RequestSerializesParams) {
    wardend::Request request;
    request.method = "watcher.stop";
    request.params = {{"name", "web"}};
    request.id = "7";
    
    auto j = wardend::json::parse(request.to_json());
    EXPECT_EQ(j["method"], "watcher.stop");
    EXPECT_EQ(j["params"]["name"], "web");
    EXPECT_EQ(j["id"], "7");
}

TEST_F(ProtocolTest, SuccessResponseCarriesResult) {
    auto j = wardend::json::parse(wardend::Response::ok({{"pong", true}}).to_json());
    
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_TRUE(j["result"]["pong"].get<bool>());
    EXPECT_TRUE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(ProtocolTest, ErrorResponseCarriesCode) {
    auto response = wardend::Response::err("cannot run stop: already running start command",
                                           wardend::ErrorCodes::BUSY);
    auto j = wardend::json::parse(response.to_json());
    
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"]["code"], 105);
    EXPECT_EQ(j["error"]["message"], "cannot run stop: already running start command");
    EXPECT_FALSE(j.contains("result"));
}

TEST_F(ProtocolTest, ApplicationCodesStayOutsideReservedRange) {
    for (int code : {wardend::ErrorCodes::RATE_LIMITED, wardend::ErrorCodes::CONFIG_ERROR,
                     wardend::ErrorCodes::BUSY, wardend::ErrorCodes::WATCHER_NOT_FOUND,
                     wardend::ErrorCodes::COMMAND_FAILED}) {
        EXPECT_GT(code, 0);
        EXPECT_LT(code, 1000);
    }
}
