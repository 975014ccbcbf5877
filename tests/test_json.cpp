//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSON parser, serializer and JSON-RPC message classification tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpagent/JSONRPCTypes.h"
#include <stdexcept>
#include <string>

using namespace mcpagent;

TEST(JSONParser, ParsesScalarsAndContainers) {
    JSONValue v = ParseJSON(R"({"a":1,"b":-2.5,"c":"x","d":[true,false,null],"e":{}})");
    ASSERT_TRUE(v.isObject());
    ASSERT_NE(v.find("a"), nullptr);
    EXPECT_EQ(std::get<int64_t>(v.find("a")->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(v.find("b")->value), -2.5);
    EXPECT_EQ(v.stringOr("c", ""), "x");
    const auto& arr = std::get<JSONValue::Array>(v.find("d")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_FALSE(std::get<bool>(arr[1]->value));
    EXPECT_TRUE(arr[2]->isNull());
    EXPECT_TRUE(v.find("e")->isObject());
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("line\nquote\" \u00e9 \ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nquote\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("this is not json"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"\\ud83d\""), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_THROW(ParseJSON("1."), std::runtime_error);
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONSerializer, ProducesSingleLineText) {
    JSONValue::Array arr;
    arr.push_back(std::make_shared<JSONValue>(std::string("a.txt")));
    arr.push_back(std::make_shared<JSONValue>(std::string("b\nc")));
    EXPECT_EQ(SerializeJSON(JSONValue{arr}), "[\"a.txt\",\"b\\nc\"]");

    JSONValue::Object obj;
    obj["path"] = std::make_shared<JSONValue>(std::string("/tmp"));
    EXPECT_EQ(SerializeJSON(JSONValue{obj}), "{\"path\":\"/tmp\"}");
}

TEST(JSONRPC, RequestSerializesIdMethodAndParams) {
    JSONValue::Object p;
    p["uri"] = std::make_shared<JSONValue>(std::string("file:///x"));
    JSONRPCRequest req(int64_t{7}, "resources/read", JSONValue{p});
    EXPECT_EQ(req.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"resources/read\",\"params\":{\"uri\":\"file:///x\"}}");

    JSONRPCRequest noParams(int64_t{1}, "tools/list");
    EXPECT_EQ(noParams.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}");
}

TEST(JSONRPC, ResponseWithBothResultAndErrorIsRejected) {
    JSONRPCResponse resp;
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"));
    EXPECT_TRUE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"nope"}})"));
    EXPECT_TRUE(resp.IsError());
    EXPECT_FALSE(resp.Deserialize("not json"));
}

TEST(JSONRPC, ClassifiesByTopLevelKeys) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/message"})")), MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":3,"result":{"method":"x"}})")), MessageKind::Response);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0"})")), MessageKind::Unknown);
    EXPECT_EQ(ClassifyMessage(ParseJSON("[1,2]")), MessageKind::Unknown);
}

TEST(JSONRPC, FormatsIds) {
    EXPECT_EQ(FormatId(JSONRPCId{int64_t{42}}), "42");
    EXPECT_EQ(FormatId(JSONRPCId{std::string("abc")}), "\"abc\"");
    EXPECT_EQ(FormatId(JSONRPCId{nullptr}), "null");
}
