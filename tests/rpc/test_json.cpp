// ETHLEDGER - JSON and JSON-RPC Message Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/rpc/json.h>
#include <ethledger/rpc/wallet_handler.h>

#include <stdexcept>

namespace ethledger {
namespace rpc {
namespace test {

// ============================================================================
// JSONValue Tests
// ============================================================================

class JSONValueTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(JSONValueTest, NullValue) {
    JSONValue null;
    EXPECT_TRUE(null.IsNull());
    EXPECT_FALSE(null.IsBool());
    EXPECT_FALSE(null.IsString());
    EXPECT_EQ(null.GetType(), JSONValue::Type::Null);
    EXPECT_EQ(null.GetString("fallback"), "fallback");
}

TEST_F(JSONValueTest, ScalarValues) {
    EXPECT_TRUE(JSONValue(true).GetBool());
    EXPECT_EQ(JSONValue(42).GetInt(), 42);
    EXPECT_EQ(JSONValue(uint64_t(31337)).GetInt(), 31337);
    EXPECT_DOUBLE_EQ(JSONValue(2.5).GetDouble(), 2.5);
    EXPECT_TRUE(JSONValue(2.5).IsNumber());
    EXPECT_EQ(JSONValue("0xabc").GetString(), "0xabc");
    EXPECT_EQ(JSONValue(std::string("hello")).GetString(), "hello");
}

TEST_F(JSONValueTest, ArrayValue) {
    JSONValue arr;
    arr.Push(JSONValue(1));
    arr.Push(JSONValue("two"));
    EXPECT_TRUE(arr.IsArray());
    EXPECT_EQ(arr.Size(), 2u);
    EXPECT_EQ(arr[size_t(1)].GetString(), "two");
    EXPECT_TRUE(arr[size_t(5)].IsNull());
}

TEST_F(JSONValueTest, ObjectValue) {
    JSONValue obj;
    obj["from"] = "0x01";
    obj["nonce"] = 7;
    EXPECT_TRUE(obj.IsObject());
    EXPECT_TRUE(obj.HasKey("from"));
    EXPECT_FALSE(obj.HasKey("to"));

    const JSONValue& view = obj;
    EXPECT_EQ(view["nonce"].GetInt(), 7);
    EXPECT_TRUE(view["missing"].IsNull());
}

TEST_F(JSONValueTest, ToJSON) {
    EXPECT_EQ(JSONValue().ToJSON(), "null");
    EXPECT_EQ(JSONValue(false).ToJSON(), "false");
    EXPECT_EQ(JSONValue(-123).ToJSON(), "-123");
    EXPECT_EQ(JSONValue("a\"b\n").ToJSON(), "\"a\\\"b\\n\"");

    JSONValue::Object obj;
    obj["b"] = JSONValue(JSONValue::Array{JSONValue(1), JSONValue(2)});
    obj["a"] = JSONValue(nullptr);
    EXPECT_EQ(JSONValue(obj).ToJSON(), "{\"a\":null,\"b\":[1,2]}");
}

TEST_F(JSONValueTest, ParseDocument) {
    auto val = JSONValue::TryParse(
        R"({"method": "eth_sign", "params": ["0x01", "hi"], "id": 3, "ok": true})");
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ((*val)["method"].GetString(), "eth_sign");
    EXPECT_EQ((*val)["params"].Size(), 2u);
    EXPECT_EQ((*val)["id"].GetInt(), 3);
    EXPECT_TRUE((*val)["ok"].GetBool());
}

TEST_F(JSONValueTest, ParseEscapes) {
    auto val = JSONValue::TryParse(R"("tab\tquote\"A\u00e9")");
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val->GetString(), "tab\tquote\"A\xc3\xa9");
}

TEST_F(JSONValueTest, ParseNumbers) {
    EXPECT_EQ(JSONValue::Parse("-17").GetInt(), -17);
    EXPECT_TRUE(JSONValue::Parse("1.5e3").IsDouble());
    EXPECT_FALSE(JSONValue::TryParse("99999999999999999999999").has_value());
}

TEST_F(JSONValueTest, ParseInvalid) {
    EXPECT_FALSE(JSONValue::TryParse("invalid json").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":1,}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1, 2").has_value());
    EXPECT_FALSE(JSONValue::TryParse("\"unterminated").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} extra").has_value());
    EXPECT_THROW(JSONValue::Parse("nope"), std::runtime_error);
}

TEST_F(JSONValueTest, RoundTripEquality) {
    const std::string text = R"({"a":[1,"x",null,false],"b":{"c":"d"}})";
    JSONValue first = JSONValue::Parse(text);
    EXPECT_EQ(first.ToJSON(), text);
    EXPECT_EQ(JSONValue::Parse(first.ToJSON(true)), first);
}

// ============================================================================
// RPCRequest Tests
// ============================================================================

TEST(RPCRequestTest, GetParamByIndex) {
    JSONValue::Array params;
    params.push_back(JSONValue("first"));
    params.push_back(JSONValue(42));

    RPCRequest req("test", JSONValue(params), JSONValue(1));
    EXPECT_EQ(req.GetMethod(), "test");
    EXPECT_EQ(req.GetParam(0).GetString(), "first");
    EXPECT_EQ(req.GetParam(1).GetInt(), 42);
    EXPECT_TRUE(req.GetParam(2).IsNull());
    EXPECT_TRUE(req.HasParam(1));
    EXPECT_FALSE(req.HasParam(2));
}

TEST(RPCRequestTest, ToJSON) {
    RPCRequest req("eth_accounts", JSONValue(JSONValue::Array{}), JSONValue(42));
    std::string json = req.ToJSON();
    EXPECT_NE(json.find("\"jsonrpc\":\"2.0\""), std::string::npos);
    EXPECT_NE(json.find("\"method\":\"eth_accounts\""), std::string::npos);
    EXPECT_NE(json.find("\"id\":42"), std::string::npos);
}

TEST(RPCRequestTest, Parse) {
    auto req = RPCRequest::Parse(R"({"jsonrpc":"2.0","method":"test","params":[1,2,3],"id":"a"})");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->GetMethod(), "test");
    EXPECT_EQ(req->GetId().GetString(), "a");
    EXPECT_EQ(req->GetParam(2).GetInt(), 3);
}

TEST(RPCRequestTest, ParseRejectsNonRequests) {
    EXPECT_FALSE(RPCRequest::Parse("not valid json").has_value());
    EXPECT_FALSE(RPCRequest::Parse(R"({"method":"test","id":1})").has_value());
    EXPECT_FALSE(RPCRequest::Parse(R"({"jsonrpc":"1.0","method":"test"})").has_value());
    EXPECT_FALSE(RPCRequest::Parse(R"({"jsonrpc":"2.0","method":5})").has_value());
    EXPECT_FALSE(RPCRequest::Parse("[1]").has_value());
}

// ============================================================================
// RPCResponse Tests
// ============================================================================

TEST(RPCResponseTest, SuccessResponse) {
    auto resp = RPCResponse::Success(JSONValue("0xsig"), JSONValue(1));
    EXPECT_FALSE(resp.IsError());
    EXPECT_EQ(resp.GetResult().GetString(), "0xsig");
    EXPECT_EQ(resp.ToJSON(), "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":\"0xsig\"}");
}

TEST(RPCResponseTest, ErrorResponse) {
    auto resp = RPCResponse::Error(ErrorCode::ADDRESS_NOT_FOUND, "AddressNotFound",
                                   JSONValue(7), JSONValue("0xabc"));
    EXPECT_TRUE(resp.IsError());
    EXPECT_EQ(resp.GetErrorCode(), -5);
    EXPECT_EQ(resp.GetErrorMessage(), "AddressNotFound");

    JSONValue json = resp.ToJSONValue();
    EXPECT_FALSE(json.HasKey("result"));
    EXPECT_EQ(json["error"]["code"].GetInt(), -5);
    EXPECT_EQ(json["error"]["data"].GetString(), "0xabc");
    EXPECT_EQ(json["id"].GetInt(), 7);
}

TEST(RPCResponseTest, ErrorWithoutDataOmitsField) {
    auto resp = RPCResponse::Error(ErrorCode::PARSE_ERROR, "Parse error", JSONValue());
    JSONValue json = resp.ToJSONValue();
    EXPECT_FALSE(json["error"].HasKey("data"));
    EXPECT_TRUE(json["id"].IsNull());
}

} // namespace test
} // namespace rpc
} // namespace ethledger
