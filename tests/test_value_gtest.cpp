// ==============================================================================
// test_value_gtest.cpp - Тесты Value и Entity (GoogleTest)
// ==============================================================================

#include "domaindump/entity.hpp"
#include "domaindump/value.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>
#include <vector>

namespace domaindump::test {

// ==============================================================================
// Timestamp
// ==============================================================================

TEST(ValueTest, FiletimeZero_Is1601) {
    Timestamp ts = timestamp_from_filetime(0);
    EXPECT_EQ(ts.seconds, -FILETIME_EPOCH_OFFSET);

    CivilTime c = to_civil(ts);
    EXPECT_EQ(c.year, 1601);
    EXPECT_EQ(c.month, 1);
    EXPECT_EQ(c.day, 1);
}

TEST(ValueTest, FiletimeUnixEpoch_IsZero) {
    Timestamp ts = timestamp_from_filetime(FILETIME_EPOCH_OFFSET * TICKS_PER_SECOND);
    EXPECT_EQ(ts.seconds, 0);
    EXPECT_EQ(timestamp_to_iso8601(ts), "1970-01-01T00:00:00Z");
}

TEST(ValueTest, GeneralizedTime_Parses) {
    auto ts = parse_generalized_time("20160102030405.0Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(timestamp_to_iso8601(*ts), "2016-01-02T03:04:05Z");
}

TEST(ValueTest, GeneralizedTime_WithoutFraction) {
    auto ts = parse_generalized_time("19991231235959Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(timestamp_to_iso8601(*ts), "1999-12-31T23:59:59Z");
}

TEST(ValueTest, GeneralizedTime_RejectsGarbage) {
    EXPECT_FALSE(parse_generalized_time("").has_value());
    EXPECT_FALSE(parse_generalized_time("2016010203").has_value());
    EXPECT_FALSE(parse_generalized_time("20161302030405Z").has_value());
    EXPECT_FALSE(parse_generalized_time("20160102030405").has_value());
    EXPECT_FALSE(parse_generalized_time("20160102030405.0Zx").has_value());
}

// ==============================================================================
// Value
// ==============================================================================

TEST(ValueTest, Kinds) {
    EXPECT_TRUE(Value("abc").is_string());
    EXPECT_TRUE(Value::make_int(5).is_int());
    EXPECT_TRUE(Value::make_bytes({1, 2}).is_bytes());
    EXPECT_TRUE(Value::make_timestamp(Timestamp{10}).is_timestamp());
    EXPECT_TRUE(Value::make_list({"a", "b"}).is_list());
    EXPECT_TRUE(Value().is_string());
}

TEST(ValueTest, SingleString_FromList) {
    EXPECT_EQ(Value::make_list({"first", "second"}).single_string(), "first");
    EXPECT_FALSE(Value::make_list({}).single_string().has_value());
    EXPECT_FALSE(Value::make_int(1).single_string().has_value());
}

TEST(ValueTest, Integer_FromStringAndInt) {
    EXPECT_EQ(Value::make_int(-42).integer(), -42);
    EXPECT_EQ(Value("512").integer(), 512);
    EXPECT_FALSE(Value("512x").integer().has_value());
    EXPECT_FALSE(Value("").integer().has_value());
    EXPECT_FALSE(Value::make_bytes({0x01}).integer().has_value());
}

TEST(ValueTest, StringList_WrapsSingleString) {
    auto list = Value("only").string_list();
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 1u);
    EXPECT_EQ((*list)[0], "only");
    EXPECT_FALSE(Value::make_timestamp(Timestamp{0}).string_list().has_value());
}

TEST(ValueTest, BytesToHex) {
    EXPECT_EQ(bytes_to_hex({0x00, 0xab, 0x10, 0xff}), "00ab10ff");
    EXPECT_EQ(bytes_to_hex({}), "");
}

TEST(ValueTest, ToRapidjson_AllKinds) {
    rapidjson::Document doc;
    auto& alloc = doc.GetAllocator();

    rapidjson::Value v;
    Value::make_int(7).to_rapidjson(v, alloc);
    ASSERT_TRUE(v.IsInt64());
    EXPECT_EQ(v.GetInt64(), 7);

    Value::make_bytes({0xde, 0xad}).to_rapidjson(v, alloc);
    ASSERT_TRUE(v.IsString());
    EXPECT_STREQ(v.GetString(), "dead");

    Value::make_timestamp(Timestamp{0}).to_rapidjson(v, alloc);
    ASSERT_TRUE(v.IsString());
    EXPECT_STREQ(v.GetString(), "1970-01-01T00:00:00Z");

    Value::make_list({"a", "b"}).to_rapidjson(v, alloc);
    ASSERT_TRUE(v.IsArray());
    ASSERT_EQ(v.Size(), 2u);
    EXPECT_STREQ(v[1].GetString(), "b");
}

// ==============================================================================
// Entity
// ==============================================================================

TEST(EntityTest, Find_IsCaseInsensitive) {
    Entity e("CN=alice,DC=corp,DC=local");
    e.set("sAMAccountName", Value("alice"));

    EXPECT_TRUE(e.has("samaccountname"));
    EXPECT_TRUE(e.has("SAMACCOUNTNAME"));
    EXPECT_EQ(e.first_string("SamAccountName"), "alice");
    EXPECT_FALSE(e.has("cn"));
}

TEST(EntityTest, AbsentDiffersFromEmpty) {
    Entity e("CN=x");
    e.set("description", Value(std::string()));

    EXPECT_TRUE(e.has("description"));
    EXPECT_EQ(e.first_string("description"), "");
    EXPECT_FALSE(e.first_string("info").has_value());
}

TEST(EntityTest, Set_ReplacesInPlace) {
    Entity e("CN=x");
    e.set("cn", Value("x"));
    e.set("primaryGroupID", Value::make_int(513));
    e.set("CN", Value("y"));

    ASSERT_EQ(e.size(), 2u);
    EXPECT_EQ(e.attributes()[0].name, "CN");
    EXPECT_EQ(e.first_string("cn"), "y");
    EXPECT_EQ(e.integer("primarygroupid"), 513);
}

TEST(EntityTest, Strings_AndInteger) {
    Entity e("CN=x");
    e.set("memberOf", Value::make_list({"CN=A,DC=x", "CN=B,DC=x"}));
    e.set("userAccountControl", Value("512"));

    auto groups = e.strings("memberof");
    ASSERT_TRUE(groups.has_value());
    EXPECT_EQ(groups->size(), 2u);
    EXPECT_EQ(e.integer("useraccountcontrol"), 512);
    EXPECT_FALSE(e.integer("missing").has_value());
}

TEST(EntityTest, CaseHelpers) {
    EXPECT_TRUE(iequals("objectSid", "OBJECTSID"));
    EXPECT_FALSE(iequals("objectSid", "objectSi"));
    EXPECT_EQ(to_lower("DnsHostName"), "dnshostname");
}

}  // namespace domaindump::test
