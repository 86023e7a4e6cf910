// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for the JSON writer used by the admin endpoints

#include <gtest/gtest.h>
#include "iptvmux/core/json_writer.hpp"

#include <optional>
#include <string>

namespace iptvmux {
namespace core {
namespace test {

TEST(JsonWriterTest, NestedObjectsAndArrays) {
    JsonWriter json;
    json.beginObject();
    json.field("name", "main");
    json.field("count", 2);
    json.key("items").beginArray();
    json.beginObject().field("id", int64_t{1}).endObject();
    json.beginObject().field("id", int64_t{2}).endObject();
    json.endArray();
    json.field("enabled", true);
    json.endObject();

    EXPECT_EQ(json.str(),
              "{\"name\":\"main\",\"count\":2,\"items\":[{\"id\":1},{\"id\":2}],\"enabled\":true}");
}

TEST(JsonWriterTest, EmptyContainers) {
    JsonWriter json;
    json.beginObject();
    json.key("list").beginArray().endArray();
    json.key("map").beginObject().endObject();
    json.endObject();

    EXPECT_EQ(json.str(), "{\"list\":[],\"map\":{}}");
}

TEST(JsonWriterTest, OptionalFieldsWriteNullWhenEmpty) {
    std::optional<std::string> missing;
    std::optional<std::string> present = std::string("x");

    JsonWriter json;
    json.beginObject();
    json.field("missing", missing);
    json.field("present", present);
    json.endObject();

    EXPECT_EQ(json.str(), "{\"missing\":null,\"present\":\"x\"}");
}

TEST(JsonWriterTest, DoublesUseThreeDecimals) {
    JsonWriter json;
    json.beginArray();
    json.value(1.5);
    json.value(2.0 / 3.0);
    json.endArray();

    EXPECT_EQ(json.str(), "[1.500,0.667]");
}

TEST(JsonWriterTest, EscapesStrings) {
    EXPECT_EQ(escapeJsonString("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(escapeJsonString(std::string("\x01", 1)), "\\u0001");

    JsonWriter json;
    json.beginObject().field("quote\"key", "tab\there").endObject();
    EXPECT_EQ(json.str(), "{\"quote\\\"key\":\"tab\\there\"}");
}

TEST(JsonWriterTest, UnsignedAndNegativeIntegers) {
    JsonWriter json;
    json.beginArray();
    json.value(uint64_t{18446744073709551615ULL});
    json.value(int64_t{-5});
    json.endArray();

    EXPECT_EQ(json.str(), "[18446744073709551615,-5]");
}

} // namespace test
} // namespace core
} // namespace iptvmux
