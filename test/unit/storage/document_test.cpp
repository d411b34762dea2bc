#include <gtest/gtest.h>
#include "modelmig/storage/document.h"

namespace modelmig {
namespace storage {
namespace {

TEST(DocumentTest, TypedSettersAndGetters) {
    Document doc;
    doc.set_string("phase", "QUIESCE")
       .set_int("attempt", 3)
       .set_bool("success", true)
       .set_strings("addrs", {"1.2.3.4:5555"})
       .set_null("end");

    EXPECT_EQ(doc.size(), 5u);
    EXPECT_EQ(doc.get_string("phase"), std::optional<std::string>("QUIESCE"));
    EXPECT_EQ(doc.get_int("attempt"), std::optional<int64_t>(3));
    EXPECT_EQ(doc.get_bool("success"), std::optional<bool>(true));
    ASSERT_TRUE(doc.get_strings("addrs").has_value());
    EXPECT_EQ(doc.get_strings("addrs")->front(), "1.2.3.4:5555");
    EXPECT_TRUE(doc.has("end"));
    EXPECT_FALSE(doc.get_string("end").has_value());
}

TEST(DocumentTest, StringSetterKeepsString) {
    Document doc;
    doc.set_string("message", "starting");
    const Value* value = doc.get("message");
    ASSERT_NE(value, nullptr);
    EXPECT_TRUE(std::holds_alternative<std::string>(*value));
}

TEST(DocumentTest, MismatchedTypeReadsFallback) {
    Document doc;
    doc.set_string("attempt", "three");
    EXPECT_FALSE(doc.get_int("attempt").has_value());
    EXPECT_EQ(doc.int_or("attempt", -1), -1);
    EXPECT_EQ(doc.string_or("missing", "none"), "none");
    EXPECT_TRUE(doc.bool_or("missing", true));
}

TEST(DocumentTest, RemoveField) {
    Document doc;
    doc.set_int("counter", 1);
    doc.remove("counter");
    EXPECT_FALSE(doc.has("counter"));
    EXPECT_TRUE(doc.empty());
}

TEST(DocumentTest, EqualityIgnoresRevision) {
    Document a;
    a.set_int("counter", 1);
    Document b = a;
    b.set_revision(42);
    EXPECT_EQ(a, b);

    b.set_int("counter", 2);
    EXPECT_NE(a, b);
}

TEST(DocumentTest, ValueToString) {
    EXPECT_EQ(value_to_string(Value()), "null");
    EXPECT_EQ(value_to_string(Value(std::in_place_type<bool>, false)), "false");
    EXPECT_EQ(value_to_string(Value(std::in_place_type<int64_t>, 7)), "7");
    EXPECT_EQ(value_to_string(Value(std::in_place_type<std::string>, "x")), "\"x\"");
    EXPECT_EQ(value_to_string(Value(std::vector<std::string>{"a", "b"})), "[\"a\", \"b\"]");
}

} // namespace
} // namespace storage
} // namespace modelmig
