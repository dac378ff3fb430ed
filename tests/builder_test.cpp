//! # Value Builder Tests

#include "tnet/builder.hpp"
#include "tnet/encoder.hpp"

#include <gtest/gtest.h>

using namespace tnet;

// ============================================================================
// Building
// ============================================================================

TEST(ValueBuilderTest, SimpleList) {
    Value v = ValueBuilder().list().item("hello").item("world").end().build();

    ASSERT_TRUE(v.is_list());
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].as_string(), "hello");
    EXPECT_EQ(v[1].as_string(), "world");
}

TEST(ValueBuilderTest, EveryScalarKind) {
    Value v = ValueBuilder()
                  .list()
                  .item(true)
                  .item(7)
                  .item(int64_t(-8))
                  .item(uint64_t(18446744073709551615ULL))
                  .item(Integer(9))
                  .item(2.5)
                  .item(std::string("s"))
                  .item(std::string_view("v"))
                  .item(nullptr)
                  .item_null()
                  .end()
                  .build();

    ASSERT_EQ(v.size(), 10u);
    EXPECT_TRUE(v[0].as_bool());
    EXPECT_EQ(v[1].as_i64(), 7);
    EXPECT_EQ(v[2].as_i64(), -8);
    EXPECT_EQ(v[3].as_u64(), 18446744073709551615ULL);
    EXPECT_EQ(v[4].as_i64(), 9);
    EXPECT_EQ(v[5].as_float(), 2.5);
    EXPECT_EQ(v[6].as_string(), "s");
    EXPECT_EQ(v[7].as_string(), "v");
    EXPECT_TRUE(v[8].is_null());
    EXPECT_TRUE(v[9].is_null());
}

TEST(ValueBuilderTest, NestedDictionary) {
    Value user = ValueBuilder()
                     .dict()
                     .key("name")
                     .item("Alice")
                     .key("age")
                     .item(30)
                     .key("tags")
                     .list()
                     .item("admin")
                     .item("ops")
                     .end()
                     .end()
                     .build();

    auto bytes = encode(user);
    ASSERT_TRUE(is_ok(bytes)) << unwrap_err(bytes);
    EXPECT_EQ(unwrap(bytes), "51:4:name,5:Alice,3:age,2:30#4:tags,14:5:admin,3:ops,]}");
}

TEST(ValueBuilderTest, DictionaryKeepsDuplicatesInOrder) {
    Value v = ValueBuilder().dict().key("k").item(1).key("k").item(2).end().build();

    const Dict& entries = v.as_dict();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].second.as_i64(), 1);
    EXPECT_EQ(entries[1].second.as_i64(), 2);
}

TEST(ValueBuilderTest, EmptyKeyIsAllowed) {
    Value v = ValueBuilder().dict().key("").item(1).end().build();
    ASSERT_NE(v.get(""), nullptr);
}

TEST(ValueBuilderTest, ListOfDictionaries) {
    Value v = ValueBuilder()
                  .list()
                  .dict()
                  .key("id")
                  .item(1)
                  .end()
                  .dict()
                  .key("id")
                  .item(2)
                  .end()
                  .end()
                  .build();

    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[1].get("id")->as_i64(), 2);
}

TEST(ValueBuilderTest, StandaloneScalar) {
    Value v = ValueBuilder().item(42).build();
    EXPECT_EQ(v.as_i64(), 42);
}

TEST(ValueBuilderTest, PrebuiltValueItem) {
    Value inner = ValueBuilder().list().item(1).end().build();
    Value v = ValueBuilder().list().item(std::move(inner)).end().build();
    EXPECT_EQ(v.to_display_string(), "[[1]]");
}

TEST(ValueBuilderTest, CompletionState) {
    ValueBuilder builder;
    EXPECT_FALSE(builder.is_complete());

    builder.list();
    EXPECT_FALSE(builder.is_complete());
    EXPECT_EQ(builder.depth(), 1u);

    builder.end();
    EXPECT_TRUE(builder.is_complete());
    EXPECT_EQ(builder.depth(), 0u);

    (void)builder.build();
    EXPECT_FALSE(builder.is_complete());
}

TEST(ValueBuilderTest, BuilderIsReusableAfterBuild) {
    ValueBuilder builder;
    Value first = builder.item(1).build();
    Value second = builder.item(2).build();
    EXPECT_EQ(first.as_i64(), 1);
    EXPECT_EQ(second.as_i64(), 2);
}

// ============================================================================
// Misuse
// ============================================================================

TEST(ValueBuilderTest, EndWithNothingOpen) {
    ValueBuilder builder;
    EXPECT_THROW(builder.end(), std::logic_error);
}

TEST(ValueBuilderTest, ValueWithoutKeyInDictionary) {
    ValueBuilder builder;
    builder.dict();
    EXPECT_THROW(builder.item(1), std::logic_error);
    EXPECT_THROW(builder.list(), std::logic_error);
}

TEST(ValueBuilderTest, KeyOutsideDictionary) {
    ValueBuilder builder;
    EXPECT_THROW(builder.key("k"), std::logic_error);

    builder.list();
    EXPECT_THROW(builder.key("k"), std::logic_error);
}

TEST(ValueBuilderTest, KeyTwice) {
    ValueBuilder builder;
    builder.dict().key("a");
    EXPECT_THROW(builder.key("b"), std::logic_error);
}

TEST(ValueBuilderTest, EndWithDanglingKey) {
    ValueBuilder builder;
    builder.dict().key("a");
    EXPECT_THROW(builder.end(), std::logic_error);
}

TEST(ValueBuilderTest, BuildWithOpenAggregate) {
    ValueBuilder builder;
    builder.list().item(1);
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST(ValueBuilderTest, BuildWithNothingAdded) {
    ValueBuilder builder;
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST(ValueBuilderTest, SecondTopLevelValue) {
    ValueBuilder builder;
    builder.item(1);
    EXPECT_THROW(builder.item(2), std::logic_error);
    EXPECT_THROW(builder.list(), std::logic_error);
}
