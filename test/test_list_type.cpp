#include "test_helpers.hpp"

namespace {

using namespace zschema;        // NOLINT
using namespace zschema::test;  // NOLINT

TEST(ListType, round_trips_primitives)
{
    auto some_list = list("someList", num("someListItem"));
    const Value val = array({1.0, 2.0, 3.0, 6.0, 8.0});
    EXPECT_THAT(round_trip(some_list, val), ValueEq(val));
    EXPECT_THAT(round_trip(some_list, array({})), ValueEq(array({})));
}

TEST(ListType, round_trips_nested_records)
{
    auto some_list = list("someList", record("someListItem", {
        {"prop1", str("prop1")},
        {"nested", record("nested", {
            {"nestedProp1", boolean("nestedProp1")},
            {"nestedProp2", str("nestedProp2")},
        })},
    }));

    const Value val = array({
        map({{"prop1", "hello"}, {"nested", map({{"nestedProp1", true}, {"nestedProp2", "beep"}})}}),
        map({{"prop1", "world"}, {"nested", map({{"nestedProp1", false}, {"nestedProp2", "boop"}})}}),
    });
    EXPECT_THAT(round_trip(some_list, val), ValueEq(val));
}

TEST(ListType, round_trips_lists_of_lists)
{
    auto some_list = list("someList", list("nestedList", num("nestedListItem")));
    const Value val = array({
        array({1, 4, 6}),
        array({494, 182, 344}),
        array({-23, -67, 42}),
    });
    EXPECT_THAT(round_trip(some_list, val), ValueEq(val));
}

TEST(ListType, rejects_non_sequences)
{
    auto some_list = list("someList", num("item"));
    for (const Value& bad : {Value(), Value(1.0), Value("abc"), map({}), blob({1, 2})}) {
        auto error = capture_error([&] { some_list->validate(bad); });
        EXPECT_EQ(error.kind(), ErrorKind::NotAnArray);
        EXPECT_EQ(error.schema_name(), "someList");
    }
}

TEST(ListType, first_bad_element_is_reported_with_its_index)
{
    auto some_list = list("someList", num("item"));
    auto error = capture_error([&] { some_list->validate(array({1, 2, "three", "four"})); });
    EXPECT_EQ(error.kind(), ErrorKind::TypeMismatch);
    EXPECT_EQ(error.schema_name(), "item");
    EXPECT_EQ(error.path(), "$[2]");
    EXPECT_THAT(error.value(), ValueEq(Value("three")));
}

TEST(ListType, path_through_records_and_lists)
{
    auto doc = record("doc", {
        {"items", list("items", record("item", {{"name", str("name")}}))},
    });
    auto error = capture_error([&] {
        doc->validate(map({{"items", array({map({{"name", "a"}}), map({{"name", "b"}}), map({{"name", 3}})})}}));
    });
    EXPECT_EQ(error.path(), "$.items[2].name");
}

TEST(ListType, elements_are_sanitized)
{
    auto people = list("people", record("person", {{"name", str("name")}}));
    EXPECT_THAT(people->validate(array({map({{"name", "a"}, {"age", 3}})})),
                ValueEq(array({map({{"name", "a"}})})));
}

} // namespace
