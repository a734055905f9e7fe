#include "test_helpers.hpp"

namespace {

using namespace zschema;        // NOLINT
using namespace zschema::test;  // NOLINT

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

TEST(ExtendType, round_trips_an_extended_record)
{
    auto extended = extend("extended",
                           record("base", {{"prop1", str("prop1")}, {"prop2", boolean("prop2")}}),
                           {{"prop3", str("prop3")}, {"prop4", optional(boolean("prop4", true))}});

    const Value val = map({{"prop1", "hello"}, {"prop2", true}, {"prop3", "world"}, {"prop4", Value()}});
    EXPECT_THAT(round_trip(extended, val), ValueEq(val));
}

TEST(ExtendType, own_fields_override_base_fields)
{
    auto base = record("base", {{"prop1", str("prop1")}, {"prop2", boolean("prop2")}});
    auto extended = extend("extended", base, {{"prop2", str("prop2str")}});

    const Value val = map({{"prop1", "hello"}, {"prop2", "world"}});
    EXPECT_THAT(round_trip(extended, val), ValueEq(val));
    EXPECT_EQ(capture_error([&] { base->validate(val); }).kind(), ErrorKind::TypeMismatch);
}

TEST(ExtendType, child_number_wins_over_base_string)
{
    auto b = record("B", {{"p", str("p")}});
    auto e = extend("E", b, {{"p", num("p")}});

    EXPECT_THAT(e->validate(map({{"p", 5}})), ValueEq(map({{"p", 5.0}})));

    auto error = capture_error([&] { b->validate(map({{"p", 5}})); });
    EXPECT_EQ(error.kind(), ErrorKind::TypeMismatch);
    EXPECT_EQ(error.schema_name(), "p");
}

TEST(ExtendType, base_failure_comes_first)
{
    auto e = extend("E", record("B", {{"a", str("a")}}), {{"b", str("b")}});
    auto error = capture_error([&] { e->validate(map({{"a", 1}, {"b", 2}})); });
    EXPECT_EQ(error.schema_name(), "a");
    EXPECT_EQ(error.path(), "$.a");
}

TEST(ExtendType, prunes_unknown_fields)
{
    auto e = extend("E", record("B", {{"a", str("a")}}), {{"b", str("b")}});
    EXPECT_THAT(e->validate(map({{"a", "x"}, {"b", "y"}, {"c", "z"}})), ValueEq(map({{"a", "x"}, {"b", "y"}})));
}

TEST(ExtendType, field_access)
{
    auto e = as_record_like(extend("E", record("B", {{"a", str("a")}, {"p", str("p")}}), {{"p", num("p")}}));
    ASSERT_NE(e, nullptr);

    EXPECT_TRUE(e->has_field("a"));
    EXPECT_TRUE(e->has_field("p"));
    EXPECT_FALSE(e->has_field("q"));
    EXPECT_THAT(e->field_names(), UnorderedElementsAre("a", "p"));

    // The own definition of "p" is used.
    EXPECT_THAT(e->validate_field("p", Value(1)), ValueEq(Value(1.0)));
    EXPECT_THAT(e->validate_field("a", Value("x")), ValueEq(Value("x")));
}

TEST(ExtendType, extension_of_an_extension)
{
    auto animal = record("animal", {{"name", str("name")}});
    auto pet = extend("pet", animal, {{"owner", str("owner")}});
    auto dog = extend("dog", pet, {{"breed", str("breed")}});

    const Value val = map({{"name", "Rex"}, {"owner", "Ann"}, {"breed", "collie"}});
    EXPECT_THAT(round_trip(dog, val), ValueEq(val));
    EXPECT_THAT(as_record_like(dog)->field_names(), ElementsAre("name", "owner", "breed"));
}

TEST(ExtendType, base_must_be_record_like)
{
    EXPECT_EQ(capture_error([] { extend("E", str("s"), {}); }).kind(), ErrorKind::InvalidSchema);
    EXPECT_EQ(capture_error([] { extend("E", nullptr, {}); }).kind(), ErrorKind::InvalidSchema);
}

} // namespace
