#include "test_helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <zerialize/errors.hpp>
#include <zerialize/protocols/cbor.hpp>
#include <zerialize/protocols/flex.hpp>
#include <zerialize/protocols/msgpack.hpp>
#include <zerialize/protocols/zera.hpp>

namespace {

using namespace zschema;        // NOLINT
using namespace zschema::test;  // NOLINT

// A schema touching every node type.
SchemaPtr make_inventory()
{
    auto tag = str("tag");
    auto item = union_of("item", "type", {
        record("tool", {
            {"type", str("type", "tool")},
            {"name", tag},
            {"weight", num("weight")},
            {"broken", optional(boolean("broken"))},
        }),
        extend("book", record("printed", {{"pages", num("pages")}, {"name", tag}}), {
            {"type", str("type", "book")},
            {"cover", bytes("cover")},
        }),
    });
    return record("inventory", {
        {"owner", tag},
        {"items", list("items", item)},
        {"labels", list("labels", tag)},
    });
}

Value make_inventory_value()
{
    return map({
        {"owner", "ann"},
        {"items", array({
            map({{"type", "tool"}, {"name", "hammer"}, {"weight", 1.5}, {"broken", Value()}}),
            map({{"type", "book"}, {"pages", 320.0}, {"name", "dune"}, {"cover", blob({0x89, 0x50, 0x4e, 0x47})}}),
            map({{"type", "tool"}, {"name", "saw"}, {"weight", 2.0}, {"broken", true}}),
        })},
        {"labels", array({"home", "garage"})},
    });
}

// MARK: - every protocol

template <class P>
class TestProtocols : public ::testing::Test {};

using Protocols = ::testing::Types<zerialize::MsgPack, zerialize::Flex, zerialize::CBOR, zerialize::Zera>;
TYPED_TEST_SUITE(TestProtocols, Protocols);

TYPED_TEST(TestProtocols, round_trips_a_composite_schema)
{
    auto inventory = make_inventory();
    const Value val = make_inventory_value();
    EXPECT_THAT(round_trip<TypeParam>(inventory, val), ValueEq(val));
}

TYPED_TEST(TestProtocols, prunes_before_packing)
{
    auto user = record("user", {{"id", str("id")}, {"username", str("username")}});
    const Value input = map({{"id", "1"}, {"username", "a"}, {"email", "x@y.com"}});

    const Value unpacked = unpack<TypeParam>(user->serialize<TypeParam>(input).buf());
    EXPECT_THAT(unpacked, ValueEq(map({{"id", "1"}, {"username", "a"}})));
}

TYPED_TEST(TestProtocols, validation_failure_on_decode)
{
    auto user = record("user", {{"id", str("id")}});
    const zerialize::ZBuffer buffer = pack<TypeParam>(map({{"id", 7}}));

    auto error = capture_error([&] { user->deserialize<TypeParam>(buffer); });
    EXPECT_EQ(error.kind(), ErrorKind::TypeMismatch);
    EXPECT_EQ(error.path(), "$.id");
}

// MARK: - MessagePack specifics

TEST(Codec, special_numbers_survive_messagepack)
{
    auto values = list("values", num("value"));
    const double inf = std::numeric_limits<double>::infinity();
    const Value val = array({inf, -inf, std::numeric_limits<double>::quiet_NaN(), 0.1});
    EXPECT_THAT(round_trip(values, val), ValueEq(val));
}

TEST(Codec, integers_on_the_wire_read_as_numbers)
{
    const Value decoded = unpack<zerialize::MsgPack>(pack<zerialize::MsgPack>(array({1, -1, 300})).buf());
    const auto* items = as_array(decoded);
    ASSERT_NE(items, nullptr);
    for (const auto& item : *items) {
        EXPECT_NE(std::get_if<double>(&item.storage()), nullptr);
    }
    EXPECT_THAT(decoded, ValueEq(array({1.0, -1.0, 300.0})));
}

TEST(Codec, malformed_input_surfaces_the_codec_error)
{
    auto rec = record("rec", {{"a", str("a")}});

    const std::vector<std::uint8_t> empty;
    EXPECT_THROW(rec->deserialize(empty), zerialize::DeserializationError);

    // fixmap with one entry, then a str8 header missing its length byte.
    const std::vector<std::uint8_t> truncated = {0x81, 0xa1, 'a', 0xd9};
    EXPECT_THROW(rec->deserialize(truncated), zerialize::DeserializationError);
}

std::vector<std::uint8_t> nested_arrays(std::size_t levels)
{
    std::vector<std::uint8_t> bytes(levels, 0x91);  // fixarray of one element
    bytes.push_back(0xc0);                           // nil
    return bytes;
}

TEST(Codec, nesting_depth_is_capped)
{
    EXPECT_NO_THROW(unpack<zerialize::MsgPack>(nested_arrays(MaxNestingDepth)));
    EXPECT_THROW(unpack<zerialize::MsgPack>(nested_arrays(MaxNestingDepth + 1)), zerialize::DeserializationError);

    auto deep = list("deep", list("deeper", num("n")));
    const std::vector<std::uint8_t> too_deep = nested_arrays(MaxNestingDepth + 10);
    EXPECT_THROW(deep->deserialize(too_deep), zerialize::DeserializationError);
}

// MARK: - properties

TEST(Codec, validation_is_idempotent)
{
    auto inventory = make_inventory();
    Value noisy = make_inventory_value();
    const Value once = inventory->validate(noisy);
    EXPECT_THAT(inventory->validate(once), ValueEq(once));
}

TEST(Codec, deserialize_of_serialize_equals_validate)
{
    auto inventory = make_inventory();
    const Value input = map({
        {"owner", "bob"},
        {"extra", "dropped"},
        {"items", array({map({{"type", "book"}, {"pages", 12}, {"name", "x"}, {"cover", blob({})}, {"isbn", "1"}})})},
        {"labels", array({})},
    });
    EXPECT_THAT(round_trip(inventory, input), ValueEq(inventory->validate(input)));
}

} // namespace
