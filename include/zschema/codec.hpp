#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <zerialize/concepts.hpp>
#include <zerialize/dynamic.hpp>
#include <zerialize/errors.hpp>
#include <zerialize/serialize.hpp>
#include <zerialize/zbuffer.hpp>
#include <zerialize/protocols/msgpack.hpp>

#include <zschema/logging.hpp>
#include <zschema/value.hpp>

namespace zschema {

/*
 * Codec bridge
 * ------------
 * Thin glue between schema values and a zerialize protocol. Packing hands
 * the dynamic value straight to zerialize::serialize<P>; unpacking walks the
 * protocol's reader and rebuilds an owning Value.
 *
 * MessagePack is the default wire format. Any zerialize::Protocol works
 * (Flex, CBOR, Zera) once its header is included by the caller.
 */
using DefaultProtocol = zerialize::MsgPack;

/*
 * Convert a zerialize reader to an owning Value.
 * Integers become float64 numbers and blobs are copied. Map entries keep the
 * order the reader exposes them in. Nesting deeper than MaxNestingDepth is
 * rejected.
 */
template <zerialize::Reader R>
Value to_value(const R& reader, std::size_t depth = 0)
{
    if (depth > MaxNestingDepth) {
        throw zerialize::DeserializationError("zschema: input nested too deeply");
    }
    if (reader.isNull()) {
        return Value();
    }
    if (reader.isBool()) {
        return Value(reader.asBool());
    }
    if (reader.isInt()) {
        return Value(static_cast<double>(reader.asInt64()));
    }
    if (reader.isUInt()) {
        return Value(static_cast<double>(reader.asUInt64()));
    }
    if (reader.isFloat()) {
        return Value(reader.asDouble());
    }
    if (reader.isString()) {
        return Value(reader.asString());
    }

    if (reader.isBlob()) {
        const auto blob = reader.asBlob();
        const auto* data = std::data(blob);
        return Value(Bytes(data, data + std::size(blob)));
    }

    if (reader.isMap()) {
        Value::Map entries;
        for (std::string_view key : reader.mapKeys()) {
            entries.emplace_back(std::string(key), to_value(reader[key], depth + 1));
        }
        return Value::map(std::move(entries));
    }

    if (reader.isArray()) {
        const std::size_t n = reader.arraySize();
        Value::Array items;
        items.reserve(n);
        for (std::size_t i = 0; i < n; i++) {
            items.push_back(to_value(reader[i], depth + 1));
        }
        return Value::array(std::move(items));
    }

    throw zerialize::DeserializationError("zschema: unsupported value in input");
}

template <zerialize::Protocol P>
zerialize::ZBuffer pack(const Value& value)
{
    zerialize::ZBuffer buffer = zerialize::serialize<P>(value);
    get_logger()->trace("packed {} bytes of {}", buffer.size(), P::Name);
    return buffer;
}

template <zerialize::Protocol P>
Value unpack(std::span<const std::uint8_t> bytes)
{
    get_logger()->trace("unpacking {} bytes of {}", bytes.size(), P::Name);
    typename P::Deserializer reader(bytes);
    return to_value(reader);
}

} // namespace zschema
