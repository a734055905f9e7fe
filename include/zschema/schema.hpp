#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <zerialize/concepts.hpp>
#include <zerialize/zbuffer.hpp>

#include <zschema/codec.hpp>
#include <zschema/errors.hpp>
#include <zschema/value.hpp>

namespace zschema {

class Schema;
class RecordLike;

using SchemaPtr     = std::shared_ptr<const Schema>;
using RecordLikePtr = std::shared_ptr<const RecordLike>;

// Field name -> schema, kept in declaration order.
using FieldTable = std::vector<std::pair<std::string, SchemaPtr>>;

// Names a record-like schema skips while validating.
using FieldNameSet = std::set<std::string, std::less<>>;

/*
 * Schema
 * ------
 * Immutable description of an accepted value shape. validate() checks a
 * value and returns its sanitized copy (records drop undeclared fields,
 * scalars come back unchanged), throwing SchemaError on the first problem.
 *
 * serialize/deserialize wrap validate() around the codec, in both
 * directions, for any zerialize protocol.
 */
class Schema {
public:
    virtual ~Schema() = default;

    Schema(const Schema&)            = delete;
    Schema& operator=(const Schema&) = delete;

    const std::string& name() const noexcept { return name_; }

    Value validate(const Value& value, const FieldNameSet& ignored = {}) const
    {
        return do_validate(value, ignored);
    }

    template <zerialize::Protocol P = DefaultProtocol>
    zerialize::ZBuffer serialize(const Value& value) const
    {
        return pack<P>(validate(value));
    }

    template <zerialize::Protocol P = DefaultProtocol>
    Value deserialize(std::span<const std::uint8_t> bytes) const
    {
        return validate(unpack<P>(bytes));
    }

    template <zerialize::Protocol P = DefaultProtocol>
    Value deserialize(const zerialize::ZBuffer& buffer) const
    {
        return deserialize<P>(buffer.buf());
    }

protected:
    explicit Schema(std::string name) : name_(std::move(name)) {}

    // `ignored` only matters to record-like schemas; scalars and lists
    // never see a non-empty set.
    virtual Value do_validate(const Value& value, const FieldNameSet& ignored) const = 0;

private:
    std::string name_;
};

/*
 * RecordLike
 * ----------
 * Schemas whose values are maps of named fields: records, extensions and
 * unions. Extensions build on them and unions use them as branches.
 */
class RecordLike : public Schema {
public:
    virtual bool has_field(std::string_view field) const = 0;

    // Validates `value` against the schema of one field.
    virtual Value validate_field(std::string_view field, const Value& value) const = 0;

    // Every field name the schema validates, in declaration order.
    virtual std::vector<std::string> field_names() const = 0;

protected:
    using Schema::Schema;
};

} // namespace zschema
