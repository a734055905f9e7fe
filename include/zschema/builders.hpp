#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <zschema/schema.hpp>
#include <zschema/types.hpp>

namespace zschema {

/*
 * Builders
 * --------
 * Schemas are composed once, top-down, from these calls:
 *
 *   auto user = record("user", {
 *       {"id",       str("id")},
 *       {"role",     str("role", "admin", "guest")},
 *       {"nickname", optional(str("nickname"))},
 *   });
 *
 * Every builder returns a shared, immutable node that may be reused by any
 * number of parents. Construction problems throw SchemaError.
 */

SchemaPtr boolean(std::string name, std::optional<bool> literal = std::nullopt);

template <class... Literals>
SchemaPtr str(std::string name, Literals&&... literals)
{
    return std::make_shared<const StringType>(
        std::move(name), std::vector<std::string>{std::string(std::forward<Literals>(literals))...});
}

template <class... Literals>
requires ((std::is_arithmetic_v<Literals> || std::is_enum_v<Literals>) && ...)
SchemaPtr num(std::string name, Literals... literals)
{
    return std::make_shared<const NumberType>(
        std::move(name), std::vector<double>{static_cast<double>(literals)...});
}

SchemaPtr bytes(std::string name);

SchemaPtr optional(SchemaPtr inner);

SchemaPtr record(std::string name, FieldTable fields);

// `base` must be record-like (record, extend or union).
SchemaPtr extend(std::string name, SchemaPtr base, FieldTable fields);

// Every branch must be record-like and declare `discriminator`.
SchemaPtr union_of(std::string name, std::string discriminator, std::vector<SchemaPtr> branches);

SchemaPtr list(std::string name, SchemaPtr item);

// Record-like view of a schema, or nullptr.
RecordLikePtr as_record_like(const SchemaPtr& schema);

} // namespace zschema
