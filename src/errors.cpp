#include <zschema/errors.hpp>

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace zschema {

SchemaError::SchemaError(ErrorKind kind,
                         std::string schema_name,
                         std::string expected,
                         Value value,
                         const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
    , schema_name_(std::move(schema_name))
    , expected_(std::move(expected))
    , value_(std::move(value))
{
}

std::string SchemaError::path() const
{
    std::string json_path = "$";
    for (const auto& element : path_) {
        if (element.array_index == std::numeric_limits<std::size_t>::max()) {
            json_path += "." + element.field_name;
        } else {
            json_path += fmt::format("[{}]", element.array_index);
        }
    }
    return json_path;
}

void SchemaError::prepend_field(std::string_view field)
{
    PathElement element;
    element.field_name = std::string(field);
    path_.insert(path_.begin(), std::move(element));
}

void SchemaError::prepend_index(std::size_t index)
{
    PathElement element;
    element.array_index = index;
    path_.insert(path_.begin(), std::move(element));
}

static std::string mismatch_message(const std::string& schema_name, std::string_view expected, const Value& value)
{
    return fmt::format("Expected {} to be {} but found type {} instead, with value {}",
                       schema_name, expected, kind_name(kind_of(value)), render_value(value));
}

SchemaError type_mismatch(const std::string& schema_name, std::string_view expected, const Value& value)
{
    return SchemaError(ErrorKind::TypeMismatch, schema_name, std::string(expected), value,
                       mismatch_message(schema_name, expected, value));
}

SchemaError literal_mismatch(const std::string& schema_name, std::string_view allowed, const Value& value)
{
    return SchemaError(ErrorKind::LiteralMismatch, schema_name, std::string(allowed), value,
                       fmt::format("Expected {} to be one of values [{}] but found {} instead",
                                   schema_name, allowed, render_value(value)));
}

SchemaError bool_literal_mismatch(const std::string& schema_name, bool literal, const Value& value)
{
    const std::string_view expected = literal ? "true" : "false";
    return SchemaError(ErrorKind::LiteralMismatch, schema_name, std::string(expected), value,
                       mismatch_message(schema_name, expected, value));
}

SchemaError not_an_object(const std::string& schema_name, const Value& value)
{
    return SchemaError(ErrorKind::NotAnObject, schema_name, "object", value,
                       mismatch_message(schema_name, "object", value));
}

SchemaError not_an_array(const std::string& schema_name, const Value& value)
{
    return SchemaError(ErrorKind::NotAnArray, schema_name, "array", value,
                       mismatch_message(schema_name, "array", value));
}

SchemaError no_matching_branch(const std::string& schema_name, const Value& value)
{
    return SchemaError(ErrorKind::NoMatchingBranch, schema_name, "union", value,
                       mismatch_message(schema_name, "union", value));
}

SchemaError missing_discriminator(const std::string& union_name,
                                  const std::string& branch_name,
                                  const std::string& discriminator)
{
    return SchemaError(ErrorKind::MissingDiscriminator, union_name, discriminator, Value(),
                       fmt::format("Subschema \"{}\" of union type \"{}\" is missing discriminator property \"{}\"",
                                   branch_name, union_name, discriminator));
}

SchemaError invalid_schema(const std::string& schema_name, const std::string& reason)
{
    return SchemaError(ErrorKind::InvalidSchema, schema_name, reason, Value(),
                       fmt::format("Invalid schema {}: {}", schema_name, reason));
}

SchemaError unknown_field(const std::string& schema_name, std::string_view field)
{
    return SchemaError(ErrorKind::UnknownField, schema_name, std::string(field), Value(),
                       fmt::format("Schema {} has no field \"{}\"", schema_name, field));
}

} // namespace zschema
