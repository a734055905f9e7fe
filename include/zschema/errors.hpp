#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <zschema/value.hpp>

namespace zschema {

enum class ErrorKind {
    TypeMismatch,
    LiteralMismatch,
    NotAnObject,
    NotAnArray,
    MissingDiscriminator,
    NoMatchingBranch,
    InvalidSchema,
    UnknownField
};

constexpr std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TypeMismatch:         return "TypeMismatch";
    case ErrorKind::LiteralMismatch:      return "LiteralMismatch";
    case ErrorKind::NotAnObject:          return "NotAnObject";
    case ErrorKind::NotAnArray:           return "NotAnArray";
    case ErrorKind::MissingDiscriminator: return "MissingDiscriminator";
    case ErrorKind::NoMatchingBranch:     return "NoMatchingBranch";
    case ErrorKind::InvalidSchema:        return "InvalidSchema";
    case ErrorKind::UnknownField:         return "UnknownField";
    }
    return "N/A";
}

/*
 * SchemaError
 * -----------
 * The one failure type of schema construction and validation. Carries the
 * schema name, what was expected, the offending value and the location of
 * the failure inside the validated value.
 *
 * Records and lists prepend their field name / element index while the
 * error unwinds, so path() reads outermost first: "$.items[2].name".
 * what() stays the message of the innermost check.
 */
class SchemaError : public std::runtime_error {
public:
    SchemaError(ErrorKind kind,
                std::string schema_name,
                std::string expected,
                Value value,
                const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& schema_name() const noexcept { return schema_name_; }
    const std::string& expected() const noexcept { return expected_; }
    const Value& value() const noexcept { return value_; }

    std::string path() const;

    void prepend_field(std::string_view field);
    void prepend_index(std::size_t index);

private:
    struct PathElement {
        std::size_t array_index = std::numeric_limits<std::size_t>::max();
        std::string field_name;
    };

    ErrorKind kind_;
    std::string schema_name_;
    std::string expected_;
    Value value_;
    std::vector<PathElement> path_;  // innermost last
};

// Factories for the failures raised by the built-in types.
SchemaError type_mismatch(const std::string& schema_name, std::string_view expected, const Value& value);
SchemaError literal_mismatch(const std::string& schema_name, std::string_view allowed, const Value& value);
SchemaError bool_literal_mismatch(const std::string& schema_name, bool literal, const Value& value);
SchemaError not_an_object(const std::string& schema_name, const Value& value);
SchemaError not_an_array(const std::string& schema_name, const Value& value);
SchemaError no_matching_branch(const std::string& schema_name, const Value& value);
SchemaError missing_discriminator(const std::string& union_name,
                                  const std::string& branch_name,
                                  const std::string& discriminator);
SchemaError invalid_schema(const std::string& schema_name, const std::string& reason);
SchemaError unknown_field(const std::string& schema_name, std::string_view field);

} // namespace zschema
