#include <zschema/types.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace zschema {

/*
 * Comma separated literal list for LiteralMismatch messages:
 * strings quoted, numbers as plain numbers.
 */
static std::string join_literals(const std::vector<std::string>& literals)
{
    std::string out;
    for (const auto& literal : literals) {
        if (!out.empty()) {
            out += ", ";
        }
        out += render_value(Value(literal));
    }
    return out;
}

static std::string join_literals(const std::vector<double>& literals)
{
    std::string out;
    for (double literal : literals) {
        if (!out.empty()) {
            out += ", ";
        }
        out += render_number(literal);
    }
    return out;
}

BoolType::BoolType(std::string name, std::optional<bool> literal)
    : Schema(std::move(name))
    , literal_(literal)
{
}

Value BoolType::do_validate(const Value& value, const FieldNameSet&) const
{
    const bool* b = as_bool(value);
    if (b == nullptr) {
        throw type_mismatch(name(), "boolean", value);
    }
    if (literal_.has_value() && *b != *literal_) {
        throw bool_literal_mismatch(name(), *literal_, value);
    }
    return value;
}

StringType::StringType(std::string name, std::vector<std::string> literals)
    : Schema(std::move(name))
    , literals_(std::move(literals))
{
}

Value StringType::do_validate(const Value& value, const FieldNameSet&) const
{
    const std::string* s = as_string(value);
    if (s == nullptr) {
        throw type_mismatch(name(), "string", value);
    }
    if (!literals_.empty() &&
        std::find(literals_.begin(), literals_.end(), *s) == literals_.end()) {
        throw literal_mismatch(name(), join_literals(literals_), value);
    }
    return value;
}

NumberType::NumberType(std::string name, std::vector<double> literals)
    : Schema(std::move(name))
    , literals_(std::move(literals))
{
}

bool NumberType::is_literal(double number) const
{
    if (std::isnan(number)) {
        return std::any_of(literals_.begin(), literals_.end(),
                           [](double literal) { return std::isnan(literal); });
    }
    return std::find(literals_.begin(), literals_.end(), number) != literals_.end();
}

Value NumberType::do_validate(const Value& value, const FieldNameSet&) const
{
    const std::optional<double> n = as_number(value);
    if (!n.has_value()) {
        throw type_mismatch(name(), "number", value);
    }
    if (!literals_.empty() && !is_literal(*n)) {
        throw literal_mismatch(name(), join_literals(literals_), value);
    }
    return value;
}

BytesType::BytesType(std::string name)
    : Schema(std::move(name))
{
}

Value BytesType::do_validate(const Value& value, const FieldNameSet&) const
{
    if (as_bytes(value) == nullptr) {
        throw type_mismatch(name(), "bytes", value);
    }
    return value;
}

} // namespace zschema
