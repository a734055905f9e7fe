#include <zschema/types.hpp>

#include <utility>

namespace zschema {

/*
 * Field tables must have unique names and non-null schemas.
 */
static FieldTable checked_fields(const std::string& schema_name, FieldTable fields)
{
    FieldNameSet seen;
    for (const auto& [field, schema] : fields) {
        if (!schema) {
            throw invalid_schema(schema_name, "field \"" + field + "\" has no schema");
        }
        if (!seen.insert(field).second) {
            throw invalid_schema(schema_name, "duplicate field \"" + field + "\"");
        }
    }
    return fields;
}

RecordType::RecordType(std::string name, FieldTable fields)
    : RecordLike(std::move(name))
    , fields_(checked_fields(this->name(), std::move(fields)))
{
}

const Schema* RecordType::find_field(std::string_view field) const
{
    for (const auto& [key, schema] : fields_) {
        if (key == field) {
            return schema.get();
        }
    }
    return nullptr;
}

bool RecordType::has_field(std::string_view field) const
{
    return find_field(field) != nullptr;
}

Value RecordType::validate_field(std::string_view field, const Value& value) const
{
    const Schema* schema = find_field(field);
    if (schema == nullptr) {
        throw unknown_field(name(), field);
    }
    return schema->validate(value);
}

std::vector<std::string> RecordType::field_names() const
{
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& entry : fields_) {
        names.push_back(entry.first);
    }
    return names;
}

Value RecordType::do_validate(const Value& value, const FieldNameSet& ignored) const
{
    const Value::Map* input = as_map(value);
    if (input == nullptr) {
        throw not_an_object(name(), value);
    }

    static const Value absent;

    // Output holds exactly the declared, non-ignored fields.
    Value::Map result;
    result.reserve(fields_.size());
    for (const auto& [field, schema] : fields_) {
        if (ignored.contains(field)) {
            continue;
        }

        const Value* entry = find_entry(*input, field);
        try {
            result.emplace_back(field, schema->validate(entry ? *entry : absent));
        } catch (SchemaError& error) {
            error.prepend_field(field);
            throw;
        }
    }
    return Value::map(std::move(result));
}

} // namespace zschema
