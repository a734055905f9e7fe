#include <zschema/types.hpp>

#include <utility>

namespace zschema {

static const std::string& inner_name(const SchemaPtr& inner)
{
    if (!inner) {
        throw invalid_schema("optional", "inner schema is null");
    }
    return inner->name();
}

OptionalType::OptionalType(SchemaPtr inner)
    : Schema(inner_name(inner))
    , inner_(std::move(inner))
{
}

Value OptionalType::do_validate(const Value& value, const FieldNameSet& ignored) const
{
    if (is_absent(value)) {
        return Value();
    }
    return inner_->validate(value, ignored);
}

} // namespace zschema
