#include <zschema/types.hpp>

#include <utility>

namespace zschema {

static RecordLikePtr checked_base(const std::string& name, RecordLikePtr base)
{
    if (!base) {
        throw invalid_schema(name, "extension base is null");
    }
    return base;
}

ExtendType::ExtendType(std::string name, RecordLikePtr base, FieldTable fields)
    : RecordLike(std::move(name))
    , base_(checked_base(this->name(), std::move(base)))
    , own_(this->name(), std::move(fields))
{
    for (const auto& entry : own_.fields()) {
        own_names_.insert(entry.first);
    }
    get_logger()->debug("extension {} of {} with {} own field(s)",
                        this->name(), base_->name(), own_names_.size());
}

bool ExtendType::has_field(std::string_view field) const
{
    return own_.has_field(field) || base_->has_field(field);
}

Value ExtendType::validate_field(std::string_view field, const Value& value) const
{
    if (own_.has_field(field)) {
        return own_.validate_field(field, value);
    }
    return base_->validate_field(field, value);
}

std::vector<std::string> ExtendType::field_names() const
{
    std::vector<std::string> names;
    for (const auto& field : base_->field_names()) {
        if (!own_names_.contains(field)) {
            names.push_back(field);
        }
    }
    for (const auto& entry : own_.fields()) {
        names.push_back(entry.first);
    }
    return names;
}

Value ExtendType::do_validate(const Value& value, const FieldNameSet& ignored) const
{
    FieldNameSet base_ignored = own_names_;
    base_ignored.insert(ignored.begin(), ignored.end());

    Value base_result = base_->validate(value, base_ignored);
    Value own_result = own_.validate(value, ignored);

    // Both are maps here: the base and the own record each reject non-maps.
    Value::Map merged = *as_map(base_result);
    for (const auto& [field, child] : *as_map(own_result)) {
        bool replaced = false;
        for (auto& entry : merged) {
            if (entry.first == field) {
                entry.second = child;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            merged.emplace_back(field, child);
        }
    }
    return Value::map(std::move(merged));
}

} // namespace zschema
