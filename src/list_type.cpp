#include <zschema/types.hpp>

#include <utility>

namespace zschema {

ListType::ListType(std::string name, SchemaPtr item)
    : Schema(std::move(name))
    , item_(std::move(item))
{
    if (!item_) {
        throw invalid_schema(this->name(), "list item schema is null");
    }
}

Value ListType::do_validate(const Value& value, const FieldNameSet&) const
{
    const Value::Array* input = as_array(value);
    if (input == nullptr) {
        throw not_an_array(name(), value);
    }

    Value::Array result;
    result.reserve(input->size());
    for (std::size_t i = 0; i < input->size(); i++) {
        try {
            result.push_back(item_->validate((*input)[i]));
        } catch (SchemaError& error) {
            error.prepend_index(i);
            throw;
        }
    }
    return Value::array(std::move(result));
}

} // namespace zschema
