#include <zschema/builders.hpp>

namespace zschema {

RecordLikePtr as_record_like(const SchemaPtr& schema)
{
    return std::dynamic_pointer_cast<const RecordLike>(schema);
}

static RecordLikePtr require_record_like(const std::string& owner, const SchemaPtr& schema)
{
    if (!schema) {
        throw invalid_schema(owner, "referenced schema is null");
    }
    RecordLikePtr record_like = as_record_like(schema);
    if (!record_like) {
        throw invalid_schema(owner, "schema " + schema->name() + " is not record-like");
    }
    return record_like;
}

SchemaPtr boolean(std::string name, std::optional<bool> literal)
{
    return std::make_shared<const BoolType>(std::move(name), literal);
}

SchemaPtr bytes(std::string name)
{
    return std::make_shared<const BytesType>(std::move(name));
}

SchemaPtr optional(SchemaPtr inner)
{
    return std::make_shared<const OptionalType>(std::move(inner));
}

SchemaPtr record(std::string name, FieldTable fields)
{
    return std::make_shared<const RecordType>(std::move(name), std::move(fields));
}

SchemaPtr extend(std::string name, SchemaPtr base, FieldTable fields)
{
    RecordLikePtr record_like = require_record_like(name, base);
    return std::make_shared<const ExtendType>(std::move(name), std::move(record_like), std::move(fields));
}

SchemaPtr union_of(std::string name, std::string discriminator, std::vector<SchemaPtr> branches)
{
    std::vector<RecordLikePtr> record_likes;
    record_likes.reserve(branches.size());
    for (const auto& branch : branches) {
        record_likes.push_back(require_record_like(name, branch));
    }
    return std::make_shared<const UnionType>(std::move(name), std::move(discriminator), std::move(record_likes));
}

SchemaPtr list(std::string name, SchemaPtr item)
{
    return std::make_shared<const ListType>(std::move(name), std::move(item));
}

} // namespace zschema
