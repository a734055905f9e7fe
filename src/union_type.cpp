#include <zschema/types.hpp>

#include <algorithm>
#include <optional>
#include <utility>

namespace zschema {

UnionType::UnionType(std::string name, std::string discriminator, std::vector<RecordLikePtr> branches)
    : RecordLike(std::move(name))
    , discriminator_(std::move(discriminator))
    , branches_(std::move(branches))
    , logger_(get_logger())
{
    if (branches_.empty()) {
        throw invalid_schema(this->name(), "union has no branches");
    }

    probe_ignored_.reserve(branches_.size());
    for (const auto& branch : branches_) {
        if (!branch) {
            throw invalid_schema(this->name(), "union branch is null");
        }
        if (!branch->has_field(discriminator_)) {
            throw missing_discriminator(this->name(), branch->name(), discriminator_);
        }

        // A probe checks the discriminator and nothing else.
        FieldNameSet probe_ignored;
        for (auto& field : branch->field_names()) {
            if (field != discriminator_) {
                probe_ignored.insert(std::move(field));
            }
        }
        probe_ignored_.push_back(std::move(probe_ignored));
    }

    logger_->debug("union {} on \"{}\" with {} branch(es)", this->name(), discriminator_, branches_.size());
}

const RecordLike* UnionType::select_branch(const Value& value) const
{
    for (std::size_t i = 0; i < branches_.size(); i++) {
        try {
            branches_[i]->validate(value, probe_ignored_[i]);
        } catch (const SchemaError&) {
            continue;  // probe failures are not reported
        }
        logger_->trace("union {} selected branch {} ({})", name(), i, branches_[i]->name());
        return branches_[i].get();
    }
    return nullptr;
}

bool UnionType::has_field(std::string_view field) const
{
    return std::all_of(branches_.begin(), branches_.end(),
                       [field](const RecordLikePtr& branch) { return branch->has_field(field); });
}

Value UnionType::validate_field(std::string_view field, const Value& value) const
{
    std::optional<Value> result;
    for (const auto& branch : branches_) {
        if (branch->has_field(field)) {
            result = branch->validate_field(field, value);
        }
    }
    if (!result.has_value()) {
        throw unknown_field(name(), field);
    }
    return std::move(*result);
}

std::vector<std::string> UnionType::field_names() const
{
    std::vector<std::string> names = branches_.front()->field_names();
    names.erase(std::remove_if(names.begin(), names.end(),
                               [this](const std::string& field) { return !has_field(field); }),
                names.end());
    return names;
}

Value UnionType::do_validate(const Value& value, const FieldNameSet& ignored) const
{
    // Selection always sees the real discriminator, even when an extension
    // shadows it; only the chosen branch honors `ignored`.
    const RecordLike* branch = select_branch(value);
    if (branch == nullptr) {
        throw no_matching_branch(name(), value);
    }
    return branch->validate(value, ignored);
}

} // namespace zschema
