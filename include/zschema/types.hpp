#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <zschema/logging.hpp>
#include <zschema/schema.hpp>

namespace zschema {

// ---- scalars ----------------------------------------------------------------

class BoolType final : public Schema {
public:
    BoolType(std::string name, std::optional<bool> literal);

    const std::optional<bool>& literal() const noexcept { return literal_; }

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    std::optional<bool> literal_;
};

class StringType final : public Schema {
public:
    StringType(std::string name, std::vector<std::string> literals);

    const std::vector<std::string>& literals() const noexcept { return literals_; }

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    std::vector<std::string> literals_;
};

/*
 * Number literals match by exact equality, with one exception: a NaN literal
 * admits NaN. +0 and -0 are the same literal.
 */
class NumberType final : public Schema {
public:
    NumberType(std::string name, std::vector<double> literals);

    const std::vector<double>& literals() const noexcept { return literals_; }

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    bool is_literal(double number) const;

    std::vector<double> literals_;
};

class BytesType final : public Schema {
public:
    explicit BytesType(std::string name);

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;
};

// ---- optional ---------------------------------------------------------------

// Absent passes as absent; anything else goes to the inner schema.
class OptionalType final : public Schema {
public:
    explicit OptionalType(SchemaPtr inner);

    const SchemaPtr& inner() const noexcept { return inner_; }

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    SchemaPtr inner_;
};

// ---- records ----------------------------------------------------------------

class RecordType final : public RecordLike {
public:
    RecordType(std::string name, FieldTable fields);

    const FieldTable& fields() const noexcept { return fields_; }

    bool has_field(std::string_view field) const override;
    Value validate_field(std::string_view field, const Value& value) const override;
    std::vector<std::string> field_names() const override;

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    const Schema* find_field(std::string_view field) const;

    FieldTable fields_;
};

/*
 * ExtendType
 * ----------
 * A base record-like schema plus fields of its own. Own fields shadow base
 * fields of the same name: the base is validated with those names ignored,
 * then the own fields are validated and merged over the base result.
 */
class ExtendType final : public RecordLike {
public:
    ExtendType(std::string name, RecordLikePtr base, FieldTable fields);

    const RecordLikePtr& base() const noexcept { return base_; }
    const FieldTable& own_fields() const noexcept { return own_.fields(); }

    bool has_field(std::string_view field) const override;
    Value validate_field(std::string_view field, const Value& value) const override;
    std::vector<std::string> field_names() const override;

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    RecordLikePtr base_;
    RecordType own_;
    FieldNameSet own_names_;
};

/*
 * UnionType
 * ---------
 * Discriminated union of record-like branches. Every branch must declare
 * the discriminator field; this is checked at construction.
 *
 * Resolution probes the branches in declaration order, validating only the
 * discriminator (all other branch fields ignored). The caller's ignored set
 * plays no part in selection. The first branch whose probe passes is
 * selected and the value is validated against it in full.
 * When several branches accept a value, the earliest declared wins.
 */
class UnionType final : public RecordLike {
public:
    UnionType(std::string name, std::string discriminator, std::vector<RecordLikePtr> branches);

    const std::string& discriminator() const noexcept { return discriminator_; }
    const std::vector<RecordLikePtr>& branches() const noexcept { return branches_; }

    // Branch that would be used for `value`, or nullptr when none accepts it.
    const RecordLike* select_branch(const Value& value) const;

    // True only if every branch declares the field.
    bool has_field(std::string_view field) const override;

    // Validates against every branch declaring the field; the last one's
    // result is returned.
    Value validate_field(std::string_view field, const Value& value) const override;

    // Field names shared by all branches, in first-branch order.
    std::vector<std::string> field_names() const override;

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    std::string discriminator_;
    std::vector<RecordLikePtr> branches_;
    std::vector<FieldNameSet> probe_ignored_;  // per branch
    LoggerPtr logger_;
};

// ---- lists ------------------------------------------------------------------

class ListType final : public Schema {
public:
    ListType(std::string name, SchemaPtr item);

    const SchemaPtr& item() const noexcept { return item_; }

protected:
    Value do_validate(const Value& value, const FieldNameSet& ignored) const override;

private:
    SchemaPtr item_;
};

} // namespace zschema
