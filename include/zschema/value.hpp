#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <zerialize/serialize.hpp>
#include <zerialize/dynamic.hpp>

namespace zschema {

/*
 * Plain values
 * ------------
 * Schemas validate and produce zerialize dynamic values, the same type the
 * codec packs. The canonical "absent" value is the default-constructed
 * (null) Value; a missing map key reads as absent too.
 *
 * Numbers may arrive as int64, uint64 or double depending on the codec and
 * on how the caller built the value. They are all one "number" kind here.
 */
using Value = zerialize::dyn::Value;
using Bytes = std::vector<std::byte>;

// Deepest map/array nesting accepted from a decoder and rendered in messages.
inline constexpr std::size_t MaxNestingDepth = 256;

enum class ValueKind {
    Absent,
    Boolean,
    Number,
    String,
    Bytes,
    Map,
    Array,
    Opaque
};

ValueKind kind_of(const Value& value);

// Type word used in error messages ("boolean", "object", "undefined", ...).
std::string_view kind_name(ValueKind kind);

inline bool is_absent(const Value& value) { return kind_of(value) == ValueKind::Absent; }

const bool* as_bool(const Value& value);
std::optional<double> as_number(const Value& value);
const std::string* as_string(const Value& value);
const Bytes* as_bytes(const Value& value);
const Value::Map* as_map(const Value& value);
const Value::Array* as_array(const Value& value);

// First entry with the given key, or nullptr.
const Value* find_entry(const Value::Map& map, std::string_view key);

/*
 * Structural equality.
 * Maps compare by key regardless of entry order, numbers compare by value
 * across int/uint/double storage, and NaN equals NaN so that round-trips of
 * NaN compare equal. Opaque serializable payloads never compare equal.
 */
bool value_equal(const Value& lhs, const Value& rhs);

// JSON-like rendering for diagnostics. Absent renders as "undefined".
std::string render_value(const Value& value);

// Number formatting shared by render_value and literal lists.
std::string render_number(double number);

} // namespace zschema
