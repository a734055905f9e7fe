#include <zschema/value.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace zschema {

ValueKind kind_of(const Value& value)
{
    return std::visit([](const auto& arg) {
        using T = std::remove_cvref_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return ValueKind::Absent;
        } else if constexpr (std::is_same_v<T, bool>) {
            return ValueKind::Boolean;
        } else if constexpr (std::is_same_v<T, std::int64_t> ||
                             std::is_same_v<T, std::uint64_t> ||
                             std::is_same_v<T, double>) {
            return ValueKind::Number;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return ValueKind::String;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return ValueKind::Bytes;
        } else if constexpr (std::is_same_v<T, Value::Map>) {
            return ValueKind::Map;
        } else if constexpr (std::is_same_v<T, Value::Array>) {
            return ValueKind::Array;
        } else {
            return ValueKind::Opaque;
        }
    }, value.storage());
}

std::string_view kind_name(ValueKind kind)
{
    switch (kind) {
        case ValueKind::Absent:  return "undefined";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number:  return "number";
        case ValueKind::String:  return "string";
        case ValueKind::Bytes:   return "bytes";
        case ValueKind::Map:     return "object";
        case ValueKind::Array:   return "array";
        case ValueKind::Opaque:  return "object";
    }
    return "unknown";
}

const bool* as_bool(const Value& value)
{
    return std::get_if<bool>(&value.storage());
}

std::optional<double> as_number(const Value& value)
{
    const auto& storage = value.storage();
    if (const auto* d = std::get_if<double>(&storage)) {
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&storage)) {
        return static_cast<double>(*i);
    }
    if (const auto* u = std::get_if<std::uint64_t>(&storage)) {
        return static_cast<double>(*u);
    }
    return std::nullopt;
}

const std::string* as_string(const Value& value)
{
    return std::get_if<std::string>(&value.storage());
}

const Bytes* as_bytes(const Value& value)
{
    return std::get_if<Bytes>(&value.storage());
}

const Value::Map* as_map(const Value& value)
{
    return std::get_if<Value::Map>(&value.storage());
}

const Value::Array* as_array(const Value& value)
{
    return std::get_if<Value::Array>(&value.storage());
}

const Value* find_entry(const Value::Map& map, std::string_view key)
{
    for (const auto& [k, v] : map) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

static bool number_equal(double lhs, double rhs)
{
    if (std::isnan(lhs) || std::isnan(rhs)) {
        return std::isnan(lhs) && std::isnan(rhs);
    }
    return lhs == rhs;
}

bool value_equal(const Value& lhs, const Value& rhs)
{
    const ValueKind kind = kind_of(lhs);
    if (kind != kind_of(rhs)) {
        return false;
    }

    switch (kind) {
        case ValueKind::Absent:
            return true;
        case ValueKind::Boolean:
            return *as_bool(lhs) == *as_bool(rhs);
        case ValueKind::Number:
            return number_equal(*as_number(lhs), *as_number(rhs));
        case ValueKind::String:
            return *as_string(lhs) == *as_string(rhs);
        case ValueKind::Bytes:
            return *as_bytes(lhs) == *as_bytes(rhs);
        case ValueKind::Array: {
            const auto& a = *as_array(lhs);
            const auto& b = *as_array(rhs);
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); i++) {
                if (!value_equal(a[i], b[i])) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::Map: {
            const auto& a = *as_map(lhs);
            const auto& b = *as_map(rhs);
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& [key, child] : a) {
                const Value* other = find_entry(b, key);
                if (other == nullptr || !value_equal(child, *other)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::Opaque:
            return false;
    }
    return false;
}

std::string render_number(double number)
{
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    // Integral values print without a fractional part.
    constexpr double int_limit = 9007199254740992.0;  // 2^53
    if (std::trunc(number) == number && std::fabs(number) < int_limit) {
        return fmt::format("{}", static_cast<std::int64_t>(number));
    }
    return fmt::format("{}", number);
}

static void append_quoted(std::string& out, std::string_view s)
{
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
}

static void render_into(std::string& out, const Value& value, std::size_t depth)
{
    if (depth > MaxNestingDepth) {
        out += "...";
        return;
    }
    switch (kind_of(value)) {
        case ValueKind::Absent:
            out += "undefined";
            break;
        case ValueKind::Boolean:
            out += *as_bool(value) ? "true" : "false";
            break;
        case ValueKind::Number:
            out += render_number(*as_number(value));
            break;
        case ValueKind::String:
            append_quoted(out, *as_string(value));
            break;
        case ValueKind::Bytes:
            out += fmt::format("<{} bytes>", as_bytes(value)->size());
            break;
        case ValueKind::Array: {
            out += '[';
            bool first = true;
            for (const auto& child : *as_array(value)) {
                if (!first) {
                    out += ',';
                }
                first = false;
                render_into(out, child, depth + 1);
            }
            out += ']';
            break;
        }
        case ValueKind::Map: {
            out += '{';
            bool first = true;
            for (const auto& [key, child] : *as_map(value)) {
                if (!first) {
                    out += ',';
                }
                first = false;
                append_quoted(out, key);
                out += ':';
                render_into(out, child, depth + 1);
            }
            out += '}';
            break;
        }
        case ValueKind::Opaque:
            out += "<serializable>";
            break;
    }
}

std::string render_value(const Value& value)
{
    std::string out;
    render_into(out, value, 0);
    return out;
}

} // namespace zschema
