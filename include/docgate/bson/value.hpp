/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file value.hpp
 * @brief Tagged-variant model of untrusted document trees.
 *
 * @details
 * Every filter, pipeline and document handled by the gateway is represented as a
 * `bson::Value`: a closed `std::variant` over scalar kinds (including identifiers, dates
 * and binary payloads) and the two container kinds, `Document` (ordered mapping) and
 * `Array` (sequence).
 *
 * Traversals dispatch on the variant with `if constexpr` chains that end in
 * `static_assert(always_false_v<T>)`. Adding a new alternative to `Value::Storage` turns
 * every traversal that forgot to handle it into a compile error.
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace docgate::bson {

/// @brief Helper for exhaustive `if constexpr` visitors.
template <typename> inline constexpr bool always_false_v = false;

/**
 * @struct Null
 * @brief The JSON `null` scalar.
 */
struct Null {
    bool operator==(const Null&) const { return true; }
    bool operator!=(const Null&) const { return false; }
};

/**
 * @class ObjectId
 * @brief 12-byte document identifier.
 *
 * The canonical string form is 24 lower-case hexadecimal digits.
 */
class ObjectId {
  public:
    using Bytes = std::array<std::uint8_t, 12>;

    ObjectId() : bytes_{} {}
    explicit ObjectId(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Creates a fresh identifier from `infra::IdGenerator`.
    static ObjectId generate();

    /**
     * @brief Parses the canonical 24-digit hex form (either case).
     * @return `std::nullopt` if the input is not exactly 24 hex digits.
     */
    static std::optional<ObjectId> parse(const std::string& hex);

    /// @brief Canonical string form.
    std::string to_string() const;

    const Bytes& bytes() const { return bytes_; }

    bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }

  private:
    Bytes bytes_;
};

/**
 * @struct DateTime
 * @brief UTC instant in milliseconds since the Unix epoch.
 */
struct DateTime {
    std::int64_t millis = 0;

    bool operator==(const DateTime& other) const { return millis == other.millis; }
    bool operator!=(const DateTime& other) const { return millis != other.millis; }
};

/**
 * @struct Binary
 * @brief Opaque byte payload with a subtype tag.
 */
struct Binary {
    std::uint8_t subtype = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const Binary& other) const
    {
        return subtype == other.subtype && data == other.data;
    }
    bool operator!=(const Binary& other) const { return !(*this == other); }
};

class Value;

/// @brief Sequence container.
using Array = std::vector<Value>;

/**
 * @class Document
 * @brief Ordered mapping from field name to value.
 *
 * @details
 * Insertion order is preserved: stage documents, sort specifications and index keys
 * depend on it. Lookups are linear.
 */
class Document {
  public:
    using Field = std::pair<std::string, Value>;
    using iterator = std::vector<Field>::iterator;
    using const_iterator = std::vector<Field>::const_iterator;

    Document() = default;
    Document(std::initializer_list<Field> fields);

    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    iterator begin() { return fields_.begin(); }
    iterator end() { return fields_.end(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    /// @brief First field, used for single-key stage documents. Undefined when empty.
    const Field& front() const { return fields_.front(); }

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    /// @brief Returns the value stored under `key`, or `nullptr`.
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    /// @brief Replaces the value under `key`, or appends it as the last field.
    void set(const std::string& key, Value value);

    /// @brief Appends without checking for an existing key.
    void append(std::string key, Value value);

    /// @brief Removes `key`. Returns false if it was absent.
    bool erase(const std::string& key);

    bool operator==(const Document& other) const;
    bool operator!=(const Document& other) const { return !(*this == other); }

  private:
    std::vector<Field> fields_;
};

/**
 * @enum Type
 * @brief Discriminator of `Value`, in `Value::Storage` alternative order.
 */
enum class Type {
    NULL_VALUE,
    BOOL,
    INT64,
    DOUBLE,
    STRING,
    OBJECT_ID,
    DATE_TIME,
    BINARY,
    DOCUMENT,
    ARRAY
};

/// @brief Type alias names as used by the `$type` query operator ("objectId", "date", ...).
const char* type_name(Type type);

/**
 * @class Value
 * @brief A node of an untrusted document tree.
 */
class Value {
  public:
    using Storage = std::variant<Null, bool, std::int64_t, double, std::string, ObjectId,
                                 DateTime, Binary, Document, Array>;

    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(ObjectId oid) : data_(oid) {}
    Value(DateTime dt) : data_(dt) {}
    Value(Binary bin) : data_(std::move(bin)) {}
    Value(Document doc) : data_(std::move(doc)) {}
    Value(Array arr) : data_(std::move(arr)) {}

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_int64() const { return std::holds_alternative<std::int64_t>(data_); }
    bool is_double() const { return std::holds_alternative<double>(data_); }
    bool is_number() const { return is_int64() || is_double(); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_object_id() const { return std::holds_alternative<ObjectId>(data_); }
    bool is_date_time() const { return std::holds_alternative<DateTime>(data_); }
    bool is_binary() const { return std::holds_alternative<Binary>(data_); }
    bool is_document() const { return std::holds_alternative<Document>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }

    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_int64() const { return std::get<std::int64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const ObjectId& as_object_id() const { return std::get<ObjectId>(data_); }
    const DateTime& as_date_time() const { return std::get<DateTime>(data_); }
    const Binary& as_binary() const { return std::get<Binary>(data_); }
    const Document& as_document() const { return std::get<Document>(data_); }
    Document& as_document() { return std::get<Document>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }

    /// @brief Numeric value of an Int64 or Double. Throws `std::bad_variant_access` otherwise.
    double as_number() const { return is_int64() ? static_cast<double>(as_int64()) : as_double(); }

    /// @brief Truthiness as used by `$exists`, projections and `$unwind` options.
    bool truthy() const;

    const Storage& storage() const { return data_; }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

  private:
    Storage data_;
};

/**
 * @brief Total order over values, following the document-store convention.
 *
 * Cross-type ordering: null < numbers < string < document < array < binary <
 * objectId < bool < date. Int64 and Double compare numerically against each other.
 *
 * @return negative, zero or positive.
 */
int compare(const Value& lhs, const Value& rhs);

// ----------------------------------------------------------------------------
// Document inline members (need the complete Value type)
// ----------------------------------------------------------------------------

inline Document::Document(std::initializer_list<Field> fields) : fields_(fields) {}

inline bool Document::operator==(const Document& other) const
{
    return fields_ == other.fields_;
}

} // namespace docgate::bson
