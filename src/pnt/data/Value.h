// Value.h created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_VALUE_H
#define PNT_DATA_VALUE_H

#include "BinaryBase.h"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pnt::data {


class Value;

using Null = std::monostate;
using Bytes = std::vector<std::byte>;
using Array = std::vector<Value>;

/// One tick is 100 nanoseconds (the resolution of .NET DateTime / TimeSpan).
using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10'000'000>>;

/// Signed time span, in ticks.
using Duration = Ticks;

/// UTC instant, in ticks since Unix epoch (1970-01-01T00:00:00Z).
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Ticks>;


/// Opaque 64-bit identifier. Its meaning is defined by the consumer.
struct Reference {
    uint64_t id = 0;

    bool operator==(const Reference&) const = default;
};


/// 128-bit exact decimal in the .NET `decimal.GetBits()` layout:
/// 96-bit unsigned mantissa (lo, mid, hi) and flags word
/// with scale (power of ten divisor) in bits 16-23 and sign in bit 31.
/// Value = (-1)^sign * mantissa / 10^scale
///
/// Comparison is bitwise: 1.0 and 1.00 are different values.
struct Decimal {
    uint32_t lo = 0;
    uint32_t mid = 0;
    uint32_t hi = 0;
    uint32_t flags = 0;

    static constexpr uint32_t SignMask = 0x8000'0000;
    static constexpr uint32_t ScaleMask = 0x00FF'0000;
    static constexpr unsigned ScaleShift = 16;
    static constexpr uint8_t MaxScale = 28;

    static constexpr Decimal from_parts(uint32_t lo, uint32_t mid, uint32_t hi, bool negative, uint8_t scale) {
        return {lo, mid, hi, (negative ? SignMask : 0) | (uint32_t(scale) << ScaleShift)};
    }

    /// Integer with optional scale, e.g. from_int(-12345, 2) = -123.45
    static Decimal from_int(int64_t mantissa, uint8_t scale = 0);

    uint8_t scale() const { return uint8_t((flags & ScaleMask) >> ScaleShift); }
    bool is_negative() const { return (flags & SignMask) != 0; }

    /// Unused flag bits must be zero and scale must be in 0..28
    bool is_valid() const { return (flags & ~(SignMask | ScaleMask)) == 0 && scale() <= MaxScale; }

    /// Exact decimal notation, e.g. "-123.45"
    std::string to_string() const;

    bool operator==(const Decimal&) const = default;
};


/// String-keyed collection of values. Keys are unique.
/// Insertion order is preserved (and used for encoding),
/// but it's not significant for comparison.
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;
    using iterator = std::vector<Entry>::iterator;

    Object() = default;

    /// Throws EncodingError on duplicate key.
    Object(std::initializer_list<Entry> init);

    /// Add new entry to the back.
    /// Throws EncodingError if the key already exists.
    Value& add(std::string key, Value value);

    /// Find item, or add new null item if not found.
    Value& operator[](std::string_view key);

    /// Get existing item. Throws std::out_of_range if it doesn't exist.
    const Value& at(std::string_view key) const;
    Value& at(std::string_view key);

    const Value* find(std::string_view key) const;
    Value* find(std::string_view key);
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Remove the entry, keep order of the others.
    bool erase(std::string_view key);

    const_iterator begin() const noexcept { return m_entries.begin(); }
    const_iterator end() const noexcept { return m_entries.end(); }
    iterator begin() noexcept { return m_entries.begin(); }
    iterator end() noexcept { return m_entries.end(); }

    size_t size() const noexcept { return m_entries.size(); }
    bool empty() const noexcept { return m_entries.empty(); }
    void reserve(size_t n);

    bool operator==(const Object& rhs) const;

private:
    std::vector<Entry> m_entries;
    std::unordered_map<std::string, size_t> m_index;  // key -> position in m_entries
};


/// Typed value, the unit of encoding.
/// The variant index is the same as the type tag on wire.
class Value {
public:
    using Type = BinaryBase::Type;
    using Variant = std::variant<
            Null, bool,
            int8_t, int16_t, int32_t, int64_t,
            uint8_t, uint16_t, uint32_t, uint64_t,
            float, double,
            std::string, Bytes, Array, Object,
            Timestamp, Duration, Reference, Decimal>;

    Value() = default;
    Value(Null) {}
    Value(bool v) : m_value(v) {}
    Value(int8_t v) : m_value(v) {}
    Value(int16_t v) : m_value(v) {}
    Value(int32_t v) : m_value(v) {}
    Value(int64_t v) : m_value(v) {}
    Value(uint8_t v) : m_value(v) {}
    Value(uint16_t v) : m_value(v) {}
    Value(uint32_t v) : m_value(v) {}
    Value(uint64_t v) : m_value(v) {}
    Value(float v) : m_value(v) {}
    Value(double v) : m_value(v) {}
    Value(const char* v) : m_value(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : m_value(std::in_place_type<std::string>, v) {}
    Value(std::string v) : m_value(std::move(v)) {}
    Value(Bytes v) : m_value(std::move(v)) {}
    Value(Array v) : m_value(std::move(v)) {}
    Value(Object v) : m_value(std::move(v)) {}
    Value(Timestamp v) : m_value(v) {}
    Value(Duration v) : m_value(v) {}
    Value(Reference v) : m_value(v) {}
    Value(Decimal v) : m_value(v) {}

    Type type() const { return Type(m_value.index()); }
    const char* type_name() const { return type_to_cstr(type()); }

    // -------------------------------------------------------------------------
    // Check type of value

    template <typename T> bool is() const { return std::holds_alternative<T>(m_value); }

    bool is_null() const { return is<Null>(); }
    bool is_bool() const { return is<bool>(); }
    bool is_string() const { return is<std::string>(); }
    bool is_bytes() const { return is<Bytes>(); }
    bool is_array() const { return is<Array>(); }
    bool is_object() const { return is<Object>(); }

    // -------------------------------------------------------------------------
    // Access value - the actual type must match! (std::bad_variant_access)

    template <typename T> T& as() { return std::get<T>(m_value); }
    template <typename T> const T& as() const { return std::get<T>(m_value); }

    bool as_bool() const { return std::get<bool>(m_value); }
    const std::string& as_string() const { return std::get<std::string>(m_value); }
    const Bytes& as_bytes() const { return std::get<Bytes>(m_value); }
    const Array& as_array() const { return std::get<Array>(m_value); }
    const Object& as_object() const { return std::get<Object>(m_value); }
    std::string& as_string() { return std::get<std::string>(m_value); }
    Bytes& as_bytes() { return std::get<Bytes>(m_value); }
    Array& as_array() { return std::get<Array>(m_value); }
    Object& as_object() { return std::get<Object>(m_value); }

    /// Access the value, or nullptr if the type doesn't match
    template <typename T> const T* get_if() const { return std::get_if<T>(&m_value); }
    template <typename T> T* get_if() { return std::get_if<T>(&m_value); }

    template <class F> decltype(auto) visit(F&& f) const { return std::visit(std::forward<F>(f), m_value); }
    template <class F> decltype(auto) visit(F&& f) { return std::visit(std::forward<F>(f), m_value); }

    const Variant& variant() const { return m_value; }

    /// Strict comparison, without conversion: Int32(1) != Int64(1)
    bool operator==(const Value& rhs) const;

private:
    Variant m_value;
};

static_assert(std::variant_size_v<Value::Variant> == BinaryBase::LastType + 1,
              "Every type tag must have its variant alternative");


} // namespace pnt::data

#endif // include guard
