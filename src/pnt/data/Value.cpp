// Value.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Value.h"
#include <pnt/compat/int128.h>

#include <algorithm>
#include <stdexcept>

namespace pnt::data {


const char* type_to_cstr(BinaryBase::Type type)
{
    using Type = BinaryBase::Type;
    switch (type) {
        case Type::Null:      return "Null";
        case Type::Bool:      return "Bool";
        case Type::Int8:      return "Int8";
        case Type::Int16:     return "Int16";
        case Type::Int32:     return "Int32";
        case Type::Int64:     return "Int64";
        case Type::UInt8:     return "UInt8";
        case Type::UInt16:    return "UInt16";
        case Type::UInt32:    return "UInt32";
        case Type::UInt64:    return "UInt64";
        case Type::Float32:   return "Float32";
        case Type::Float64:   return "Float64";
        case Type::String:    return "String";
        case Type::Bytes:     return "Bytes";
        case Type::Array:     return "Array";
        case Type::Object:    return "Object";
        case Type::Timestamp: return "Timestamp";
        case Type::Duration:  return "Duration";
        case Type::Reference: return "Reference";
        case Type::Decimal:   return "Decimal";
    }
    return "Unknown";
}


Decimal Decimal::from_int(int64_t mantissa, uint8_t scale)
{
    const bool negative = mantissa < 0;
    const uint64_t magnitude = negative ? uint64_t(0) - uint64_t(mantissa) : uint64_t(mantissa);
    return from_parts(uint32_t(magnitude), uint32_t(magnitude >> 32), 0, negative, scale);
}


std::string Decimal::to_string() const
{
    const uint128 mantissa = (uint128(hi) << 64) | (uint128(mid) << 32) | uint128(lo);
    std::string digits = uint128_to_string(mantissa);
    const size_t sc = scale();
    if (sc > 0) {
        if (digits.size() <= sc)
            digits.insert(0, sc - digits.size() + 1, '0');
        digits.insert(digits.size() - sc, 1, '.');
    }
    if (is_negative())
        digits.insert(0, 1, '-');
    return digits;
}


// -----------------------------------------------------------------------------
// Object


Object::Object(std::initializer_list<Entry> init)
{
    reserve(init.size());
    for (const auto& [key, value] : init)
        add(key, value);
}


Value& Object::add(std::string key, Value value)
{
    auto [it, inserted] = m_index.try_emplace(key, m_entries.size());
    if (!inserted)
        throw EncodingError(fmt::format("Duplicate object key \"{}\"", key));
    return m_entries.emplace_back(std::move(key), std::move(value)).second;
}


Value& Object::operator[](std::string_view key)
{
    if (auto* v = find(key))
        return *v;
    return add(std::string(key), Value{});
}


const Value& Object::at(std::string_view key) const
{
    if (const auto* v = find(key))
        return *v;
    throw std::out_of_range(fmt::format("Object key \"{}\" not found", key));
}


Value& Object::at(std::string_view key)
{
    if (auto* v = find(key))
        return *v;
    throw std::out_of_range(fmt::format("Object key \"{}\" not found", key));
}


const Value* Object::find(std::string_view key) const
{
    auto it = m_index.find(std::string(key));
    if (it == m_index.end())
        return nullptr;
    return &m_entries[it->second].second;
}


Value* Object::find(std::string_view key)
{
    auto it = m_index.find(std::string(key));
    if (it == m_index.end())
        return nullptr;
    return &m_entries[it->second].second;
}


bool Object::erase(std::string_view key)
{
    auto it = m_index.find(std::string(key));
    if (it == m_index.end())
        return false;
    const size_t pos = it->second;
    m_index.erase(it);
    m_entries.erase(m_entries.begin() + ptrdiff_t(pos));
    // shift positions of the following entries
    for (auto& [k, idx] : m_index) {
        if (idx > pos)
            --idx;
    }
    return true;
}


void Object::reserve(size_t n)
{
    m_entries.reserve(n);
    m_index.reserve(n);
}


bool Object::operator==(const Object& rhs) const
{
    if (size() != rhs.size())
        return false;
    return std::all_of(m_entries.begin(), m_entries.end(), [&rhs](const Entry& entry) {
        const auto* other = rhs.find(entry.first);
        return other != nullptr && *other == entry.second;
    });
}


// -----------------------------------------------------------------------------
// Value


bool Value::operator==(const Value& rhs) const
{
    return m_value == rhs.m_value;
}


} // namespace pnt::data
