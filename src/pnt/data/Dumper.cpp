// Dumper.cpp created on 2019-03-11 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Dumper.h"
#include <pnt/core/string.h>
#include <pnt/core/sys.h>

#include <fmt/chrono.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace pnt::data {

using namespace pnt::core;

static constexpr size_t c_max_dumped_bytes = 32;


static std::string timestamp_to_string(Timestamp ts)
{
    constexpr int64_t ticks_per_second = Ticks::period::den;
    const int64_t ticks = ts.time_since_epoch().count();
    int64_t secs = ticks / ticks_per_second;
    int64_t frac = ticks % ticks_per_second;
    if (frac < 0) {
        secs -= 1;
        frac += ticks_per_second;
    }
    const auto tm = gmtime(std::time_t(secs));
    if (frac == 0)
        return fmt::format("{:%FT%T}Z", tm);
    return fmt::format("{:%FT%T}.{:07}Z", tm, frac);
}


static std::string bytes_to_string(const Bytes& bytes)
{
    std::string res;
    const size_t n = std::min(bytes.size(), c_max_dumped_bytes);
    for (size_t i = 0; i != n; ++i) {
        if (i != 0)
            res += ' ';
        res += fmt::format("{:02x}", unsigned(bytes[i]));
    }
    if (n < bytes.size())
        res += " ...";
    return res;
}


std::string scalar_to_string(const Value& value)
{
    using Type = BinaryBase::Type;
    switch (value.type()) {
        case Type::Null: return "null";
        case Type::Bool: return value.as_bool() ? "true" : "false";
        case Type::Int8: return std::to_string(value.as<int8_t>());
        case Type::Int16: return std::to_string(value.as<int16_t>());
        case Type::Int32: return std::to_string(value.as<int32_t>());
        case Type::Int64: return std::to_string(value.as<int64_t>());
        case Type::UInt8: return std::to_string(value.as<uint8_t>());
        case Type::UInt16: return std::to_string(value.as<uint16_t>());
        case Type::UInt32: return std::to_string(value.as<uint32_t>());
        case Type::UInt64: return std::to_string(value.as<uint64_t>());
        case Type::Float32: return fmt::format("{}", value.as<float>());
        case Type::Float64: return fmt::format("{}", value.as<double>());
        case Type::String: return '"' + escape(value.as_string(), true) + '"';
        case Type::Bytes: return bytes_to_string(value.as_bytes());
        case Type::Array: return fmt::format("({})", value.as_array().size());
        case Type::Object: return fmt::format("({})", value.as_object().size());
        case Type::Timestamp: return timestamp_to_string(value.as<Timestamp>());
        case Type::Duration: return fmt::format("{} ticks", value.as<Duration>().count());
        case Type::Reference: return fmt::format("#{}", value.as<Reference>().id);
        case Type::Decimal: return value.as<Decimal>().to_string();
    }
    return {};
}


void Dumper::dump_value(const Value& value, unsigned level)
{
    m_stream << value.type_name();
    if (!value.is_null())
        m_stream << ' ' << scalar_to_string(value);

    if (const auto* array = value.get_if<Array>(); array && !array->empty()) {
        m_stream << ":\n";
        for (const auto& item : *array) {
            m_stream << indent(level + 1);
            dump_value(item, level + 1);
        }
        return;
    }
    if (const auto* object = value.get_if<Object>(); object && !object->empty()) {
        m_stream << ":\n";
        for (const auto& [key, item] : *object) {
            m_stream << indent(level + 1) << '"' << escape(key, true) << "\": ";
            dump_value(item, level + 1);
        }
        return;
    }
    m_stream << '\n';
}


void Dumper::dump(const Header& header)
{
    static constexpr std::pair<BinaryBase::Flags, const char*> flag_names[] = {
            {BinaryBase::FlagCompressed, "Compressed"},
            {BinaryBase::FlagEncrypted, "Encrypted"},
            {BinaryBase::FlagIndexed, "Indexed"},
            {BinaryBase::FlagValidated, "Validated"},
            {BinaryBase::FlagStreaming, "Streaming"},
    };
    std::string names;
    for (const auto& [flag, name] : flag_names) {
        if (header.has_flag(flag)) {
            if (!names.empty())
                names += ", ";
            names += name;
        }
    }

    m_stream << fmt::format("PNT {}.{}.{}\n", header.version_major, header.version_minor, header.version_patch);
    m_stream << fmt::format("flags: {:#010x}", header.flags);
    if (!names.empty())
        m_stream << " (" << names << ')';
    m_stream << '\n';
    m_stream << fmt::format("data: offset {}, size {}\n", header.data_offset, header.data_size);
    m_stream << fmt::format("index: offset {}, size {}\n", header.index_offset, header.index_size);
    m_stream << fmt::format("checksum: {:08x}\n", header.checksum);
}


template <class T>
static std::string dump_to_string(const T& obj)
{
    std::ostringstream os;
    Dumper(os).dump(obj);
    auto res = os.str();
    if (!res.empty() && res.back() == '\n')
        res.pop_back();
    return res;
}


std::string to_string(const Value& value) { return dump_to_string(value); }
std::string to_string(const Header& header) { return dump_to_string(header); }


} // namespace pnt::data
