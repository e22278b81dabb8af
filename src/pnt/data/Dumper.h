// Dumper.h created on 2019-03-11 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_DUMPER_H
#define PNT_DATA_DUMPER_H

#include "Header.h"
#include "Value.h"

#include <fmt/format.h>

#include <ostream>
#include <string>

namespace pnt::data {


/// Writes values and headers to a stream in human-readable form.
///
/// The format is custom, text-based. Example:
///
///     Object (3):
///         "name": String "svc"
///         "port": UInt16 8080
///         "tags": Array (2):
///             String "a"
///             String "b"
///
/// Scalar types:
/// - integers, floats (123, 1.23)
/// - bool (false/true)
/// - string ("escaped text")
/// - bytes (hex, the first 32 bytes)
/// - decimal (exact: -123.45)
/// - timestamp (ISO 8601 UTC with 100ns fraction)
/// - duration (ticks)
///
class Dumper {
public:
    explicit Dumper(std::ostream& os) : m_stream(os) {}

    void dump(const Value& value) { dump_value(value, 0); }
    void dump(const Header& header);

private:
    void dump_value(const Value& value, unsigned level);
    std::string indent(unsigned level) const { return std::string(level * 4, ' '); }

    std::ostream& m_stream;
};


/// Format one value (without the type name for scalars),
/// e.g. "2024-01-02T03:04:05Z" for Timestamp.
std::string scalar_to_string(const Value& value);

/// Multi-line dump as produced by Dumper, without the trailing newline.
std::string to_string(const Value& value);
std::string to_string(const Header& header);


} // namespace pnt::data


template <>
struct fmt::formatter<pnt::data::Value> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pnt::data::Value& value, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(pnt::data::to_string(value), ctx);
    }
};

template <>
struct fmt::formatter<pnt::data::Header> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pnt::data::Header& header, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(pnt::data::to_string(header), ctx);
    }
};


#endif // include guard
