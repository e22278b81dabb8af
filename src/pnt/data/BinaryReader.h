// BinaryReader.h created on 2019-03-14 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_BINARY_READER_H
#define PNT_DATA_BINARY_READER_H

#include "BinaryBase.h"
#include "Header.h"
#include "Stream.h"
#include "Value.h"
#include <pnt/core/NonCopyable.h>

#include <istream>
#include <memory>
#include <optional>

namespace pnt::data {


/// Decodes PNT header and values from a byte source.
///
///     MemorySource source(bytes);
///     BinaryReader reader(source);
///     Header header = reader.read_header();
///     Value config = reader.read_value();
///
/// All errors are fatal to the decode, the reader state is undefined
/// after an exception.
class BinaryReader : private core::NonCopyable {
public:
    explicit BinaryReader(Source& source, const ReaderOptions& options = {});
    explicit BinaryReader(std::istream& is, const ReaderOptions& options = {});

    /// Read and check the 64-byte header.
    /// The magic is checked first, before reading the rest.
    Header read_header();

    /// Read one tagged value (recursively for Array, Object).
    Value read_value();

    /// Read varint length (max. 5 groups)
    uint64_t read_length();

    /// Read raw bytes, without tag or length
    void read_raw(std::byte* buffer, size_t size) { m_stream.read(buffer, size); }
    Bytes read_raw(uint64_t size);

    /// Skip forward to absolute position
    void skip_to(uint64_t position);

    uint64_t position() const { return m_stream.position(); }
    bool at_end() { return m_stream.at_end(); }

    /// Limit reading to the absolute position (byte budget).
    /// Lengths and counts which can't fit in the budget
    /// are rejected immediately.
    void set_limit(uint64_t end_position) { m_stream.set_limit(end_position); }
    void clear_limit() { m_stream.clear_limit(); }

    BufferedReader& stream() { return m_stream; }
    const ReaderOptions& options() const { return m_options; }

private:
    Value read_value(unsigned depth);
    std::string read_string();
    void check_count(uint64_t count, unsigned min_item_size);

    template <typename T> T read_le();
    template <class C> void read_payload(C& out, uint64_t size);

    ReaderOptions m_options;
    std::unique_ptr<Source> m_own_source;
    BufferedReader m_stream;
};


} // namespace pnt::data

#endif // include guard
