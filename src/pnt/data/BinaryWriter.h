// BinaryWriter.h created on 2019-03-13 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_BINARY_WRITER_H
#define PNT_DATA_BINARY_WRITER_H

#include "BinaryBase.h"
#include "Header.h"
#include "Stream.h"
#include "Value.h"
#include <pnt/core/NonCopyable.h>

#include <ostream>
#include <memory>

namespace pnt::data {


/// Encodes PNT header and values to a byte sink.
///
///     std::vector<std::byte> out;
///     VectorSink sink(out);
///     BinaryWriter writer(sink);
///     writer.write_value(Object{{"port", uint16_t(8080)}});
///     writer.close();
///
/// The output is buffered, call `flush()` or `close()` to pass it to the sink.
/// The destructor closes the writer.
class BinaryWriter : private core::NonCopyable {
public:
    explicit BinaryWriter(Sink& sink, const WriterOptions& options = {});
    explicit BinaryWriter(std::ostream& os, const WriterOptions& options = {});

    /// Write the 64-byte header, with computed checksum.
    void write_header(const Header& header);

    /// Write one tagged value (recursively for Array, Object).
    /// Each value is validated before its tag is written.
    void write_value(const Value& value);

    /// Write varint length. Throws EncodingError for length >= 2^35.
    void write_length(uint64_t length);

    /// Write raw bytes, without tag or length
    void write_raw(const std::byte* data, size_t size) { m_stream.write(data, size); }
    void write_raw(std::span<const std::byte> data) { m_stream.write(data.data(), data.size()); }

    void flush() { m_stream.flush(); }
    void close() { m_stream.close(); }

    uint64_t position() const { return m_stream.position(); }

    BufferedWriter& stream() { return m_stream; }
    const WriterOptions& options() const { return m_options; }

private:
    void write_value(const Value& value, unsigned depth);
    void write_string(std::string_view str);
    void write_tag(BinaryBase::Type type) { m_stream.put_byte(std::byte(type)); }

    template <typename T> void write_le(T value);

    WriterOptions m_options;
    std::unique_ptr<Sink> m_own_sink;
    BufferedWriter m_stream;
};


/// Number of bytes `write_value` produces for the value.
/// The value is not validated.
uint64_t encoded_size(const Value& value);


} // namespace pnt::data

#endif // include guard
