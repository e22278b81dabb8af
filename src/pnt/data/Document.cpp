// Document.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Document.h"
#include "BinaryReader.h"
#include "BinaryWriter.h"
#include <pnt/compat/bit.h>
#include <pnt/core/log.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <limits>

namespace pnt::data {

using namespace pnt::core;

using FooterBytes = std::array<std::byte, BinaryBase::FooterSize>;


static FooterBytes encode_footer(uint32_t file_size, uint32_t crc)
{
    FooterBytes bytes {};
    std::byte* p = std::copy_n(BinaryBase::FooterMagic, sizeof(BinaryBase::FooterMagic), bytes.data());
    le_write(p, file_size);
    le_write(p, crc);
    return bytes;
}


Header write_document(Sink& sink, const Document& doc, const DocumentOptions& options)
{
    Header header = doc.header;
    uint64_t data_size = 0;
    for (const auto& value : doc.values)
        data_size += encoded_size(value);
    header.data_offset = BinaryBase::HeaderSize;
    header.data_size = data_size;
    if (doc.index.empty()) {
        header.index_offset = 0;
        header.index_size = 0;
    } else {
        header.index_offset = header.data_offset + data_size;
        header.index_size = doc.index.size();
    }
    header.set_flag(BinaryBase::FlagIndexed, !doc.index.empty());
    header.set_flag(BinaryBase::FlagValidated, options.footer);

    uint64_t file_size = header.data_offset + header.data_size + header.index_size;
    if (options.footer) {
        file_size += BinaryBase::FooterSize;
        if (file_size > std::numeric_limits<uint32_t>::max())
            throw EncodingError(fmt::format("File too large for footer ({} bytes)", file_size));
    }
    log::debug("Writing document: {} values, data {}+{}, index {}+{}, footer: {}",
               doc.values.size(), header.data_offset, header.data_size,
               header.index_offset, header.index_size, options.footer);

    BinaryWriter writer(sink, options.writer);
    writer.stream().start_crc();
    writer.write_header(header);
    for (const auto& value : doc.values)
        writer.write_value(value);
    writer.write_raw(doc.index);
    if (options.footer) {
        const auto footer = encode_footer(uint32_t(file_size), writer.stream().crc());
        writer.write_raw(footer);
    }
    writer.close();
    return header;
}


static void read_footer(BinaryReader& reader)
{
    const uint32_t computed = reader.stream().crc();
    const auto offset = reader.position();
    FooterBytes bytes;
    reader.read_raw(bytes.data(), bytes.size());
    if (std::memcmp(bytes.data(), BinaryBase::FooterMagic, sizeof(BinaryBase::FooterMagic)) != 0)
        throw FormatError("Bad footer magic", offset);

    const std::byte* p = bytes.data() + sizeof(BinaryBase::FooterMagic);
    const auto file_size = le_read<uint32_t>(p);
    const auto stored = le_read<uint32_t>(p);
    const auto actual_size = offset + BinaryBase::FooterSize;
    if (file_size != actual_size)
        throw CorruptionError(fmt::format("Footer file size mismatch (stored {}, actual {})",
                                          file_size, actual_size));
    if (stored != computed)
        throw BadChecksum(stored, computed);
}


Document read_document(Source& source, const DocumentOptions& options)
{
    BinaryReader reader(source, options.reader);
    reader.stream().start_crc();

    Document doc;
    doc.header = reader.read_header();
    const Header& header = doc.header;

    if (header.data_offset < BinaryBase::HeaderSize)
        throw FormatError(fmt::format("Data offset {} points into header", header.data_offset),
                          reader.position());
    if (header.data_size > std::numeric_limits<uint64_t>::max() - header.data_offset)
        throw FormatError(fmt::format("Data size {} out of range", header.data_size),
                          reader.position());
    const uint64_t data_end = header.data_offset + header.data_size;

    reader.skip_to(header.data_offset);
    reader.set_limit(data_end);
    while (reader.position() < data_end)
        doc.values.push_back(reader.read_value());
    reader.clear_limit();

    if (header.index_size != 0) {
        if (header.index_offset < data_end)
            throw FormatError(fmt::format("Index offset {} precedes end of data {}",
                                          header.index_offset, data_end), reader.position());
        reader.skip_to(header.index_offset);
        doc.index = reader.read_raw(header.index_size);
    }

    if (header.has_flag(BinaryBase::FlagValidated))
        read_footer(reader);

    log::debug("Read document: {} values, {} bytes index", doc.values.size(), doc.index.size());
    return doc;
}


Bytes encode_document(const Document& doc, const DocumentOptions& options)
{
    Bytes out;
    VectorSink sink(out);
    write_document(sink, doc, options);
    return out;
}


Document decode_document(std::span<const std::byte> data, const DocumentOptions& options)
{
    MemorySource source(data);
    return read_document(source, options);
}


void save_document(const fs::path& path, const Document& doc, const DocumentOptions& options)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        log::error("Cannot open {} for writing: {m}", path.string());
        throw StreamError(fmt::format("Cannot open {} for writing", path.string()));
    }
    OstreamSink sink(f);
    write_document(sink, doc, options);
}


Document load_document(const fs::path& path, const DocumentOptions& options)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        log::error("Cannot open {} for reading: {m}", path.string());
        throw StreamError(fmt::format("Cannot open {} for reading", path.string()));
    }
    IstreamSource source(f);
    return read_document(source, options);
}


} // namespace pnt::data
