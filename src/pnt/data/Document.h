// Document.h created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_DOCUMENT_H
#define PNT_DATA_DOCUMENT_H

#include "BinaryBase.h"
#include "Header.h"
#include "Stream.h"
#include "Value.h"

#include <filesystem>
#include <span>
#include <vector>

namespace pnt::data {

namespace fs = std::filesystem;


/// Whole PNT file: header, data section (values back to back),
/// optional index section (opaque bytes) and optional footer.
///
/// File layout written by `write_document`:
///
///     [0, 64)         header
///     [64, +data)     values
///     [.., +index)    index (only if not empty, sets FlagIndexed)
///     [.., +16)       footer (only if enabled, sets FlagValidated)
///
/// Footer: magic "\0TNP", u32 file size (including footer),
///         u32 CRC-32 of all preceding bytes, 4 reserved bytes.
struct Document {
    Header header;
    std::vector<Value> values;
    Bytes index;

    bool operator==(const Document&) const = default;
};


struct DocumentOptions {
    ReaderOptions reader;
    WriterOptions writer;
    bool footer = false;  // write footer with whole-file CRC
};


/// Compute the layout, write the document and close the writer.
/// \returns    the header as written (with computed offsets, sizes and flags)
Header write_document(Sink& sink, const Document& doc, const DocumentOptions& options = {});

/// Read a document. Verifies the footer when the header has FlagValidated.
Document read_document(Source& source, const DocumentOptions& options = {});

/// In-memory variants
Bytes encode_document(const Document& doc, const DocumentOptions& options = {});
Document decode_document(std::span<const std::byte> data, const DocumentOptions& options = {});

/// File variants. Throw StreamError if the file can't be opened.
void save_document(const fs::path& path, const Document& doc, const DocumentOptions& options = {});
Document load_document(const fs::path& path, const DocumentOptions& options = {});


} // namespace pnt::data

#endif // include guard
