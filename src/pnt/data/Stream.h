// Stream.h created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_DATA_STREAM_H
#define PNT_DATA_STREAM_H

#include "BinaryBase.h"
#include "Crc32.h"
#include <pnt/core/NonCopyable.h>

#include <istream>
#include <ostream>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include <cstdint>

namespace pnt::data {


/// Underlying byte source (file, socket, memory...)
class Source {
public:
    virtual ~Source() = default;

    /// Read up to `size` bytes into `buffer`.
    /// May return less than requested even if more data will follow
    /// (e.g. a socket). Returns 0 only at the end of stream.
    /// Throws StreamError on I/O error.
    virtual size_t read_some(std::byte* buffer, size_t size) = 0;
};


/// Underlying byte sink
class Sink {
public:
    virtual ~Sink() = default;

    /// Write all `size` bytes. Throws StreamError on I/O error.
    virtual void write(const std::byte* data, size_t size) = 0;

    virtual void flush() {}
};


class MemorySource final : public Source {
public:
    explicit MemorySource(std::span<const std::byte> data) : m_data(data) {}

    size_t read_some(std::byte* buffer, size_t size) override;

private:
    std::span<const std::byte> m_data;
};


class IstreamSource final : public Source {
public:
    explicit IstreamSource(std::istream& is) : m_stream(is) {}

    size_t read_some(std::byte* buffer, size_t size) override;

private:
    std::istream& m_stream;
};


/// Reads from POSIX file descriptor (file, pipe, socket).
/// Doesn't own the descriptor.
class FdSource final : public Source {
public:
    explicit FdSource(int fd) : m_fd(fd) {}

    size_t read_some(std::byte* buffer, size_t size) override;

private:
    int m_fd;
};


class VectorSink final : public Sink {
public:
    explicit VectorSink(std::vector<std::byte>& buffer) : m_buffer(buffer) {}

    void write(const std::byte* data, size_t size) override;

private:
    std::vector<std::byte>& m_buffer;
};


class OstreamSink final : public Sink {
public:
    explicit OstreamSink(std::ostream& os) : m_stream(os) {}

    void write(const std::byte* data, size_t size) override;
    void flush() override;

private:
    std::ostream& m_stream;
};


/// Writes to POSIX file descriptor, doesn't own it.
class FdSink final : public Sink {
public:
    explicit FdSink(int fd) : m_fd(fd) {}

    void write(const std::byte* data, size_t size) override;

private:
    int m_fd;
};


/// Buffered reading from a Source.
///
/// Reads are served from an internal buffer, which is refilled from the source
/// as needed. Short reads from the source are retried until the requested data
/// is available, only a zero-length read is taken as the end of stream.
/// Reading past the end throws TruncationError, there are no partial reads.
///
/// Optional limit restricts the reader to a byte range of the stream
/// (e.g. the data section), reads crossing the limit throw TruncationError
/// without touching the source.
class BufferedReader : private core::NonCopyable {
public:
    explicit BufferedReader(Source& source, size_t buffer_size = BinaryBase::DefaultBufferSize);
    BufferedReader(BufferedReader&&) noexcept = default;
    BufferedReader& operator=(BufferedReader&&) noexcept = default;

    /// Read exactly `size` bytes
    void read(std::byte* buffer, size_t size);
    std::byte get_byte();
    std::byte peek_byte();

    /// Read and discard `size` bytes
    void skip(uint64_t size);

    /// True if there is no more data (or the limit was reached).
    /// May block to fill the buffer.
    bool at_end();

    /// Absolute position in the stream (number of bytes consumed)
    uint64_t position() const { return m_position; }

    /// Set absolute position where the reading must stop.
    void set_limit(uint64_t end_position) { m_limit = end_position; }
    void clear_limit() { m_limit.reset(); }
    std::optional<uint64_t> limit() const { return m_limit; }

    /// Bytes remaining until the limit, or nullopt without limit
    std::optional<uint64_t> remaining() const;

    /// Start computing CRC-32 of consumed bytes
    void start_crc() { m_crc.emplace(); }
    void stop_crc() { m_crc.reset(); }
    uint32_t crc() const { return m_crc ? m_crc->as_uint32() : 0; }

    /// Release the buffer. The reader can't be used after this.
    void close() { m_buffer.reset(); }
    bool is_closed() const { return !m_buffer; }

private:
    void check_open() const;
    void check_limit(uint64_t size) const;
    size_t available() const { return m_end - m_begin; }
    bool fill(size_t need);
    void consume(std::byte* out, size_t size);

    Source* m_source;
    std::unique_ptr<std::byte[]> m_buffer;
    size_t m_capacity;
    size_t m_begin = 0;  // first unread byte in buffer
    size_t m_end = 0;    // end of valid data in buffer
    uint64_t m_position = 0;
    std::optional<uint64_t> m_limit;
    std::optional<Crc32> m_crc;
};


/// Buffered writing to a Sink.
///
/// Data is collected in an internal buffer and passed to the sink
/// when the buffer is full, on `flush()` and on `close()`.
/// The destructor closes the writer if it wasn't closed explicitly.
class BufferedWriter : private core::NonCopyable {
public:
    explicit BufferedWriter(Sink& sink, size_t buffer_size = BinaryBase::DefaultBufferSize);
    BufferedWriter(BufferedWriter&&) noexcept = default;
    BufferedWriter& operator=(BufferedWriter&&) = delete;
    ~BufferedWriter();

    void write(const std::byte* data, size_t size);
    void put_byte(std::byte b);

    /// Pass all buffered data to the sink and flush the sink.
    void flush();

    /// Flush and release the buffer. Further writes throw StreamError.
    void close();
    bool is_closed() const { return !m_buffer; }

    /// Absolute position in the output stream (number of bytes written)
    uint64_t position() const { return m_position; }

    /// Start computing CRC-32 of written bytes
    void start_crc() { m_crc.emplace(); }
    void stop_crc() { m_crc.reset(); }
    uint32_t crc() const { return m_crc ? m_crc->as_uint32() : 0; }

private:
    void check_open() const;
    void flush_buffer();

    Sink* m_sink;
    std::unique_ptr<std::byte[]> m_buffer;
    size_t m_capacity;
    size_t m_size = 0;
    uint64_t m_position = 0;
    std::optional<Crc32> m_crc;
};


} // namespace pnt::data

#endif // include guard
