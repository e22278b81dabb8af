// Stream.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Stream.h"
#include <pnt/core/log.h>
#include <pnt/core/sys.h>

#include <algorithm>
#include <cstring>
#include <cerrno>

#include <unistd.h>

namespace pnt::data {

using namespace pnt::core;


size_t MemorySource::read_some(std::byte* buffer, size_t size)
{
    const size_t n = std::min(size, m_data.size());
    if (n != 0)
        std::memcpy(buffer, m_data.data(), n);
    m_data = m_data.subspan(n);
    return n;
}


size_t IstreamSource::read_some(std::byte* buffer, size_t size)
{
    if (m_stream.eof())
        return 0;
    m_stream.read(reinterpret_cast<char*>(buffer), std::streamsize(size));
    if (m_stream.bad())
        throw StreamError("Error reading from input stream");
    return size_t(m_stream.gcount());
}


size_t FdSource::read_some(std::byte* buffer, size_t size)
{
    for (;;) {
        const ssize_t r = ::read(m_fd, buffer, size);
        if (r >= 0)
            return size_t(r);
        if (errno == EINTR)
            continue;
        const int err = errno;
        log::error("read({}, {} bytes): {m}", m_fd, size);
        throw StreamError(fmt::format("read(fd {}): {}", m_fd, error_str(err)));
    }
}


void VectorSink::write(const std::byte* data, size_t size)
{
    m_buffer.insert(m_buffer.end(), data, data + size);
}


void OstreamSink::write(const std::byte* data, size_t size)
{
    m_stream.write(reinterpret_cast<const char*>(data), std::streamsize(size));
    if (!m_stream)
        throw StreamError("Error writing to output stream");
}


void OstreamSink::flush()
{
    m_stream.flush();
    if (!m_stream)
        throw StreamError("Error flushing output stream");
}


void FdSink::write(const std::byte* data, size_t size)
{
    while (size != 0) {
        const ssize_t r = ::write(m_fd, data, size);
        if (r < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            log::error("write({}, {} bytes): {m}", m_fd, size);
            throw StreamError(fmt::format("write(fd {}): {}", m_fd, error_str(err)));
        }
        if (r == 0)
            throw StreamError(fmt::format("write(fd {}): no progress", m_fd));
        data += r;
        size -= size_t(r);
    }
}


// -----------------------------------------------------------------------------


BufferedReader::BufferedReader(Source& source, size_t buffer_size)
    : m_source(&source),
      m_buffer(new std::byte[std::max(buffer_size, size_t(1))]),
      m_capacity(std::max(buffer_size, size_t(1)))
{}


void BufferedReader::check_open() const
{
    if (!m_buffer)
        throw StreamError("Reader is closed");
}


void BufferedReader::check_limit(uint64_t size) const
{
    if (m_limit && size > *m_limit - std::min(m_position, *m_limit))
        throw TruncationError(m_position, size);
}


std::optional<uint64_t> BufferedReader::remaining() const
{
    if (!m_limit)
        return {};
    return *m_limit - std::min(m_position, *m_limit);
}


bool BufferedReader::fill(size_t need)
{
    // move unread data to front
    if (m_begin != 0) {
        std::memmove(m_buffer.get(), m_buffer.get() + m_begin, available());
        m_end -= m_begin;
        m_begin = 0;
    }
    while (m_end < need) {
        const size_t n = m_source->read_some(m_buffer.get() + m_end, m_capacity - m_end);
        if (n == 0)
            return false;  // end of stream
        m_end += n;
    }
    return true;
}


void BufferedReader::consume(std::byte* out, size_t size)
{
    if (out != nullptr)
        std::memcpy(out, m_buffer.get() + m_begin, size);
    if (m_crc)
        m_crc->feed(m_buffer.get() + m_begin, size);
    m_begin += size;
    m_position += size;
}


void BufferedReader::read(std::byte* buffer, size_t size)
{
    check_open();
    check_limit(size);

    const size_t from_buffer = std::min(size, available());
    if (from_buffer != 0) {
        consume(buffer, from_buffer);
        buffer += from_buffer;
        size -= from_buffer;
    }
    if (size == 0)
        return;

    if (size >= m_capacity) {
        // big read - bypass the buffer
        size_t done = 0;
        while (done < size) {
            const size_t n = m_source->read_some(buffer + done, size - done);
            if (n == 0)
                throw TruncationError(m_position + done, size - done);
            done += n;
        }
        if (m_crc)
            m_crc->feed(buffer, size);
        m_position += size;
        return;
    }

    if (!fill(size))
        throw TruncationError(m_position + available(), size - available());
    consume(buffer, size);
}


std::byte BufferedReader::get_byte()
{
    std::byte b;
    read(&b, 1);
    return b;
}


std::byte BufferedReader::peek_byte()
{
    check_open();
    check_limit(1);
    if (available() == 0 && !fill(1))
        throw TruncationError(m_position, 1);
    return m_buffer[m_begin];
}


void BufferedReader::skip(uint64_t size)
{
    check_open();
    check_limit(size);
    while (size != 0) {
        if (available() == 0 && !fill(1))
            throw TruncationError(m_position, size);
        const size_t n = size_t(std::min<uint64_t>(size, available()));
        consume(nullptr, n);
        size -= n;
    }
}


bool BufferedReader::at_end()
{
    check_open();
    if (m_limit && m_position >= *m_limit)
        return true;
    return available() == 0 && !fill(1);
}


// -----------------------------------------------------------------------------


BufferedWriter::BufferedWriter(Sink& sink, size_t buffer_size)
    : m_sink(&sink),
      m_buffer(new std::byte[std::max(buffer_size, size_t(1))]),
      m_capacity(std::max(buffer_size, size_t(1)))
{}


BufferedWriter::~BufferedWriter()
{
    if (is_closed())
        return;
    try {
        close();
    } catch (const CodecError& e) {
        log::error("BufferedWriter: {}", e.what());
    }
}


void BufferedWriter::check_open() const
{
    if (!m_buffer)
        throw StreamError("Writer is closed");
}


void BufferedWriter::write(const std::byte* data, size_t size)
{
    check_open();
    if (size == 0)
        return;
    if (m_crc)
        m_crc->feed(data, size);
    m_position += size;

    if (m_size + size <= m_capacity) {
        std::memcpy(m_buffer.get() + m_size, data, size);
        m_size += size;
        return;
    }

    flush_buffer();
    if (size >= m_capacity) {
        // big write - bypass the buffer
        m_sink->write(data, size);
        return;
    }
    std::memcpy(m_buffer.get(), data, size);
    m_size = size;
}


void BufferedWriter::put_byte(std::byte b)
{
    write(&b, 1);
}


void BufferedWriter::flush_buffer()
{
    if (m_size == 0)
        return;
    const size_t size = m_size;
    m_size = 0;
    m_sink->write(m_buffer.get(), size);
}


void BufferedWriter::flush()
{
    check_open();
    flush_buffer();
    m_sink->flush();
}


void BufferedWriter::close()
{
    if (is_closed())
        return;
    try {
        flush();
    } catch (...) {
        m_buffer.reset();
        throw;
    }
    m_buffer.reset();
}


} // namespace pnt::data
