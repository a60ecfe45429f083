/*
 * Copyright (C) 2026 Solaris
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef SOLARIS_DECODE__BYTE_CURSOR_H
#define SOLARIS_DECODE__BYTE_CURSOR_H

#include "Platform/Define.h"
#include "decode/decode_error.h"
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <string>
#include <vector>

namespace solaris
{
namespace decode
{
/* Forward-only reader over a client config buffer.
 *
 * All multi-byte values are little-endian. Every read is bounds checked: it
 * either consumes exactly its width or throws bounds_error, after which the
 * position is unspecified and the document must be abandoned.
 *
 * The cursor does not own the bytes; the buffer must outlive it and must not
 * change while it is read. It also tracks how deep the decoder has nested
 * into records and arrays (see depth_guard).
 */
class byte_cursor
{
public:
    byte_cursor(const uint8* data, size_t size,
        int max_depth = SOLARIS_DEFAULT_MAX_DEPTH);
    explicit byte_cursor(const std::vector<uint8>& buf,
        int max_depth = SOLARIS_DEFAULT_MAX_DEPTH);

    byte_cursor(const byte_cursor&) = delete;
    byte_cursor& operator=(const byte_cursor&) = delete;

    size_t position() const { return pos_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - pos_; }
    bool eof() const { return pos_ >= size_; }

    void seek(size_t pos);
    void skip(size_t count);

    uint8 read_u8();
    int8 read_i8();
    bool read_bool();
    int16 read_i16() { return read_le<int16>(); }
    uint16 read_u16() { return read_le<uint16>(); }
    int32 read_i32() { return read_le<int32>(); }
    uint32 read_u32() { return read_le<uint32>(); }
    int64 read_i64() { return read_le<int64>(); }
    uint64 read_u64() { return read_le<uint64>(); }
    float read_f32();
    double read_f64();

    // Exactly length bytes, validated as UTF-8. No length prefix is read.
    std::string read_utf8(size_t length);

    int depth() const { return depth_; }
    int max_depth() const { return max_depth_; }

private:
    friend class depth_guard;

    void require(size_t count) const
    {
        if (count > size_ - pos_)
            throw bounds_error(pos_, count, size_);
    }

    template <typename T>
    T read_le()
    {
        require(sizeof(T));
        T value;
        std::memcpy(&value, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return boost::endian::little_to_native(value);
    }

    const uint8* data_;
    size_t size_;
    size_t pos_;
    int depth_;
    int max_depth_;
};

// Scoped nesting level. Throws depth_error if entering would exceed the
// cursor's ceiling.
class depth_guard
{
public:
    explicit depth_guard(byte_cursor& cursor);
    ~depth_guard() { --cursor_.depth_; }

    depth_guard(const depth_guard&) = delete;
    depth_guard& operator=(const depth_guard&) = delete;

private:
    byte_cursor& cursor_;
};

// Expands the low length bits of value, lowest bit first. Client files pack
// several boolean flags into one integer this way.
std::vector<bool> to_bit_array(uint64 value, int length);
}
}

#endif
