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

#include "decode/byte_cursor.h"
#include <utf8cpp/utf8.h>
#include <stdexcept>

namespace solaris
{
namespace decode
{
byte_cursor::byte_cursor(const uint8* data, size_t size, int max_depth)
  : data_(data), size_(size), pos_(0), depth_(0), max_depth_(max_depth)
{
}

byte_cursor::byte_cursor(const std::vector<uint8>& buf, int max_depth)
  : data_(buf.empty() ? nullptr : &buf[0]), size_(buf.size()), pos_(0),
    depth_(0), max_depth_(max_depth)
{
}

void byte_cursor::seek(size_t pos)
{
    if (pos > size_)
        throw bounds_error(pos_, pos - pos_, size_);
    pos_ = pos;
}

void byte_cursor::skip(size_t count)
{
    require(count);
    pos_ += count;
}

uint8 byte_cursor::read_u8()
{
    require(1);
    return data_[pos_++];
}

int8 byte_cursor::read_i8()
{
    uint8 b = read_u8();
    return b > 127 ? static_cast<int8>(static_cast<int>(b) - 256) :
                     static_cast<int8>(b);
}

bool byte_cursor::read_bool()
{
    return read_u8() != 0;
}

float byte_cursor::read_f32()
{
    uint32 bits = read_le<uint32>();
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double byte_cursor::read_f64()
{
    uint64 bits = read_le<uint64>();
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string byte_cursor::read_utf8(size_t length)
{
    require(length);

    const char* begin = reinterpret_cast<const char*>(data_ + pos_);
    const char* end = begin + length;
    const char* invalid = utf8::find_invalid(begin, end);
    if (invalid != end)
        throw encoding_error(pos_, length, invalid - begin);

    pos_ += length;
    return std::string(begin, end);
}

depth_guard::depth_guard(byte_cursor& cursor) : cursor_(cursor)
{
    if (cursor_.depth_ >= cursor_.max_depth_)
        throw depth_error(cursor_.pos_, cursor_.max_depth_);
    ++cursor_.depth_;
}

std::vector<bool> to_bit_array(uint64 value, int length)
{
    if (length < 0)
        throw std::invalid_argument("to_bit_array: negative length");

    std::vector<bool> bits(length, false);
    for (int i = 0; i < length && i < 64; ++i)
        bits[i] = (value >> i) & 1;
    return bits;
}
}
}
