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

#include "decode/decode_error.h"
#include <sstream>

namespace solaris
{
namespace decode
{
static std::string bounds_message(size_t pos, size_t requested, size_t size)
{
    std::ostringstream ss;
    ss << "Attempted to read " << requested << " bytes at position " << pos
       << " in buffer of size " << size;
    return ss.str();
}

static std::string encoding_message(
    size_t pos, size_t length, size_t invalid_offset)
{
    std::ostringstream ss;
    ss << "Invalid UTF-8 in " << length << "-byte string at position " << pos
       << " (first bad byte at offset " << invalid_offset << ")";
    return ss.str();
}

static std::string depth_message(size_t pos, int max_depth)
{
    std::ostringstream ss;
    ss << "Nesting deeper than " << max_depth << " levels at position "
       << pos;
    return ss.str();
}

static std::string trailing_message(size_t pos, size_t size)
{
    std::ostringstream ss;
    ss << "Document ends at position " << pos << " but buffer holds " << size
       << " bytes";
    return ss.str();
}

bounds_error::bounds_error(size_t pos, size_t requested, size_t size)
  : decode_error(bounds_message(pos, requested, size), pos),
    requested_(requested), size_(size)
{
}

encoding_error::encoding_error(size_t pos, size_t length, size_t invalid_offset)
  : decode_error(encoding_message(pos, length, invalid_offset), pos),
    length_(length)
{
}

depth_error::depth_error(size_t pos, int max_depth)
  : decode_error(depth_message(pos, max_depth), pos), max_depth_(max_depth)
{
}

trailing_data_error::trailing_data_error(size_t pos, size_t size)
  : decode_error(trailing_message(pos, size), pos)
{
}
}
}
