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

#ifndef SOLARIS_DECODE__DECODE_ERROR_H
#define SOLARIS_DECODE__DECODE_ERROR_H

#include "Platform/Define.h"
#include <stdexcept>
#include <string>

namespace solaris
{
namespace decode
{
// Base of everything that abandons a document mid-stream. pos is where the
// cursor was when the failing read started.
class decode_error : public std::runtime_error
{
public:
    decode_error(const std::string& what, size_t pos)
      : std::runtime_error(what), pos_(pos)
    {
    }

    size_t position() const { return pos_; }

private:
    size_t pos_;
};

// A read asked for more bytes than remain in the buffer
class bounds_error : public decode_error
{
public:
    bounds_error(size_t pos, size_t requested, size_t size);

    size_t requested() const { return requested_; }
    size_t size() const { return size_; }

private:
    size_t requested_;
    size_t size_;
};

// String bytes that are not valid UTF-8
class encoding_error : public decode_error
{
public:
    encoding_error(size_t pos, size_t length, size_t invalid_offset);

    size_t length() const { return length_; }

private:
    size_t length_;
};

// Nested records/arrays went deeper than the cursor allows
class depth_error : public decode_error
{
public:
    depth_error(size_t pos, int max_depth);

    int max_depth() const { return max_depth_; }

private:
    int max_depth_;
};

// Strict documents must end exactly where the root record ends
class trailing_data_error : public decode_error
{
public:
    trailing_data_error(size_t pos, size_t size);
};

// Invalid schema descriptor; raised while building or loading a schema,
// never while decoding.
class schema_error : public std::runtime_error
{
public:
    explicit schema_error(const std::string& what) : std::runtime_error(what)
    {
    }
};
}
}

#endif
