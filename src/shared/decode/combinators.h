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

#ifndef SOLARIS_DECODE__COMBINATORS_H
#define SOLARIS_DECODE__COMBINATORS_H

#include "decode/byte_cursor.h"
#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

/* Presence-gated building blocks. A record decoder is nothing but calls to
 * these and to byte_cursor's primitives, made in exactly the order the client
 * serialized the fields:
 *
 *   item.id = cursor.read_i32();
 *   item.name = length_prefixed_string(cursor);
 *   item.kinds = optional_array(cursor, [](byte_cursor& c)
 *       {
 *           return decode_kind(c);
 *       });
 *
 * The stream carries no tags, so a decoder that gets the order wrong will
 * usually still "succeed" with garbage values.
 */

namespace solaris
{
namespace decode
{
template <typename F>
struct decoded
{
    typedef typename std::decay<
        typename std::result_of<F(byte_cursor&)>::type>::type type;
};

// u16 byte length followed by that many UTF-8 bytes
inline std::string length_prefixed_string(byte_cursor& cursor)
{
    uint16 len = cursor.read_u16();
    return cursor.read_utf8(len);
}

// Gate; if false returns absent without reading further
template <typename F>
typename decoded<F>::type optional(
    byte_cursor& cursor, F decode_inner, typename decoded<F>::type absent)
{
    if (!cursor.read_bool())
        return absent;
    return decode_inner(cursor);
}

template <typename F>
typename decoded<F>::type optional(byte_cursor& cursor, F decode_inner)
{
    return optional(cursor, decode_inner, typename decoded<F>::type());
}

// Same as optional, but the payload counts as one nesting level
template <typename F>
typename decoded<F>::type optional_record(
    byte_cursor& cursor, F decode_inner, typename decoded<F>::type absent)
{
    if (!cursor.read_bool())
        return absent;
    depth_guard guard(cursor);
    return decode_inner(cursor);
}

template <typename F>
typename decoded<F>::type optional_record(byte_cursor& cursor, F decode_inner)
{
    return optional_record(cursor, decode_inner, typename decoded<F>::type());
}

// Ungated array payload: i32 count, then count elements back to back. A
// negative count yields no elements.
template <typename F>
std::vector<typename decoded<F>::type> array_payload(
    byte_cursor& cursor, F decode_element)
{
    int32 count = cursor.read_i32();

    std::vector<typename decoded<F>::type> items;
    if (count <= 0)
        return items;

    depth_guard guard(cursor);
    // Never trust count for the allocation; a corrupt count runs into a
    // bounds_error long before the vector would grow that large.
    items.reserve(std::min<size_t>(count, cursor.remaining()));
    for (int32 i = 0; i < count; ++i)
        items.push_back(decode_element(cursor));
    return items;
}

// Gate; if false an empty sequence, otherwise array_payload
template <typename F>
std::vector<typename decoded<F>::type> optional_array(
    byte_cursor& cursor, F decode_element)
{
    if (!cursor.read_bool())
        return std::vector<typename decoded<F>::type>();
    return array_payload(cursor, decode_element);
}

/* Document wrapper: one gate at offset 0 around the root record. If it's
 * false the canonical empty document is returned and nothing else is read.
 */
template <typename F>
typename decoded<F>::type document(
    byte_cursor& cursor, F decode_root, typename decoded<F>::type empty)
{
    if (!cursor.read_bool())
        return empty;
    return decode_root(cursor);
}
}
}

#endif
