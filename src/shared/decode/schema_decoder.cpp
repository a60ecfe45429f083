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

#include "decode/schema_decoder.h"
#include "decode/combinators.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace solaris
{
namespace decode
{
// Rounds the exact binary value to digits decimals, ties to even. glibc's
// printf rounds correctly and strtod returns the nearest double.
static double round_to(double d, int digits)
{
    if (digits < 0 || std::isnan(d) || std::isinf(d))
        return d;
    int len = std::snprintf(nullptr, 0, "%.*f", digits, d);
    if (len < 0)
        return d;
    std::vector<char> buf(len + 1);
    std::snprintf(&buf[0], buf.size(), "%.*f", digits, d);
    return std::strtod(&buf[0], nullptr);
}

value decode_scalar(byte_cursor& cursor, field_type type, int round)
{
    switch (type)
    {
    case field_type::i8:
        return value::make_int(cursor.read_i8());
    case field_type::u8:
        return value::make_uint(cursor.read_u8());
    case field_type::boolean:
        return value::make_bool(cursor.read_bool());
    case field_type::i16:
        return value::make_int(cursor.read_i16());
    case field_type::u16:
        return value::make_uint(cursor.read_u16());
    case field_type::i32:
        return value::make_int(cursor.read_i32());
    case field_type::u32:
        return value::make_uint(cursor.read_u32());
    case field_type::i64:
        return value::make_int(cursor.read_i64());
    case field_type::u64:
        return value::make_uint(cursor.read_u64());
    case field_type::f32:
        return value::make_float(round_to(cursor.read_f32(), round));
    case field_type::f64:
        return value::make_float(round_to(cursor.read_f64(), round));
    case field_type::string:
        return value::make_string(length_prefixed_string(cursor));
    case field_type::record:
    case field_type::array:
        break;
    }
    throw schema_error(
        std::string("decode_scalar: not a scalar type: ") + field_type_name(type));
}

static value decode_element(byte_cursor& cursor, const field& f)
{
    if (f.element == field_type::record)
        return decode_record(cursor, *f.record);
    return decode_scalar(cursor, f.element, f.round);
}

value decode_field(byte_cursor& cursor, const field& f)
{
    switch (f.type)
    {
    case field_type::record:
    {
        if (!cursor.read_bool())
            return absent_value(f);
        depth_guard guard(cursor);
        return decode_record(cursor, *f.record);
    }
    case field_type::array:
    {
        if (!cursor.read_bool())
            return absent_value(f);
        return value::make_array(array_payload(cursor, [&f](byte_cursor& c)
            {
                return decode_element(c, f);
            }));
    }
    default:
        break;
    }

    if (f.nullable)
        return optional(cursor, [&f](byte_cursor& c)
            {
                return decode_scalar(c, f.type, f.round);
            },
            absent_value(f));
    return decode_scalar(cursor, f.type, f.round);
}

value decode_record(byte_cursor& cursor, const record_schema& rec)
{
    value::record_type fields;
    fields.reserve(rec.fields().size());
    for (auto& f : rec.fields())
        fields.emplace_back(f.name, decode_field(cursor, f));
    return value::make_record(std::move(fields));
}

value default_value(field_type type)
{
    switch (type)
    {
    case field_type::i8:
    case field_type::i16:
    case field_type::i32:
    case field_type::i64:
        return value::make_int(0);
    case field_type::u8:
    case field_type::u16:
    case field_type::u32:
    case field_type::u64:
        return value::make_uint(0);
    case field_type::boolean:
        return value::make_bool(false);
    case field_type::f32:
    case field_type::f64:
        return value::make_float(0.0);
    case field_type::string:
        return value::make_string(std::string());
    case field_type::array:
        return value::make_array();
    case field_type::record:
        break;
    }
    return value();
}

namespace
{
// Records currently being defaulted; a record that (indirectly) contains
// itself gets null the second time round.
typedef std::vector<const record_schema*> default_stack;

value default_record(const record_schema& rec, default_stack& stack);

value absent_value(const field& f, default_stack& stack)
{
    if (f.absent == absent_policy::null)
        return value();
    if (f.type != field_type::record)
        return default_value(f.type);
    if (std::find(stack.begin(), stack.end(), f.record) != stack.end())
        return value();
    return default_record(*f.record, stack);
}

value default_record(const record_schema& rec, default_stack& stack)
{
    stack.push_back(&rec);
    value::record_type fields;
    for (auto& f : rec.fields())
    {
        if (f.gated())
            fields.emplace_back(f.name, absent_value(f, stack));
        else
            fields.emplace_back(f.name, default_value(f.type));
    }
    stack.pop_back();
    return value::make_record(std::move(fields));
}
}

value absent_value(const field& f)
{
    default_stack stack;
    return absent_value(f, stack);
}

value default_record(const record_schema& rec)
{
    default_stack stack;
    return default_record(rec, stack);
}
}
}
