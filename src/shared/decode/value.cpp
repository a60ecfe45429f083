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

#include "decode/value.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace solaris
{
namespace decode
{
const char* kind_name(value::kind k)
{
    switch (k)
    {
    case value::kind::null:
        return "null";
    case value::kind::boolean:
        return "boolean";
    case value::kind::integer:
        return "integer";
    case value::kind::uinteger:
        return "unsigned integer";
    case value::kind::floating:
        return "float";
    case value::kind::string:
        return "string";
    case value::kind::array:
        return "array";
    case value::kind::record:
        return "record";
    }
    return "unknown";
}

value value::make_bool(bool b)
{
    value v;
    v.kind_ = kind::boolean;
    v.bool_ = b;
    return v;
}

value value::make_int(int64 i)
{
    value v;
    v.kind_ = kind::integer;
    v.int_ = i;
    return v;
}

value value::make_uint(uint64 u)
{
    value v;
    v.kind_ = kind::uinteger;
    v.uint_ = u;
    return v;
}

value value::make_float(double d)
{
    value v;
    v.kind_ = kind::floating;
    v.float_ = d;
    return v;
}

value value::make_string(std::string s)
{
    value v;
    v.kind_ = kind::string;
    v.str_ = std::move(s);
    return v;
}

value value::make_array(array_type items)
{
    value v;
    v.kind_ = kind::array;
    v.items_ = std::move(items);
    return v;
}

value value::make_record(record_type fields)
{
    value v;
    v.kind_ = kind::record;
    v.fields_ = std::move(fields);
    return v;
}

void value::expect(kind k, const char* what) const
{
    if (kind_ != k)
        throw std::logic_error(std::string("value: ") + what + " on " +
                               kind_name(kind_));
}

bool value::as_bool() const
{
    expect(kind::boolean, "as_bool");
    return bool_;
}

int64 value::as_int() const
{
    if (kind_ == kind::uinteger &&
        uint_ <= static_cast<uint64>(std::numeric_limits<int64>::max()))
        return static_cast<int64>(uint_);
    expect(kind::integer, "as_int");
    return int_;
}

uint64 value::as_uint() const
{
    if (kind_ == kind::integer && int_ >= 0)
        return static_cast<uint64>(int_);
    expect(kind::uinteger, "as_uint");
    return uint_;
}

double value::as_float() const
{
    expect(kind::floating, "as_float");
    return float_;
}

const std::string& value::as_string() const
{
    expect(kind::string, "as_string");
    return str_;
}

const value::array_type& value::items() const
{
    expect(kind::array, "items");
    return items_;
}

value::array_type& value::items()
{
    expect(kind::array, "items");
    return items_;
}

const value::record_type& value::fields() const
{
    expect(kind::record, "fields");
    return fields_;
}

value::record_type& value::fields()
{
    expect(kind::record, "fields");
    return fields_;
}

const value& value::operator[](const std::string& name) const
{
    for (auto& field : fields())
        if (field.first == name)
            return field.second;
    throw std::out_of_range("value: no field named " + name);
}

const value& value::operator[](size_t index) const
{
    return items().at(index);
}

bool value::has(const std::string& name) const
{
    if (kind_ != kind::record)
        return false;
    for (auto& field : fields_)
        if (field.first == name)
            return true;
    return false;
}

size_t value::size() const
{
    switch (kind_)
    {
    case kind::array:
        return items_.size();
    case kind::record:
        return fields_.size();
    case kind::string:
        return str_.size();
    default:
        return 0;
    }
}

void value::push_back(value v)
{
    items().push_back(std::move(v));
}

void value::add_field(std::string name, value v)
{
    fields().emplace_back(std::move(name), std::move(v));
}

bool value::operator==(const value& other) const
{
    if (kind_ != other.kind_)
        return false;

    switch (kind_)
    {
    case kind::null:
        return true;
    case kind::boolean:
        return bool_ == other.bool_;
    case kind::integer:
        return int_ == other.int_;
    case kind::uinteger:
        return uint_ == other.uint_;
    case kind::floating:
        // NaN compares equal to NaN here, so decoded documents can be
        // compared against expected ones.
        if (std::isnan(float_) && std::isnan(other.float_))
            return true;
        return float_ == other.float_;
    case kind::string:
        return str_ == other.str_;
    case kind::array:
        return items_ == other.items_;
    case kind::record:
        return fields_ == other.fields_;
    }
    return false;
}
}
}
