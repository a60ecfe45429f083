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

#ifndef SOLARIS_DECODE__VALUE_H
#define SOLARIS_DECODE__VALUE_H

#include "Platform/Define.h"
#include <string>
#include <utility>
#include <vector>

namespace solaris
{
namespace decode
{
/* Decoded document tree. Records keep their fields in decode order, which is
 * the order the schema declares them in.
 *
 * Accessors for a kind the value doesn't hold throw std::logic_error.
 */
class value
{
public:
    enum class kind
    {
        null,
        boolean,
        integer,  // signed, up to 64 bits
        uinteger, // unsigned, up to 64 bits
        floating,
        string,
        array,
        record
    };

    typedef std::vector<value> array_type;
    typedef std::vector<std::pair<std::string, value>> record_type;

    value() : kind_(kind::null), int_(0), float_(0) {}

    static value make_bool(bool b);
    static value make_int(int64 i);
    static value make_uint(uint64 u);
    static value make_float(double d);
    static value make_string(std::string s);
    static value make_array(array_type items = array_type());
    static value make_record(record_type fields = record_type());

    kind type() const { return kind_; }
    bool is_null() const { return kind_ == kind::null; }

    bool as_bool() const;
    int64 as_int() const;   // also accepts uinteger values that fit
    uint64 as_uint() const; // also accepts non-negative integer values
    double as_float() const;
    const std::string& as_string() const;
    const array_type& items() const;
    array_type& items();
    const record_type& fields() const;
    record_type& fields();

    // Record field lookup; throws std::out_of_range for unknown names
    const value& operator[](const std::string& name) const;
    const value& operator[](size_t index) const;
    bool has(const std::string& name) const;
    size_t size() const;

    void push_back(value v);
    void add_field(std::string name, value v);

    bool operator==(const value& other) const;
    bool operator!=(const value& other) const { return !(*this == other); }

private:
    void expect(kind k, const char* what) const;

    kind kind_;
    union
    {
        bool bool_;
        int64 int_;
        uint64 uint_;
    };
    double float_;
    std::string str_;
    array_type items_;
    record_type fields_;
};

const char* kind_name(value::kind k);
}
}

#endif
