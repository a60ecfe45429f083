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

#include "decode/schema.h"
#include <set>

namespace solaris
{
namespace decode
{
namespace
{
struct type_name
{
    field_type type;
    const char* name;
};

const type_name type_names[] = {{field_type::i8, "i8"},
    {field_type::u8, "u8"}, {field_type::boolean, "bool"},
    {field_type::i16, "i16"}, {field_type::u16, "u16"},
    {field_type::i32, "i32"}, {field_type::u32, "u32"},
    {field_type::i64, "i64"}, {field_type::u64, "u64"},
    {field_type::f32, "f32"}, {field_type::f64, "f64"},
    {field_type::string, "string"}, {field_type::record, "record"},
    {field_type::array, "array"}};
}

const char* field_type_name(field_type type)
{
    for (auto& tn : type_names)
        if (tn.type == type)
            return tn.name;
    return "unknown";
}

bool parse_field_type(const std::string& name, field_type& type)
{
    for (auto& tn : type_names)
    {
        if (name == tn.name)
        {
            type = tn.type;
            return true;
        }
    }
    return false;
}

bool is_scalar(field_type type)
{
    return type != field_type::record && type != field_type::array;
}

const record_schema* schema_set::find(const std::string& name) const
{
    for (auto& rec : records_)
        if (rec->name() == name)
            return rec.get();
    return nullptr;
}

typedef schema_builder::record_builder record_builder;

record_builder& record_builder::scalar(const std::string& name, field_type type)
{
    field f;
    f.name = name;
    f.type = type;
    return add(std::move(f));
}

record_builder& record_builder::i8(const std::string& name)
{
    return scalar(name, field_type::i8);
}

record_builder& record_builder::u8(const std::string& name)
{
    return scalar(name, field_type::u8);
}

record_builder& record_builder::boolean(const std::string& name)
{
    return scalar(name, field_type::boolean);
}

record_builder& record_builder::i16(const std::string& name)
{
    return scalar(name, field_type::i16);
}

record_builder& record_builder::u16(const std::string& name)
{
    return scalar(name, field_type::u16);
}

record_builder& record_builder::i32(const std::string& name)
{
    return scalar(name, field_type::i32);
}

record_builder& record_builder::u32(const std::string& name)
{
    return scalar(name, field_type::u32);
}

record_builder& record_builder::i64(const std::string& name)
{
    return scalar(name, field_type::i64);
}

record_builder& record_builder::u64(const std::string& name)
{
    return scalar(name, field_type::u64);
}

record_builder& record_builder::f32(const std::string& name, int round)
{
    field f;
    f.name = name;
    f.type = field_type::f32;
    f.round = round;
    return add(std::move(f));
}

record_builder& record_builder::f64(const std::string& name, int round)
{
    field f;
    f.name = name;
    f.type = field_type::f64;
    f.round = round;
    return add(std::move(f));
}

record_builder& record_builder::string(const std::string& name)
{
    return scalar(name, field_type::string);
}

record_builder& record_builder::nullable(
    const std::string& name, field_type type, absent_policy absent)
{
    field f;
    f.name = name;
    f.type = type;
    f.nullable = true;
    f.absent = absent;
    return add(std::move(f));
}

record_builder& record_builder::record(const std::string& name,
    const std::string& record_name, absent_policy absent)
{
    field f;
    f.name = name;
    f.type = field_type::record;
    f.record_name = record_name;
    f.absent = absent;
    return add(std::move(f));
}

record_builder& record_builder::array(
    const std::string& name, field_type element, absent_policy absent)
{
    field f;
    f.name = name;
    f.type = field_type::array;
    f.element = element;
    f.absent = absent;
    return add(std::move(f));
}

record_builder& record_builder::array_of(const std::string& name,
    const std::string& record_name, absent_policy absent)
{
    field f;
    f.name = name;
    f.type = field_type::array;
    f.element = field_type::record;
    f.record_name = record_name;
    f.absent = absent;
    return add(std::move(f));
}

record_builder& record_builder::add(field f)
{
    schema_builder::append(rec_, std::move(f));
    return *this;
}

void schema_builder::append(record_schema* rec, field f)
{
    rec->fields_.push_back(std::move(f));
}

schema_builder::schema_builder() : set_(new schema_set)
{
}

record_builder schema_builder::record(const std::string& name)
{
    if (!set_)
        throw schema_error("schema_builder: already built");
    if (name.empty())
        throw schema_error("record name cannot be empty");
    if (set_->find(name))
        throw schema_error("record " + name + " declared twice");

    set_->records_.emplace_back(new record_schema(name));
    return record_builder(set_->records_.back().get());
}

void schema_builder::validate_record(const record_schema& rec) const
{
    // Every record has to consume at least one byte, otherwise an array
    // count alone could make decoding run without bound.
    if (rec.fields().empty())
        throw schema_error("record " + rec.name() + " has no fields");

    std::set<std::string> names;
    for (auto& f : rec.fields())
    {
        std::string where = rec.name() + "." + f.name;

        if (f.name.empty())
            throw schema_error("record " + rec.name() + " has a nameless field");
        if (!names.insert(f.name).second)
            throw schema_error("field " + where + " declared twice");

        if (f.nullable && !is_scalar(f.type))
            throw schema_error(
                "field " + where + ": only scalars can be marked nullable");

        bool is_float = f.type == field_type::f32 || f.type == field_type::f64 ||
                        (f.type == field_type::array &&
                            (f.element == field_type::f32 ||
                                f.element == field_type::f64));
        if (f.round >= 0 && !is_float)
            throw schema_error(
                "field " + where + ": rounding only applies to floats");
        if (f.round > 15)
            throw schema_error("field " + where + ": rounding above 15 digits");

        if (f.type == field_type::array && f.element == field_type::array)
            throw schema_error(
                "field " + where + ": arrays of arrays are not supported");

        bool wants_record =
            f.type == field_type::record ||
            (f.type == field_type::array && f.element == field_type::record);
        if (wants_record && !f.record)
            throw schema_error("field " + where + " references unknown record '" +
                               f.record_name + "'");
    }
}

std::shared_ptr<const schema_set> schema_builder::build()
{
    if (!set_)
        throw schema_error("schema_builder: already built");
    if (set_->records_.empty())
        throw schema_error("schema declares no records");

    for (auto& rec : set_->records_)
    {
        for (auto& f : rec->fields_)
        {
            bool wants_record = f.type == field_type::record ||
                                (f.type == field_type::array &&
                                    f.element == field_type::record);
            f.record = wants_record ? set_->find(f.record_name) : nullptr;
        }
    }

    for (auto& rec : set_->records_)
        validate_record(*rec);

    return std::shared_ptr<const schema_set>(set_.release());
}

document_schema schema_builder::document(const std::string& name,
    const std::string& source_file, const std::string& output_file,
    const std::string& root_key, const std::string& root_record,
    absent_policy empty)
{
    if (name.empty())
        throw schema_error("document schema needs a name");
    if (source_file.empty())
        throw schema_error("document " + name + " has no source file");
    if (root_key.empty())
        throw schema_error("document " + name + " has no root key");

    document_schema doc;
    doc.name = name;
    doc.source_file = source_file;
    doc.output_file = output_file.empty() ? name + ".json" : output_file;
    doc.root_key = root_key;
    doc.empty = empty;
    doc.records = build();
    doc.root = doc.records->find(root_record);
    if (!doc.root)
        throw schema_error(
            "document " + name + ": unknown root record '" + root_record + "'");
    return doc;
}
}
}
