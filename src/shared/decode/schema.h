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

#ifndef SOLARIS_DECODE__SCHEMA_H
#define SOLARIS_DECODE__SCHEMA_H

#include "Platform/Define.h"
#include "decode/decode_error.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace solaris
{
namespace decode
{
enum class field_type
{
    i8,
    u8,
    boolean,
    i16,
    u16,
    i32,
    u32,
    i64,
    u64,
    f32,
    f64,
    string, // u16 length prefix + UTF-8 bytes
    record,
    array
};

// What a false presence gate resolves to
enum class absent_policy
{
    type_default, // 0, "", false, [] or a record of defaults
    null
};

const char* field_type_name(field_type type);
bool parse_field_type(const std::string& name, field_type& type);
bool is_scalar(field_type type);

class record_schema;

struct field
{
    field()
      : type(field_type::i32), element(field_type::i32), record(nullptr),
        nullable(false), absent(absent_policy::type_default), round(-1)
    {
    }

    std::string name;
    field_type type;
    field_type element;          // array element type
    const record_schema* record; // record, or array of records
    std::string record_name;     // unresolved reference, kept for messages
    bool nullable;               // scalar preceded by a presence gate
    absent_policy absent;
    int round; // decimal digits kept for floats, -1 keeps all

    // Records and arrays always have a gate in front of them
    bool gated() const
    {
        return nullable || type == field_type::record ||
               type == field_type::array;
    }
};

// Fields of one record, in serialization order
class record_schema
{
public:
    explicit record_schema(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    const std::vector<field>& fields() const { return fields_; }

private:
    friend class schema_builder;

    std::string name_;
    std::vector<field> fields_;
};

// Owns every record of one schema. Records point at each other with raw
// pointers, so self-referencing records are fine.
class schema_set
{
public:
    const record_schema* find(const std::string& name) const;
    const std::vector<std::unique_ptr<record_schema>>& records() const
    {
        return records_;
    }

private:
    friend class schema_builder;

    std::vector<std::unique_ptr<record_schema>> records_;
};

/* A whole client file: the root record plus where it comes from and where
 * the decoded result goes. The decoded document is {root_key: root}.
 */
struct document_schema
{
    document_schema() : root(nullptr), empty(absent_policy::type_default) {}

    std::string name;        // e.g. "monsters"
    std::string source_file; // e.g. "monsters.bytes"
    std::string output_file; // e.g. "monsters.json"
    std::string root_key;    // e.g. "monsters"
    std::shared_ptr<const schema_set> records;
    const record_schema* root;
    absent_policy empty; // what a false root gate decodes to
};

/* Builds and validates a schema_set. References between records are by name
 * and may point forward; they are resolved by build().
 *
 *   schema_builder b;
 *   b.record("SkinKind").i32("id").i32("year");
 *   b.record("PetSkins").array_of("skin_kind", "SkinKind");
 *   document_schema doc = b.document("pet_skin", "pet_skin.bytes",
 *       "petSkin.json", "pet_skins", "PetSkins");
 */
class schema_builder
{
public:
    class record_builder
    {
    public:
        record_builder& scalar(const std::string& name, field_type type);
        record_builder& i8(const std::string& name);
        record_builder& u8(const std::string& name);
        record_builder& boolean(const std::string& name);
        record_builder& i16(const std::string& name);
        record_builder& u16(const std::string& name);
        record_builder& i32(const std::string& name);
        record_builder& u32(const std::string& name);
        record_builder& i64(const std::string& name);
        record_builder& u64(const std::string& name);
        record_builder& f32(const std::string& name, int round = -1);
        record_builder& f64(const std::string& name, int round = -1);
        record_builder& string(const std::string& name);

        // Gated scalar
        record_builder& nullable(const std::string& name, field_type type,
            absent_policy absent = absent_policy::type_default);

        // Gated nested record
        record_builder& record(const std::string& name,
            const std::string& record_name,
            absent_policy absent = absent_policy::null);

        // Gated arrays
        record_builder& array(const std::string& name, field_type element,
            absent_policy absent = absent_policy::type_default);
        record_builder& array_of(const std::string& name,
            const std::string& record_name,
            absent_policy absent = absent_policy::type_default);

        // Full control, used by the descriptor file loader
        record_builder& add(field f);

    private:
        friend class schema_builder;
        explicit record_builder(record_schema* rec) : rec_(rec) {}

        record_schema* rec_;
    };

    schema_builder();

    // Starts a new record; throws schema_error on a duplicate name
    record_builder record(const std::string& name);

    // Resolves references and validates. The builder can't be used again.
    std::shared_ptr<const schema_set> build();

    // build() and wrap the result
    document_schema document(const std::string& name,
        const std::string& source_file, const std::string& output_file,
        const std::string& root_key, const std::string& root_record,
        absent_policy empty = absent_policy::type_default);

private:
    static void append(record_schema* rec, field f);
    void validate_record(const record_schema& rec) const;

    std::unique_ptr<schema_set> set_;
};
}
}

#endif
