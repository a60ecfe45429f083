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

#include "decode/schema_loader.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using nlohmann::json;

namespace solaris
{
namespace decode
{
namespace
{
std::string get_string(const json& obj, const char* key, const std::string& where,
    const std::string& def = std::string(), bool required = true)
{
    auto itr = obj.find(key);
    if (itr == obj.end())
    {
        if (required)
            throw schema_error(where + ": missing \"" + key + "\"");
        return def;
    }
    if (!itr->is_string())
        throw schema_error(where + ": \"" + key + "\" must be a string");
    return itr->get<std::string>();
}

absent_policy parse_absent(const std::string& str, const std::string& where)
{
    if (str == "default")
        return absent_policy::type_default;
    if (str == "null")
        return absent_policy::null;
    throw schema_error(where + ": unknown absent policy '" + str + "'");
}

field parse_field(const json& obj, const std::string& where)
{
    if (!obj.is_object())
        throw schema_error(where + ": field must be an object");

    field f;
    f.name = get_string(obj, "name", where);
    std::string at = where + "." + f.name;

    std::string type = get_string(obj, "type", at);
    if (!parse_field_type(type, f.type))
        throw schema_error(at + ": unknown type '" + type + "'");

    if (f.type == field_type::record)
    {
        f.record_name = get_string(obj, "record", at);
        f.absent = absent_policy::null;
    }
    else if (f.type == field_type::array)
    {
        std::string element = get_string(obj, "element", at);
        if (!parse_field_type(element, f.element))
        {
            f.element = field_type::record;
            f.record_name = element;
        }
        else if (f.element == field_type::record)
        {
            throw schema_error(
                at + ": name the record type directly in \"element\"");
        }
    }

    auto nullable = obj.find("nullable");
    if (nullable != obj.end())
    {
        if (!nullable->is_boolean())
            throw schema_error(at + ": \"nullable\" must be a boolean");
        f.nullable = nullable->get<bool>();
    }

    if (obj.count("absent"))
        f.absent = parse_absent(get_string(obj, "absent", at), at);

    auto round = obj.find("round");
    if (round != obj.end())
    {
        if (!round->is_number_integer())
            throw schema_error(at + ": \"round\" must be an integer");
        f.round = round->get<int>();
    }

    return f;
}
}

document_schema parse_schema(const std::string& text, const std::string& origin)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (json::parse_error& e)
    {
        throw schema_error(origin + ": " + e.what());
    }

    if (!root.is_object())
        throw schema_error(origin + ": top level must be an object");

    try
    {
        std::string name = get_string(root, "name", origin);
        std::string where = origin + " (" + name + ")";

        schema_builder builder;

        auto records = root.find("records");
        if (records == root.end() || !records->is_object())
            throw schema_error(where + ": \"records\" must be an object");

        for (auto itr = records->begin(); itr != records->end(); ++itr)
        {
            std::string rec_where = where + ": " + itr.key();
            if (!itr.value().is_array())
                throw schema_error(rec_where + " must be an array of fields");

            auto rec = builder.record(itr.key());
            for (auto& f : itr.value())
                rec.add(parse_field(f, rec_where));
        }

        absent_policy empty = parse_absent(
            get_string(root, "empty", where, "default", false), where);

        return builder.document(name, get_string(root, "source", where),
            get_string(root, "output", where, "", false),
            get_string(root, "root_key", where), get_string(root, "root", where),
            empty);
    }
    catch (json::exception& e)
    {
        throw schema_error(origin + ": " + e.what());
    }
    catch (schema_error& e)
    {
        // Builder errors don't know which file they came from
        std::string what = e.what();
        if (what.compare(0, origin.size(), origin) == 0)
            throw;
        throw schema_error(origin + ": " + what);
    }
}

document_schema load_schema_file(const std::string& path)
{
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in)
        throw schema_error("Cannot open schema file: " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_schema(ss.str(), path);
}
}
}
