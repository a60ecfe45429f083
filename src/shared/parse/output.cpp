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

#include "parse/output.h"
#include "Util.h"
#include <boost/filesystem.hpp>
#include <cmath>

using nlohmann::ordered_json;

namespace solaris
{
namespace parse
{
ordered_json to_json(const decode::value& v)
{
    switch (v.type())
    {
    case decode::value::kind::null:
        return nullptr;
    case decode::value::kind::boolean:
        return v.as_bool();
    case decode::value::kind::integer:
        return v.as_int();
    case decode::value::kind::uinteger:
        return v.as_uint();
    case decode::value::kind::floating:
        if (!std::isfinite(v.as_float()))
            return nullptr;
        return v.as_float();
    case decode::value::kind::string:
        return v.as_string();
    case decode::value::kind::array:
    {
        ordered_json arr = ordered_json::array();
        for (auto& item : v.items())
            arr.push_back(to_json(item));
        return arr;
    }
    case decode::value::kind::record:
    {
        ordered_json obj = ordered_json::object();
        for (auto& field : v.fields())
            obj[field.first] = to_json(field.second);
        return obj;
    }
    }
    return nullptr;
}

std::string dump_json(const ordered_json& j)
{
    return j.dump(2, ' ', false) + "\n";
}

std::string dump_document(const decode::value& doc)
{
    return dump_json(to_json(doc));
}

ordered_json manifest_json(const std::vector<job_result>& results)
{
    ordered_json docs = ordered_json::array();
    size_t ok = 0, failed = 0, missing = 0;

    for (auto& r : results)
    {
        ordered_json entry;
        entry["schema"] = r.schema;
        entry["source"] = r.source_file;
        entry["output"] = r.output_file;
        entry["status"] = job_status_name(r.status);

        switch (r.status)
        {
        case job_status::ok:
            ++ok;
            entry["size"] = r.size;
            entry["consumed"] = r.consumed;
            entry["empty"] = r.empty;
            entry["source_crc32"] = Crc32Hex(r.source_crc);
            entry["output_crc32"] = Crc32Hex(r.output_crc);
            break;
        case job_status::failed:
            ++failed;
            entry["size"] = r.size;
            entry["source_crc32"] = Crc32Hex(r.source_crc);
            entry["error"] = r.error;
            break;
        case job_status::missing:
            ++missing;
            break;
        }

        docs.push_back(std::move(entry));
    }

    ordered_json manifest;
    manifest["version"] = SOLARIS_MANIFEST_VERSION;
    manifest["total"] = results.size();
    manifest["ok"] = ok;
    manifest["failed"] = failed;
    manifest["missing"] = missing;
    manifest["documents"] = std::move(docs);
    return manifest;
}

bool write_manifest(
    const std::string& output_dir, const std::vector<job_result>& results)
{
    boost::filesystem::path path =
        boost::filesystem::path(output_dir) / SOLARIS_MANIFEST_FILE;
    return WriteFileText(path.string(), dump_json(manifest_json(results)));
}
}
}
