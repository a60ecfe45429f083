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

#include "parse/schema_registry.h"
#include "logging.h"
#include "decode/schema_loader.h"
#include "parse/builtin_schemas.h"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <sstream>

namespace fs = boost::filesystem;

namespace solaris
{
namespace parse
{
schema_registry::schema_registry()
{
    by_name_.set_empty_key("");
    by_source_.set_empty_key("");
}

bool schema_registry::add(decode::document_schema schema)
{
    auto itr = by_name_.find(schema.name);
    if (itr != by_name_.end())
    {
        logging.get_logger("parse.schema")
            .warning("Schema %s (%s) replaces the previous definition",
                schema.name.c_str(), schema.source_file.c_str());
        schemas_[itr->second] = std::move(schema);
        reindex();
        return false;
    }

    auto src = by_source_.find(schema.source_file);
    if (src != by_source_.end())
        logging.get_logger("parse.schema")
            .warning("Schemas %s and %s both read %s; lookups by file use %s",
                schemas_[src->second].name.c_str(), schema.name.c_str(),
                schema.source_file.c_str(), schema.name.c_str());

    schemas_.push_back(std::move(schema));
    reindex();
    return true;
}

void schema_registry::add_builtin()
{
    for (auto& schema : builtin_schemas())
        add(std::move(schema));
}

size_t schema_registry::load_directory(const std::string& dir)
{
    auto& log = logging.get_logger("parse.schema");

    if (!fs::is_directory(dir))
    {
        log.error("Schema directory %s does not exist", dir.c_str());
        return 1;
    }

    // Directory order is unspecified; keep registration stable
    std::vector<fs::path> files;
    for (fs::directory_iterator itr(dir); itr != fs::directory_iterator();
         ++itr)
    {
        if (!fs::is_regular_file(itr->status()))
            continue;
        if (itr->path().extension().string() != ".json")
            continue;
        files.push_back(itr->path());
    }
    std::sort(files.begin(), files.end());

    size_t failed = 0;
    for (auto& path : files)
    {
        try
        {
            decode::document_schema schema =
                decode::load_schema_file(path.string());
            LOG_DEBUG(log, "Loaded schema %s from %s", schema.name.c_str(),
                path.string().c_str());
            add(std::move(schema));
        }
        catch (decode::schema_error& e)
        {
            log.error("Skipping schema file: %s", e.what());
            ++failed;
        }
    }

    return failed;
}

const decode::document_schema* schema_registry::find(
    const std::string& name) const
{
    auto itr = by_name_.find(name);
    return itr == by_name_.end() ? nullptr : &schemas_[itr->second];
}

const decode::document_schema* schema_registry::find_by_source(
    const std::string& source_file) const
{
    auto itr = by_source_.find(source_file);
    return itr == by_source_.end() ? nullptr : &schemas_[itr->second];
}

void schema_registry::clear()
{
    schemas_.clear();
    by_name_.clear();
    by_source_.clear();
}

void schema_registry::reindex()
{
    by_name_.clear();
    by_source_.clear();
    for (size_t i = 0; i < schemas_.size(); ++i)
    {
        by_name_[schemas_[i].name] = i;
        by_source_[schemas_[i].source_file] = i;
    }
}

std::string schema_registry::describe() const
{
    size_t source_width = 0, output_width = 0;
    for (auto& schema : schemas_)
    {
        source_width = std::max(source_width, schema.source_file.size());
        output_width = std::max(output_width, schema.output_file.size());
    }

    std::ostringstream ss;
    ss << "Found " << schemas_.size() << " schemas:\n";
    for (auto& schema : schemas_)
    {
        ss << schema.source_file
           << std::string(source_width - schema.source_file.size(), ' ')
           << " -> " << schema.output_file
           << std::string(output_width - schema.output_file.size(), ' ')
           << "    " << schema.name << "\n";
    }
    return ss.str();
}
}
}
