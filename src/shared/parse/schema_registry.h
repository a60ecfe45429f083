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

#ifndef SOLARIS_PARSE__SCHEMA_REGISTRY_H
#define SOLARIS_PARSE__SCHEMA_REGISTRY_H

#include "Policies/Singleton.h"
#include "decode/schema.h"
#include <sparsehash/dense_hash_map>
#include <string>
#include <vector>

namespace solaris
{
namespace parse
{
/* Catalog of every client file the tool knows how to decode, in registration
 * order. Filled during start-up and only read afterwards, so worker threads
 * may look schemas up without locking.
 */
class schema_registry
{
public:
    schema_registry();

    // Returns false if a schema of the same name was replaced
    bool add(decode::document_schema schema);

    void add_builtin();

    // Loads every *.json descriptor in dir. Broken files are logged and
    // skipped. Returns the number of failures; a missing directory counts as
    // one.
    size_t load_directory(const std::string& dir);

    const decode::document_schema* find(const std::string& name) const;
    const decode::document_schema* find_by_source(
        const std::string& source_file) const;

    const std::vector<decode::document_schema>& schemas() const
    {
        return schemas_;
    }
    size_t size() const { return schemas_.size(); }

    void clear();

    // "source -> output    name" lines, columns aligned
    std::string describe() const;

private:
    void reindex();

    std::vector<decode::document_schema> schemas_;
    google::dense_hash_map<std::string, size_t> by_name_;
    google::dense_hash_map<std::string, size_t> by_source_;
};
}
}

#define sSchemaRegistry solaris::UnlockedSingleton<solaris::parse::schema_registry>

#endif
