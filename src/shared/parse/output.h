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

#ifndef SOLARIS_PARSE__OUTPUT_H
#define SOLARIS_PARSE__OUTPUT_H

#include "decode/value.h"
#include "parse/batch.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#define SOLARIS_MANIFEST_VERSION 1
#define SOLARIS_MANIFEST_FILE "manifest.json"

namespace solaris
{
namespace parse
{
// Record fields keep decode order. NaN and infinities become null.
nlohmann::ordered_json to_json(const decode::value& v);

// Two-space indent, UTF-8 kept as is, trailing newline
std::string dump_json(const nlohmann::ordered_json& j);
std::string dump_document(const decode::value& doc);

nlohmann::ordered_json manifest_json(const std::vector<job_result>& results);

// Writes <output_dir>/manifest.json. Returns false on I/O failure.
bool write_manifest(
    const std::string& output_dir, const std::vector<job_result>& results);
}
}

#endif
