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

#ifndef SOLARIS_DECODE__SCHEMA_LOADER_H
#define SOLARIS_DECODE__SCHEMA_LOADER_H

#include "decode/schema.h"
#include <string>

/* Schema descriptor files. One JSON object per file describes one client
 * file:
 *
 *   {
 *     "name": "pet_skin",
 *     "source": "pet_skin.bytes",
 *     "output": "petSkin.json",          (optional, default <name>.json)
 *     "root_key": "pet_skins",
 *     "root": "PetSkins",
 *     "empty": "default" | "null",       (optional, default "default")
 *     "records": {
 *       "SkinKind": [
 *         {"name": "id", "type": "i32"},
 *         {"name": "year", "type": "i32"}
 *       ],
 *       "PetSkins": [
 *         {"name": "skin_kind", "type": "array", "element": "SkinKind"}
 *       ]
 *     }
 *   }
 *
 * Field keys: "name", "type" (i8 u8 bool i16 u16 i32 u32 i64 u64 f32 f64
 * string record array), "element" (scalar type or record name, arrays only),
 * "record" (record fields), "nullable", "absent" ("default" | "null") and
 * "round" (float digits). Fields are decoded in the order they are listed.
 */

namespace solaris
{
namespace decode
{
// origin is only used in error messages. Throws schema_error.
document_schema parse_schema(const std::string& text, const std::string& origin);

document_schema load_schema_file(const std::string& path);
}
}

#endif
