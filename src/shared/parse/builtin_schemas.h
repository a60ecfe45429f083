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

#ifndef SOLARIS_PARSE__BUILTIN_SCHEMAS_H
#define SOLARIS_PARSE__BUILTIN_SCHEMAS_H

#include "decode/schema.h"
#include <vector>

namespace solaris
{
namespace parse
{
// Field layouts of client files known at compile time, each in the order the
// client's own parser reads them.
decode::document_schema achievements_schema();
decode::document_schema nature_schema();
decode::document_schema effect_icon_schema();
decode::document_schema pet_skin_schema();
decode::document_schema monsters_schema();
decode::document_schema move_stones_schema();

std::vector<decode::document_schema> builtin_schemas();
}
}

#endif
