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

#ifndef SOLARIS_DECODE__SCHEMA_DECODER_H
#define SOLARIS_DECODE__SCHEMA_DECODER_H

#include "decode/byte_cursor.h"
#include "decode/schema.h"
#include "decode/value.h"

namespace solaris
{
namespace decode
{
// Walks a record_schema field by field, issuing the cursor/combinator calls
// the schema describes.
value decode_record(byte_cursor& cursor, const record_schema& rec);

// One field, including its presence gate if it has one
value decode_field(byte_cursor& cursor, const field& f);

// Ungated payload of one scalar slot
value decode_scalar(byte_cursor& cursor, field_type type, int round = -1);

// What a slot resolves to when its gate is false. Records with a
// type_default policy become a record of their fields' defaults.
value absent_value(const field& f);
value default_value(field_type type);
value default_record(const record_schema& rec);
}
}

#endif
