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

#include "decode/document.h"
#include "decode/byte_cursor.h"
#include "decode/schema_decoder.h"

namespace solaris
{
namespace decode
{
static value wrap(const document_schema& schema, value root)
{
    value doc = value::make_record();
    doc.add_field(schema.root_key, std::move(root));
    return doc;
}

value empty_document(const document_schema& schema)
{
    if (schema.empty == absent_policy::null)
        return wrap(schema, value());
    return wrap(schema, default_record(*schema.root));
}

document_result decode_document(const uint8* data, size_t size,
    const document_schema& schema, const decode_options& opts)
{
    if (!schema.root)
        throw schema_error("document " + schema.name + " has no root record");

    byte_cursor cursor(data, size, opts.max_depth);
    document_result result;
    result.size = size;

    if (!cursor.read_bool())
    {
        if (opts.strict && !cursor.eof())
            throw trailing_data_error(cursor.position(), size);
        result.empty = true;
        result.doc = empty_document(schema);
        result.consumed = cursor.position();
        return result;
    }

    value root;
    {
        depth_guard guard(cursor);
        root = decode_record(cursor, *schema.root);
    }

    if (opts.strict && !cursor.eof())
        throw trailing_data_error(cursor.position(), size);

    result.doc = wrap(schema, std::move(root));
    result.consumed = cursor.position();
    return result;
}

document_result decode_document(const std::vector<uint8>& buf,
    const document_schema& schema, const decode_options& opts)
{
    return decode_document(
        buf.empty() ? nullptr : &buf[0], buf.size(), schema, opts);
}
}
}
