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

#ifndef SOLARIS_DECODE__DOCUMENT_H
#define SOLARIS_DECODE__DOCUMENT_H

#include "decode/schema.h"
#include "decode/value.h"
#include <vector>

namespace solaris
{
namespace decode
{
struct decode_options
{
    decode_options() : max_depth(SOLARIS_DEFAULT_MAX_DEPTH), strict(false) {}

    int max_depth;
    bool strict; // bytes left after the root record are an error
};

struct document_result
{
    document_result() : empty(false), consumed(0), size(0) {}

    value doc;       // {root_key: root record}
    bool empty;      // root gate was false
    size_t consumed; // bytes read
    size_t size;     // bytes in the buffer

    bool has_trailing_bytes() const { return consumed < size; }
};

/* Decodes one client file. Reads the root gate at offset 0; if it's false the
 * result is the schema's canonical empty document and exactly one byte has
 * been read. Otherwise the root record is decoded once.
 *
 * Throws decode_error (bounds, encoding, depth, trailing data) and never
 * returns a partial document.
 */
document_result decode_document(const uint8* data, size_t size,
    const document_schema& schema,
    const decode_options& opts = decode_options());
document_result decode_document(const std::vector<uint8>& buf,
    const document_schema& schema,
    const decode_options& opts = decode_options());

// {root_key: null} or {root_key: record of defaults}, per schema.empty
value empty_document(const document_schema& schema);
}
}

#endif
