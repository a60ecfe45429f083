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

#ifndef SOLARIS_UTIL_H
#define SOLARIS_UTIL_H

#include "Platform/Define.h"
#include <string>
#include <vector>

// Whole file into memory. Returns false if it can't be opened or read;
// throws std::bad_alloc if it doesn't fit.
bool ReadFileBytes(const std::string& filename, std::vector<uint8>& out);

// Creates missing parent directories. Returns false on any I/O failure.
bool WriteFileText(const std::string& filename, const std::string& text);

uint32 Crc32(const void* data, size_t size);
inline uint32 Crc32(const std::string& str)
{
    return Crc32(str.data(), str.size());
}

// Lower-case hex, no padding; "0" for zero
std::string Crc32Hex(uint32 crc);

#endif
