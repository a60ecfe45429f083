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

#include "Util.h"
#include <boost/filesystem.hpp>
#include <zlib.h>
#include <cstdio>
#include <memory>

bool ReadFileBytes(const std::string& filename, std::vector<uint8>& out)
{
    std::unique_ptr<FILE, int (*)(FILE*)> file(
        fopen(filename.c_str(), "rb"), &fclose);
    if (!file)
        return false;

    bool ok = fseek(file.get(), 0, SEEK_END) == 0;
    long len = ok ? ftell(file.get()) : -1;
    if (len < 0 || fseek(file.get(), 0, SEEK_SET) != 0)
        return false;

    // May throw std::bad_alloc for huge files
    out.resize(static_cast<size_t>(len));
    if (len > 0 && fread(&out[0], 1, out.size(), file.get()) != out.size())
    {
        out.clear();
        return false;
    }
    return true;
}

bool WriteFileText(const std::string& filename, const std::string& text)
{
    boost::filesystem::path path(filename);
    if (path.has_parent_path())
    {
        boost::system::error_code ec;
        boost::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return false;
    }

    FILE* file = fopen(filename.c_str(), "wb");
    if (!file)
        return false;

    bool ok = fwrite(text.data(), 1, text.size(), file) == text.size();
    if (fclose(file) != 0)
        ok = false;
    return ok;
}

uint32 Crc32(const void* data, size_t size)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    const Bytef* p = static_cast<const Bytef*>(data);
    // zlib takes uInt lengths
    while (size > 0)
    {
        uInt chunk = size > 0x40000000 ? 0x40000000 : static_cast<uInt>(size);
        crc = crc32(crc, p, chunk);
        p += chunk;
        size -= chunk;
    }
    return static_cast<uint32>(crc);
}

std::string Crc32Hex(uint32 crc)
{
    char buf[16];
    snprintf(buf, sizeof(buf), "%x", crc);
    return buf;
}
