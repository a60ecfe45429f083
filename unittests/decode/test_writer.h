#ifndef SOLARIS_UNITTESTS__TEST_WRITER_H
#define SOLARIS_UNITTESTS__TEST_WRITER_H

#include "Platform/Define.h"
#include <cstring>
#include <string>
#include <vector>

namespace test
{
// Assembles client-format buffers by hand: little-endian, u16 string lengths,
// i32 array counts, one byte per gate.
class writer
{
public:
    writer& u8(uint8 v)
    {
        buf_.push_back(v);
        return *this;
    }
    writer& i8(int8 v) { return u8(static_cast<uint8>(v)); }
    writer& gate(bool present) { return u8(present ? 1 : 0); }
    writer& i16(int16 v) { return le(static_cast<uint16>(v), 2); }
    writer& u16(uint16 v) { return le(v, 2); }
    writer& i32(int32 v) { return le(static_cast<uint32>(v), 4); }
    writer& u32(uint32 v) { return le(v, 4); }
    writer& i64(int64 v) { return le(static_cast<uint64>(v), 8); }
    writer& u64(uint64 v) { return le(v, 8); }

    writer& f32(float v)
    {
        uint32 bits;
        std::memcpy(&bits, &v, sizeof(bits));
        return le(bits, 4);
    }

    writer& f64(double v)
    {
        uint64 bits;
        std::memcpy(&bits, &v, sizeof(bits));
        return le(bits, 8);
    }

    writer& raw(const std::string& bytes)
    {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    // u16 length + bytes
    writer& str(const std::string& s)
    {
        u16(static_cast<uint16>(s.size()));
        return raw(s);
    }

    // Gate + count, elements follow
    writer& array(int32 count) { return gate(true).i32(count); }

    const std::vector<uint8>& bytes() const { return buf_; }
    size_t size() const { return buf_.size(); }

private:
    writer& le(uint64 v, int width)
    {
        for (int i = 0; i < width; ++i)
            buf_.push_back(static_cast<uint8>((v >> (8 * i)) & 0xFF));
        return *this;
    }

    std::vector<uint8> buf_;
};
}

#endif
