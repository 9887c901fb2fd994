#include "byte_cursor.hpp"

#include <jettison/errors.hpp>

#include <bit>

namespace jettison::wire
{

ByteCursor::ByteCursor(std::span<const uint8_t> data, size_t offset, ByteOrder order)
    : data_(data)
    , offset_(offset)
    , order_(order)
{
    if (offset > data.size())
        throw TruncatedInputError(offset, 1, 0);
}

void ByteCursor::require(size_t n) const
{
    if (n > remaining())
        throw TruncatedInputError(offset_, n, remaining());
}

uint8_t ByteCursor::read_u8()
{
    require(1);
    return data_[offset_++];
}

uint64_t ByteCursor::read_uint(size_t width)
{
    require(width);
    const uint8_t* p = data_.data() + offset_;
    uint64_t       v = 0;
    if (order_ == ByteOrder::Little)
    {
        for (size_t i = 0; i < width; ++i)
            v |= static_cast<uint64_t>(p[i]) << (i * 8);
    }
    else
    {
        for (size_t i = 0; i < width; ++i)
            v = (v << 8) | static_cast<uint64_t>(p[i]);
    }
    offset_ += width;
    return v;
}

float ByteCursor::read_f32()
{
    return std::bit_cast<float>(read_u32());
}

double ByteCursor::read_f64()
{
    return std::bit_cast<double>(read_u64());
}

std::span<const uint8_t> ByteCursor::read_raw(size_t n)
{
    require(n);
    auto out = data_.subspan(offset_, n);
    offset_ += n;
    return out;
}

std::string_view ByteCursor::read_text(size_t n)
{
    auto raw = read_raw(n);
    return {reinterpret_cast<const char*>(raw.data()), raw.size()};
}

}  // namespace jettison::wire
