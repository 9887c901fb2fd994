#include "byte_sink.hpp"

#include <bit>

namespace jettison::wire
{

void ByteSink::put_uint(uint64_t v, size_t width)
{
    if (order_ == ByteOrder::Little)
    {
        for (size_t i = 0; i < width; ++i)
            buf_.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
    else
    {
        for (size_t i = width; i-- > 0;)
            buf_.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void ByteSink::put_f32(float v)
{
    put_u32(std::bit_cast<uint32_t>(v));
}

void ByteSink::put_f64(double v)
{
    put_u64(std::bit_cast<uint64_t>(v));
}

void ByteSink::put_raw(std::span<const uint8_t> bytes)
{
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void ByteSink::put_raw(std::string_view bytes)
{
    const auto* p = reinterpret_cast<const uint8_t*>(bytes.data());
    buf_.insert(buf_.end(), p, p + bytes.size());
}

}  // namespace jettison::wire
