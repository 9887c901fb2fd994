#pragma once

#include <jettison/format.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace jettison::wire
{

// ─── ByteSink ────────────────────────────────────────────────────────────────
// Append-only growable buffer. Every fixed-width write uses the byte order
// chosen at construction; nothing else in the codec shifts or masks bytes.

class ByteSink
{
   public:
    explicit ByteSink(ByteOrder order = WIRE_BYTE_ORDER) : order_(order) {}

    void put_u8(uint8_t v) { buf_.push_back(v); }
    void put_u16(uint16_t v) { put_uint(v, 2); }
    void put_u32(uint32_t v) { put_uint(v, 4); }
    void put_u64(uint64_t v) { put_uint(v, 8); }

    void put_i8(int8_t v) { put_u8(static_cast<uint8_t>(v)); }
    void put_i16(int16_t v) { put_u16(static_cast<uint16_t>(v)); }
    void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }
    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }

    // IEEE 754 bit patterns, written verbatim (NaN payloads included).
    void put_f32(float v);
    void put_f64(double v);

    void put_raw(std::span<const uint8_t> bytes);
    void put_raw(std::string_view bytes);

    ByteOrder order() const { return order_; }
    size_t    size() const { return buf_.size(); }

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    void put_uint(uint64_t v, size_t width);

    ByteOrder            order_;
    std::vector<uint8_t> buf_;
};

}  // namespace jettison::wire
