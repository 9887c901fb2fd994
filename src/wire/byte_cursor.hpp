#pragma once

#include <jettison/format.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace jettison::wire
{

// ─── ByteCursor ──────────────────────────────────────────────────────────────
// Read position over an immutable buffer. Every read is bounds-checked and
// throws TruncatedInputError instead of reading past the end; on failure the
// offset is left where the failed read started.

class ByteCursor
{
   public:
    // Throws TruncatedInputError if `offset` lies past the end of `data`.
    explicit ByteCursor(std::span<const uint8_t> data,
                        size_t                   offset = 0,
                        ByteOrder                order  = WIRE_BYTE_ORDER);

    uint8_t  read_u8();
    uint16_t read_u16() { return static_cast<uint16_t>(read_uint(2)); }
    uint32_t read_u32() { return static_cast<uint32_t>(read_uint(4)); }
    uint64_t read_u64() { return read_uint(8); }

    int8_t  read_i8() { return static_cast<int8_t>(read_u8()); }
    int16_t read_i16() { return static_cast<int16_t>(read_u16()); }
    int32_t read_i32() { return static_cast<int32_t>(read_u32()); }
    int64_t read_i64() { return static_cast<int64_t>(read_u64()); }

    float  read_f32();
    double read_f64();

    // View of the next `n` bytes; no copy. Valid as long as the buffer is.
    std::span<const uint8_t> read_raw(size_t n);
    std::string_view         read_text(size_t n);

    // Throws TruncatedInputError unless at least `n` bytes remain.
    void require(size_t n) const;

    size_t    offset() const { return offset_; }
    size_t    size() const { return data_.size(); }
    size_t    remaining() const { return data_.size() - offset_; }
    bool      at_end() const { return offset_ == data_.size(); }
    ByteOrder order() const { return order_; }

   private:
    uint64_t read_uint(size_t width);

    std::span<const uint8_t> data_;
    size_t                   offset_;
    ByteOrder                order_;
};

}  // namespace jettison::wire
