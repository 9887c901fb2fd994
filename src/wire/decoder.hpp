#pragma once

#include "byte_cursor.hpp"

#include <jettison/codec.hpp>
#include <jettison/value.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace jettison::wire
{

// ─── Decoder ─────────────────────────────────────────────────────────────────
// Reads one tagged unit and dispatches on its tag. Each payload reader
// consumes exactly what the encoder wrote for it.

class Decoder
{
   public:
    Decoder(std::span<const uint8_t> data, size_t offset, const CodecOptions& options);

    Value  decode();
    size_t offset() const { return cursor_.offset(); }

   private:
    Value decode_value(size_t depth);
    Value decode_sequence(size_t depth);
    Value decode_mapping(size_t depth);

    uint32_t    read_length();
    std::string read_text(std::string_view what);

    CodecOptions options_;
    ByteCursor   cursor_;
};

}  // namespace jettison::wire
