#pragma once

#include <jettison/format.hpp>
#include <jettison/value.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace jettison
{

// Per-call limits. Both sides of the wire should agree on max_depth.
struct CodecOptions
{
    size_t max_depth      = DEFAULT_MAX_DEPTH;  // outermost container is depth 1
    size_t max_input_size = 0;                  // decode-side bound in bytes; 0 = unlimited
};

struct DecodeResult
{
    Value  value;
    size_t next_offset = 0;
};

// Encode `value` into a fresh buffer. Either returns a complete encoding or
// throws; never partial.
// Throws EncodingError, RangeError, DepthExceededError, CyclicValueError.
std::vector<uint8_t> encode(const Value& value, const CodecOptions& options = {});

// Decode exactly one value starting at `offset`. Bytes after the value are
// left alone; `next_offset` points just past it.
// Throws TruncatedInputError, UnknownTagError, EncodingError,
// DepthExceededError, InputTooLargeError.
DecodeResult decode(std::span<const uint8_t> data,
                    size_t                   offset  = 0,
                    const CodecOptions&      options = {});

// As decode() at offset 0, but the value must span the whole buffer.
// Additionally throws TrailingDataError.
Value decode_exact(std::span<const uint8_t> data, const CodecOptions& options = {});

}  // namespace jettison
