#include <jettison/codec.hpp>
#include <jettison/errors.hpp>
#include <jettison/logger.hpp>

#include "wire/decoder.hpp"
#include "wire/encoder.hpp"

namespace jettison
{

std::vector<uint8_t> encode(const Value& value, const CodecOptions& options)
{
    try
    {
        wire::Encoder encoder(options);
        encoder.encode(value);
        auto out = encoder.take();
        JETTISON_LOG_TRACE("codec", "encoded {} value into {} bytes",
                           Value::kind_name(value.kind()), out.size());
        return out;
    }
    catch (const Error& e)
    {
        JETTISON_LOG_DEBUG("codec", "encode failed: {}", e.what());
        throw;
    }
}

DecodeResult decode(std::span<const uint8_t> data, size_t offset, const CodecOptions& options)
{
    try
    {
        if (options.max_input_size != 0 && data.size() > options.max_input_size)
            throw InputTooLargeError(data.size(), options.max_input_size);

        wire::Decoder decoder(data, offset, options);
        DecodeResult  result;
        result.value       = decoder.decode();
        result.next_offset = decoder.offset();
        JETTISON_LOG_TRACE("codec", "decoded {} value from bytes [{}, {})",
                           Value::kind_name(result.value.kind()), offset, result.next_offset);
        return result;
    }
    catch (const Error& e)
    {
        JETTISON_LOG_DEBUG("codec", "decode failed: {}", e.what());
        throw;
    }
}

Value decode_exact(std::span<const uint8_t> data, const CodecOptions& options)
{
    auto result = decode(data, 0, options);
    if (result.next_offset != data.size())
    {
        JETTISON_LOG_DEBUG("codec", "decode_exact: {} trailing bytes after value",
                           data.size() - result.next_offset);
        throw TrailingDataError(result.next_offset, data.size());
    }
    return std::move(result.value);
}

}  // namespace jettison
