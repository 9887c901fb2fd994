#include "decoder.hpp"

#include "utf8.hpp"

#include <jettison/errors.hpp>

namespace jettison::wire
{

// Smallest possible encodings, used to reject forged counts before looping.
static constexpr size_t MIN_UNIT_SIZE   = 1;                                  // tag only
static constexpr size_t MIN_MEMBER_SIZE = LENGTH_FIELD_SIZE + MIN_UNIT_SIZE;  // empty key + unit

Decoder::Decoder(std::span<const uint8_t> data, size_t offset, const CodecOptions& options)
    : options_(options)
    , cursor_(data, offset, WIRE_BYTE_ORDER)
{
}

Value Decoder::decode()
{
    return decode_value(0);
}

Value Decoder::decode_value(size_t depth)
{
    size_t tag_offset = cursor_.offset();
    Tag    tag        = tag_from_byte(cursor_.read_u8(), tag_offset);

    switch (tag)
    {
        case Tag::NULL_VALUE:
            return Value::null();
        case Tag::BOOL_FALSE:
            return Value::boolean(false);
        case Tag::BOOL_TRUE:
            return Value::boolean(true);
        case Tag::INT:
            return Value::integer(cursor_.read_i64());
        case Tag::FLOAT:
            return Value::floating(cursor_.read_f64());
        case Tag::STRING:
            return Value::string(read_text("string"));
        case Tag::BYTES:
        {
            uint32_t len = read_length();
            auto     raw = cursor_.read_raw(len);
            return Value::bytes(Bytes(raw.begin(), raw.end()));
        }
        case Tag::SEQUENCE:
            return decode_sequence(depth + 1);
        case Tag::MAPPING:
            return decode_mapping(depth + 1);
    }
    throw UnknownTagError(static_cast<uint8_t>(tag), tag_offset);
}

Value Decoder::decode_sequence(size_t depth)
{
    if (depth > options_.max_depth)
        throw DepthExceededError(options_.max_depth);

    uint32_t count = read_length();
    cursor_.require(static_cast<size_t>(count) * MIN_UNIT_SIZE);

    Sequence items;
    items.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
        items.push_back(decode_value(depth));
    return Value::sequence(std::move(items));
}

Value Decoder::decode_mapping(size_t depth)
{
    if (depth > options_.max_depth)
        throw DepthExceededError(options_.max_depth);

    uint32_t count = read_length();
    cursor_.require(static_cast<size_t>(count) * MIN_MEMBER_SIZE);

    Mapping members;
    members.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        std::string key = read_text("mapping key");
        members.emplace_back(std::move(key), decode_value(depth));
    }
    return Value::mapping(std::move(members));
}

uint32_t Decoder::read_length()
{
    return cursor_.read_u32();
}

std::string Decoder::read_text(std::string_view what)
{
    uint32_t len   = read_length();
    size_t   start = cursor_.offset();
    auto     text  = cursor_.read_text(len);
    if (auto bad = find_invalid_utf8(text))
        throw EncodingError(std::string(what) + " at offset " + std::to_string(start + *bad)
                            + " is not valid UTF-8");
    return std::string(text);
}

}  // namespace jettison::wire
