#include "encoder.hpp"

#include "utf8.hpp"

#include <jettison/errors.hpp>

#include <string>

namespace jettison::wire
{

Encoder::Encoder(const CodecOptions& options)
    : options_(options)
    , sink_(WIRE_BYTE_ORDER)
{
}

void Encoder::encode(const Value& value)
{
    encode_value(value, 0);
}

void Encoder::encode_value(const Value& value, size_t depth)
{
    switch (value.kind())
    {
        case Value::Kind::Null:
            put_tag(Tag::NULL_VALUE);
            break;
        case Value::Kind::Bool:
            put_tag(value.as_bool() ? Tag::BOOL_TRUE : Tag::BOOL_FALSE);
            break;
        case Value::Kind::Int:
            put_tag(Tag::INT);
            sink_.put_i64(value.as_int());
            break;
        case Value::Kind::Float:
            put_tag(Tag::FLOAT);
            sink_.put_f64(value.as_float());
            break;
        case Value::Kind::String:
            put_tag(Tag::STRING);
            put_text(value.as_string(), "string");
            break;
        case Value::Kind::Bytes:
        {
            const auto& bytes = value.as_bytes();
            put_tag(Tag::BYTES);
            put_length(bytes.size(), "bytes length");
            sink_.put_raw(bytes);
            break;
        }
        case Value::Kind::Sequence:
            encode_sequence(value, depth + 1);
            break;
        case Value::Kind::Mapping:
            encode_mapping(value, depth + 1);
            break;
    }
}

void Encoder::encode_sequence(const Value& value, size_t depth)
{
    enter(value, depth);
    const auto& items = value.as_sequence();
    put_tag(Tag::SEQUENCE);
    put_length(items.size(), "sequence count");
    for (const auto& item : items)
        encode_value(item, depth);
    leave(value);
}

void Encoder::encode_mapping(const Value& value, size_t depth)
{
    enter(value, depth);
    const auto& members = value.as_mapping();
    put_tag(Tag::MAPPING);
    put_length(members.size(), "mapping count");
    for (const auto& [key, item] : members)
    {
        // Keys are always strings, so they carry no tag.
        put_text(key, "mapping key");
        encode_value(item, depth);
    }
    leave(value);
}

void Encoder::enter(const Value& container, size_t depth)
{
    if (!active_.insert(container.identity()).second)
        throw CyclicValueError();
    if (depth > options_.max_depth)
        throw DepthExceededError(options_.max_depth);
}

void Encoder::leave(const Value& container)
{
    active_.erase(container.identity());
}

void Encoder::put_length(size_t n, std::string_view what)
{
    if (n > MAX_LENGTH)
        throw RangeError(std::string(what) + " " + std::to_string(n)
                         + " exceeds the u32 length field");
    sink_.put_u32(static_cast<uint32_t>(n));
}

void Encoder::put_text(std::string_view text, std::string_view what)
{
    if (auto bad = find_invalid_utf8(text))
        throw EncodingError(std::string(what) + " is not valid UTF-8 (byte "
                            + std::to_string(*bad) + ")");
    put_length(text.size(), what);
    sink_.put_raw(text);
}

}  // namespace jettison::wire
