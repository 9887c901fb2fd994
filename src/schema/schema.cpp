#include <jettison/errors.hpp>
#include <jettison/logger.hpp>
#include <jettison/schema.hpp>

#include "wire/byte_cursor.hpp"
#include "wire/byte_sink.hpp"
#include "wire/utf8.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace jettison
{

using wire::ByteCursor;
using wire::ByteSink;

// ─── Field types ─────────────────────────────────────────────────────────────

struct FieldTypeInfo
{
    FieldType        type;
    std::string_view name;
    size_t           size;  // 0 for variable-length types
};

static constexpr std::array<FieldTypeInfo, 11> FIELD_TYPES = {{
    {FieldType::Boolean, "boolean", 1},
    {FieldType::Int8, "int8", 1},
    {FieldType::Int16, "int16", 2},
    {FieldType::Int32, "int32", 4},
    {FieldType::Uint8, "uint8", 1},
    {FieldType::Uint16, "uint16", 2},
    {FieldType::Uint32, "uint32", 4},
    {FieldType::Float32, "float32", 4},
    {FieldType::Float64, "float64", 8},
    {FieldType::String, "string", 0},
    {FieldType::Array, "array", 0},
}};

FieldType field_type_from_name(std::string_view name)
{
    for (const auto& info : FIELD_TYPES)
    {
        if (info.name == name)
            return info.type;
    }
    throw SchemaError("invalid field type '" + std::string(name) + "'");
}

std::string_view field_type_name(FieldType type)
{
    return FIELD_TYPES[static_cast<size_t>(type)].name;
}

std::optional<size_t> field_type_size(FieldType type)
{
    size_t size = FIELD_TYPES[static_cast<size_t>(type)].size;
    if (size == 0)
        return std::nullopt;
    return size;
}

// Inclusive range of an integer field type.
static std::pair<int64_t, int64_t> integer_range(FieldType type)
{
    switch (type)
    {
        case FieldType::Int8:
            return {INT8_MIN, INT8_MAX};
        case FieldType::Int16:
            return {INT16_MIN, INT16_MAX};
        case FieldType::Int32:
            return {INT32_MIN, INT32_MAX};
        case FieldType::Uint8:
            return {0, UINT8_MAX};
        case FieldType::Uint16:
            return {0, UINT16_MAX};
        case FieldType::Uint32:
            return {0, UINT32_MAX};
        default:
            return {0, 0};
    }
}

// ─── Field ───────────────────────────────────────────────────────────────────

Field::Field(std::string key, FieldType type, std::optional<FieldType> value_type)
    : key_(std::move(key))
    , type_(type)
    , value_type_(value_type)
{
    if (key_.empty())
        throw SchemaError("field key is required");
    if (type_ == FieldType::Array && (!value_type_ || !field_type_size(*value_type_)))
    {
        throw SchemaError("field '" + key_ + "': invalid array value type '"
                          + (value_type_ ? std::string(field_type_name(*value_type_))
                                         : std::string("none"))
                          + "'");
    }
}

// ─── Field encode/decode ─────────────────────────────────────────────────────

static void expect_kind(const Value& v, Value::Kind kind, const Field& field)
{
    if (v.kind() != kind)
    {
        throw SchemaError("field '" + field.key() + "' expects "
                          + std::string(Value::kind_name(kind)) + ", got "
                          + std::string(Value::kind_name(v.kind())));
    }
}

static void put_scalar(ByteSink& sink, FieldType type, const Value& v, const Field& field)
{
    switch (type)
    {
        case FieldType::Boolean:
            expect_kind(v, Value::Kind::Bool, field);
            sink.put_u8(v.as_bool() ? 1 : 0);
            return;
        case FieldType::Float32:
        {
            expect_kind(v, Value::Kind::Float, field);
            double d = v.as_float();
            if (std::isfinite(d) && std::isinf(static_cast<float>(d)))
                throw RangeError("field '" + field.key() + "': " + std::to_string(d)
                                 + " is out of range for float32");
            sink.put_f32(static_cast<float>(d));
            return;
        }
        case FieldType::Float64:
            expect_kind(v, Value::Kind::Float, field);
            sink.put_f64(v.as_float());
            return;
        default:
            break;
    }

    expect_kind(v, Value::Kind::Int, field);
    int64_t n     = v.as_int();
    auto [lo, hi] = integer_range(type);
    if (n < lo || n > hi)
        throw RangeError("field '" + field.key() + "': " + std::to_string(n)
                         + " is out of range for " + std::string(field_type_name(type)));

    switch (type)
    {
        case FieldType::Int8:
            sink.put_i8(static_cast<int8_t>(n));
            break;
        case FieldType::Int16:
            sink.put_i16(static_cast<int16_t>(n));
            break;
        case FieldType::Int32:
            sink.put_i32(static_cast<int32_t>(n));
            break;
        case FieldType::Uint8:
            sink.put_u8(static_cast<uint8_t>(n));
            break;
        case FieldType::Uint16:
            sink.put_u16(static_cast<uint16_t>(n));
            break;
        case FieldType::Uint32:
            sink.put_u32(static_cast<uint32_t>(n));
            break;
        default:
            break;
    }
}

static Value read_scalar(ByteCursor& cursor, FieldType type)
{
    switch (type)
    {
        case FieldType::Boolean:
            return Value::boolean(cursor.read_u8() != 0);
        case FieldType::Int8:
            return Value::integer(cursor.read_i8());
        case FieldType::Int16:
            return Value::integer(cursor.read_i16());
        case FieldType::Int32:
            return Value::integer(cursor.read_i32());
        case FieldType::Uint8:
            return Value::integer(cursor.read_u8());
        case FieldType::Uint16:
            return Value::integer(cursor.read_u16());
        case FieldType::Uint32:
            return Value::integer(cursor.read_u32());
        case FieldType::Float32:
            return Value::floating(static_cast<double>(cursor.read_f32()));
        case FieldType::Float64:
            return Value::floating(cursor.read_f64());
        default:
            throw SchemaError("'" + std::string(field_type_name(type)) + "' is not a scalar type");
    }
}

static void put_field(ByteSink& sink, const Field& field, const Value& v)
{
    switch (field.type())
    {
        case FieldType::String:
        {
            expect_kind(v, Value::Kind::String, field);
            const auto& text = v.as_string();
            if (!wire::is_valid_utf8(text))
                throw EncodingError("field '" + field.key() + "' is not valid UTF-8");
            if (text.size() > MAX_LENGTH)
                throw RangeError("field '" + field.key() + "': string exceeds the u32 length field");
            sink.put_u32(static_cast<uint32_t>(text.size()));
            sink.put_raw(text);
            return;
        }
        case FieldType::Array:
        {
            expect_kind(v, Value::Kind::Sequence, field);
            const auto& items = v.as_sequence();
            if (items.size() > MAX_LENGTH)
                throw RangeError("field '" + field.key() + "': array exceeds the u32 count field");
            sink.put_u32(static_cast<uint32_t>(items.size()));
            for (const auto& item : items)
                put_scalar(sink, *field.value_type(), item, field);
            return;
        }
        default:
            put_scalar(sink, field.type(), v, field);
            return;
    }
}

static Value read_field(ByteCursor& cursor, const Field& field)
{
    switch (field.type())
    {
        case FieldType::String:
        {
            uint32_t len   = cursor.read_u32();
            size_t   start = cursor.offset();
            auto     text  = cursor.read_text(len);
            if (auto bad = wire::find_invalid_utf8(text))
                throw EncodingError("field '" + field.key() + "' at offset "
                                    + std::to_string(start + *bad) + " is not valid UTF-8");
            return Value::string(std::string(text));
        }
        case FieldType::Array:
        {
            FieldType element = *field.value_type();
            uint32_t  count   = cursor.read_u32();
            cursor.require(static_cast<size_t>(count) * *field_type_size(element));
            Sequence items;
            items.reserve(count);
            for (uint32_t i = 0; i < count; ++i)
                items.push_back(read_scalar(cursor, element));
            return Value::sequence(std::move(items));
        }
        default:
            return read_scalar(cursor, field.type());
    }
}

static void write_fields(ByteSink& sink, const Definition& def, const Value& data)
{
    if (!data.is_mapping())
        throw SchemaError("definition '" + def.key() + "' expects a mapping, got "
                          + std::string(Value::kind_name(data.kind())));

    for (const auto& field : def.fields())
    {
        const Value* v = data.find(field.key());
        if (!v)
            throw SchemaError("missing field '" + field.key() + "'");
        put_field(sink, field, *v);
    }
}

static Value read_fields(ByteCursor& cursor, const Definition& def)
{
    Mapping members;
    members.reserve(def.fields().size());
    for (const auto& field : def.fields())
        members.emplace_back(field.key(), read_field(cursor, field));
    return Value::mapping(std::move(members));
}

// ─── Definition ──────────────────────────────────────────────────────────────

Definition::Definition(std::vector<Field> fields, uint32_t id, std::string key, ByteOrder byte_order)
    : fields_(std::move(fields))
    , id_(id)
    , key_(std::move(key))
    , byte_order_(byte_order)
{
}

std::vector<uint8_t> Definition::dumps(const Value& data) const
{
    ByteSink sink(byte_order_);
    write_fields(sink, *this, data);
    return sink.take();
}

DecodeResult Definition::loads(std::span<const uint8_t> data, size_t offset) const
{
    ByteCursor   cursor(data, offset, byte_order_);
    DecodeResult result;
    result.value       = read_fields(cursor, *this);
    result.next_offset = cursor.offset();
    return result;
}

// ─── Schema ──────────────────────────────────────────────────────────────────

Schema::Schema(FieldType id_type, ByteOrder byte_order)
    : id_type_(id_type)
    , byte_order_(byte_order)
{
    if (id_type_ != FieldType::Uint8 && id_type_ != FieldType::Uint16
        && id_type_ != FieldType::Uint32)
    {
        throw SchemaError("invalid id type '" + std::string(field_type_name(id_type_))
                          + "': must be uint8, uint16 or uint32");
    }
}

const Definition& Schema::define(std::string key, std::vector<Field> fields)
{
    if (by_key_.count(key))
        throw SchemaError("key '" + key + "' is already defined in schema");

    if (static_cast<int64_t>(next_id_) > integer_range(id_type_).second)
        throw RangeError("definition id " + std::to_string(next_id_) + " does not fit "
                         + std::string(field_type_name(id_type_)));

    uint32_t id    = static_cast<uint32_t>(next_id_++);
    size_t   index = definitions_.size();
    definitions_.push_back(
        std::make_unique<Definition>(std::move(fields), id, key, byte_order_));
    by_id_[id] = index;
    by_key_.emplace(std::move(key), index);

    const Definition& def = *definitions_.back();
    JETTISON_LOG_DEBUG("schema", "defined '{}' as id {} with {} fields",
                       def.key(), id, def.fields().size());
    return def;
}

const Definition* Schema::find_by_key(std::string_view key) const
{
    auto it = by_key_.find(std::string(key));
    return it == by_key_.end() ? nullptr : definitions_[it->second].get();
}

const Definition* Schema::find_by_id(uint32_t id) const
{
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : definitions_[it->second].get();
}

std::vector<uint8_t> Schema::dumps(std::string_view key, const Value& data) const
{
    const Definition* def = find_by_key(key);
    if (!def)
        throw SchemaError("key '" + std::string(key) + "' is not defined in schema");

    ByteSink sink(byte_order_);
    put_scalar(sink, id_type_, Value::integer(def->id()), Field("id", id_type_));
    write_fields(sink, *def, data);
    return sink.take();
}

Packet Schema::loads(std::span<const uint8_t> data, size_t offset) const
{
    ByteCursor cursor(data, offset, byte_order_);
    int64_t    id = read_scalar(cursor, id_type_).as_int();

    const Definition* def = find_by_id(static_cast<uint32_t>(id));
    if (!def)
    {
        JETTISON_LOG_DEBUG("schema", "packet at offset {} has unknown id {}", offset, id);
        throw SchemaError("id " + std::to_string(id) + " is not defined in schema");
    }

    Packet packet;
    packet.definition  = def;
    packet.value       = read_fields(cursor, *def);
    packet.next_offset = cursor.offset();
    return packet;
}

}  // namespace jettison
