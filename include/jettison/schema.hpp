#pragma once

#include <jettison/codec.hpp>
#include <jettison/format.hpp>
#include <jettison/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jettison
{

// ─── Packet schemas ──────────────────────────────────────────────────────────
// Schema-driven packets: both ends share a Schema, so a packet carries no
// per-field tags, just the definition id followed by each field's
// fixed-layout encoding in declaration order.
//
// Field layouts (in the definition's byte order):
//   boolean          1 byte, 0 or 1 (any non-zero byte reads as true)
//   int8..int32      1/2/4 bytes two's complement
//   uint8..uint32    1/2/4 bytes unsigned
//   float32/float64  4/8 bytes IEEE 754
//   string           [len: u32] [len bytes of UTF-8]
//   array            [count: u32] [count x value_type]

enum class FieldType : uint8_t
{
    Boolean,
    Int8,
    Int16,
    Int32,
    Uint8,
    Uint16,
    Uint32,
    Float32,
    Float64,
    String,
    Array
};

// Names as used by schema files on the other side of the wire: "boolean",
// "int8", ..., "float64", "string", "array". Unknown names throw SchemaError.
FieldType        field_type_from_name(std::string_view name);
std::string_view field_type_name(FieldType type);

// Encoded size of a fixed-width type, or std::nullopt for String/Array.
std::optional<size_t> field_type_size(FieldType type);

// One keyed property of a packet.
class Field
{
   public:
    // Throws SchemaError if `key` is empty, or if `type` is Array and
    // `value_type` is missing or not a fixed-width type.
    Field(std::string key, FieldType type, std::optional<FieldType> value_type = std::nullopt);

    const std::string&       key() const { return key_; }
    FieldType                type() const { return type_; }
    std::optional<FieldType> value_type() const { return value_type_; }

   private:
    std::string              key_;
    FieldType                type_;
    std::optional<FieldType> value_type_;
};

// An ordered group of fields; encodes one Mapping value per packet.
class Definition
{
   public:
    explicit Definition(std::vector<Field> fields,
                        uint32_t           id         = 0,
                        std::string        key        = {},
                        ByteOrder          byte_order = ByteOrder::Big);

    // Encode the fields of `data` (a Mapping) in declaration order.
    // Throws SchemaError for a missing key or a value of the wrong variant,
    // RangeError for out-of-range numbers, EncodingError for bad UTF-8.
    std::vector<uint8_t> dumps(const Value& data) const;

    // Decode the fields at `offset` into a Mapping keyed in declaration order.
    // Throws TruncatedInputError, EncodingError.
    DecodeResult loads(std::span<const uint8_t> data, size_t offset = 0) const;

    const std::vector<Field>& fields() const { return fields_; }
    uint32_t                  id() const { return id_; }
    const std::string&        key() const { return key_; }
    ByteOrder                 byte_order() const { return byte_order_; }

   private:
    std::vector<Field> fields_;
    uint32_t           id_;
    std::string        key_;
    ByteOrder          byte_order_;
};

struct Packet
{
    const Definition* definition = nullptr;
    Value             value;
    size_t            next_offset = 0;
};

// A registry of definitions addressed by key on encode and by id on decode.
class Schema
{
   public:
    // `id_type` must be Uint8, Uint16 or Uint32, else SchemaError.
    explicit Schema(FieldType id_type = FieldType::Uint8, ByteOrder byte_order = ByteOrder::Big);

    Schema(const Schema&)            = delete;
    Schema& operator=(const Schema&) = delete;
    Schema(Schema&&)                 = default;
    Schema& operator=(Schema&&)      = default;

    // Register a definition under `key` with the next id (starting at 1).
    // Throws SchemaError for a duplicate key, RangeError once ids no longer
    // fit `id_type`.
    const Definition& define(std::string key, std::vector<Field> fields);

    // Throws SchemaError if `key` is not defined.
    std::vector<uint8_t> dumps(std::string_view key, const Value& data) const;

    // Read the definition id, then that definition's fields.
    // Throws SchemaError for an unknown id.
    Packet loads(std::span<const uint8_t> data, size_t offset = 0) const;

    const Definition* find_by_key(std::string_view key) const;
    const Definition* find_by_id(uint32_t id) const;

    FieldType id_type() const { return id_type_; }
    ByteOrder byte_order() const { return byte_order_; }
    size_t    size() const { return definitions_.size(); }

   private:
    FieldType                                 id_type_;
    ByteOrder                                 byte_order_;
    uint64_t                                  next_id_ = 1;  // wider than any id type
    std::vector<std::unique_ptr<Definition>>  definitions_;
    std::unordered_map<std::string, size_t>   by_key_;
    std::unordered_map<uint32_t, size_t>      by_id_;
};

}  // namespace jettison
