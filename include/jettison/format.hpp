#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jettison
{

// ─── Wire format constants ───────────────────────────────────────────────────
// Changing any value in this file is a breaking wire-format change and must
// bump FORMAT_VERSION.

static constexpr uint32_t FORMAT_VERSION    = 1;
static constexpr size_t   LENGTH_FIELD_SIZE = 4;           // u32 lengths/counts
static constexpr uint64_t MAX_LENGTH        = 0xFFFFFFFFu;  // largest u32 length/count
static constexpr size_t   DEFAULT_MAX_DEPTH = 1000;

enum class ByteOrder : uint8_t
{
    Little,
    Big
};

// Every multi-byte field of the self-describing format is little-endian.
static constexpr ByteOrder WIRE_BYTE_ORDER = ByteOrder::Little;

// ─── Type tags ───────────────────────────────────────────────────────────────
// Wire layout per tag (all multi-byte fields little-endian):
//   0x00 NULL      -
//   0x01 FALSE     -
//   0x02 TRUE      -
//   0x03 INT       int64   (8 bytes, two's complement)
//   0x04 FLOAT     float64 (8 bytes, IEEE 754 bit pattern)
//   0x05 STRING    [len: u32] [len bytes of UTF-8]
//   0x06 BYTES     [len: u32] [len raw bytes]
//   0x07 SEQUENCE  [count: u32] [count tagged values]
//   0x08 MAPPING   [count: u32] [count x ([klen: u32] [klen bytes UTF-8] [tagged value])]
// Tags 0x09-0xFF are unassigned and always rejected.

enum class Tag : uint8_t
{
    NULL_VALUE = 0x00,
    BOOL_FALSE = 0x01,
    BOOL_TRUE  = 0x02,
    INT        = 0x03,
    FLOAT      = 0x04,
    STRING     = 0x05,
    BYTES      = 0x06,
    SEQUENCE   = 0x07,
    MAPPING    = 0x08,
};

enum class PayloadShape : uint8_t
{
    Empty,         // tag only
    Fixed,         // fixed_size bytes
    LengthPrefix,  // u32 length + raw bytes
    Container,     // u32 count + nested units
};

struct TagInfo
{
    Tag              tag;
    std::string_view name;
    PayloadShape     shape;
    size_t           fixed_size;  // payload bytes for Fixed; 0 otherwise
};

// Registry lookups (src/wire/tags.cpp).

// Returns true if `byte` is an assigned tag.
bool is_known_tag(uint8_t byte) noexcept;

// Validates `byte` as a tag. Throws UnknownTagError (reporting `offset`)
// for unassigned values.
Tag tag_from_byte(uint8_t byte, size_t offset = 0);

const TagInfo&   tag_info(Tag tag);
std::string_view tag_name(Tag tag);

}  // namespace jettison
