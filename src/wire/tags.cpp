#include <jettison/errors.hpp>
#include <jettison/format.hpp>

#include <array>

namespace jettison
{

// ─── Tag registry ────────────────────────────────────────────────────────────
// Indexed by tag value; entries must stay in tag order.

static constexpr std::array<TagInfo, 9> TAG_TABLE = {{
    {Tag::NULL_VALUE, "null", PayloadShape::Empty, 0},
    {Tag::BOOL_FALSE, "false", PayloadShape::Empty, 0},
    {Tag::BOOL_TRUE, "true", PayloadShape::Empty, 0},
    {Tag::INT, "int", PayloadShape::Fixed, 8},
    {Tag::FLOAT, "float", PayloadShape::Fixed, 8},
    {Tag::STRING, "string", PayloadShape::LengthPrefix, 0},
    {Tag::BYTES, "bytes", PayloadShape::LengthPrefix, 0},
    {Tag::SEQUENCE, "sequence", PayloadShape::Container, 0},
    {Tag::MAPPING, "mapping", PayloadShape::Container, 0},
}};

static_assert([] {
    for (size_t i = 0; i < TAG_TABLE.size(); ++i)
    {
        if (static_cast<size_t>(TAG_TABLE[i].tag) != i)
            return false;
    }
    return true;
}());

bool is_known_tag(uint8_t byte) noexcept
{
    return byte < TAG_TABLE.size();
}

Tag tag_from_byte(uint8_t byte, size_t offset)
{
    if (!is_known_tag(byte))
        throw UnknownTagError(byte, offset);
    return TAG_TABLE[byte].tag;
}

const TagInfo& tag_info(Tag tag)
{
    auto byte = static_cast<uint8_t>(tag);
    if (!is_known_tag(byte))
        throw UnknownTagError(byte, 0);
    return TAG_TABLE[byte];
}

std::string_view tag_name(Tag tag)
{
    return tag_info(tag).name;
}

}  // namespace jettison
