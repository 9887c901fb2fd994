#include <jettison/errors.hpp>

#include <cstdio>

namespace jettison
{

static std::string hex_byte(uint8_t b)
{
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(b));
    return buf;
}

UnknownTagError::UnknownTagError(uint8_t tag, size_t offset)
    : Error("unknown tag " + hex_byte(tag) + " at offset " + std::to_string(offset))
    , tag_(tag)
    , offset_(offset)
{
}

TruncatedInputError::TruncatedInputError(size_t offset, size_t needed, size_t available)
    : Error("truncated input at offset " + std::to_string(offset) + ": need "
            + std::to_string(needed) + " bytes but only " + std::to_string(available)
            + " remaining")
    , offset_(offset)
    , needed_(needed)
    , available_(available)
{
}

TrailingDataError::TrailingDataError(size_t consumed, size_t total)
    : Error("trailing data: value ends at offset " + std::to_string(consumed) + " of "
            + std::to_string(total) + " bytes")
    , consumed_(consumed)
    , total_(total)
{
}

DepthExceededError::DepthExceededError(size_t limit)
    : Error("nesting depth exceeds limit of " + std::to_string(limit))
    , limit_(limit)
{
}

CyclicValueError::CyclicValueError()
    : Error("value contains a container that references itself")
{
}

InputTooLargeError::InputTooLargeError(size_t size, size_t limit)
    : Error("input of " + std::to_string(size) + " bytes exceeds limit of "
            + std::to_string(limit) + " bytes")
    , size_(size)
    , limit_(limit)
{
}

}  // namespace jettison
