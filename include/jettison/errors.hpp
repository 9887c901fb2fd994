#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace jettison
{

// Base of every error the codec raises. All errors are input-validity
// failures for a single call; retrying with the same input fails again.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Decode read a tag byte outside the registry.
class UnknownTagError : public Error
{
   public:
    UnknownTagError(uint8_t tag, size_t offset);

    uint8_t tag() const { return tag_; }
    size_t  offset() const { return offset_; }

   private:
    uint8_t tag_;
    size_t  offset_;
};

// A read needed more bytes than remained in the buffer.
class TruncatedInputError : public Error
{
   public:
    TruncatedInputError(size_t offset, size_t needed, size_t available);

    size_t offset() const { return offset_; }
    size_t needed() const { return needed_; }
    size_t available() const { return available_; }

   private:
    size_t offset_;
    size_t needed_;
    size_t available_;
};

// decode_exact() found bytes left over after one complete value.
class TrailingDataError : public Error
{
   public:
    TrailingDataError(size_t consumed, size_t total);

    size_t consumed() const { return consumed_; }
    size_t total() const { return total_; }

   private:
    size_t consumed_;
    size_t total_;
};

// Text that is not well-formed UTF-8, on either side of the wire.
class EncodingError : public Error
{
   public:
    using Error::Error;
};

// Numeric value, length or count outside its committed width/signedness.
class RangeError : public Error
{
   public:
    using Error::Error;
};

class DepthExceededError : public Error
{
   public:
    explicit DepthExceededError(size_t limit);

    size_t limit() const { return limit_; }

   private:
    size_t limit_;
};

// The encoder met a container that is its own ancestor.
class CyclicValueError : public Error
{
   public:
    CyclicValueError();
};

// The decode buffer exceeds CodecOptions::max_input_size.
class InputTooLargeError : public Error
{
   public:
    InputTooLargeError(size_t size, size_t limit);

    size_t size() const { return size_; }
    size_t limit() const { return limit_; }

   private:
    size_t size_;
    size_t limit_;
};

// Misuse of a packet Schema/Definition: bad field declaration, unknown
// definition key or id, missing field, wrong value variant for a field.
class SchemaError : public Error
{
   public:
    using Error::Error;
};

}  // namespace jettison
