#pragma once

#include "byte_sink.hpp"

#include <jettison/codec.hpp>
#include <jettison/value.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace jettison::wire
{

// ─── Encoder ─────────────────────────────────────────────────────────────────
// Writes one tagged unit per value, depth-first preorder. Tracks the
// containers on the current path to reject cycles, and the nesting depth to
// bound recursion. Single use: construct, encode(), take().

class Encoder
{
   public:
    explicit Encoder(const CodecOptions& options);

    void                 encode(const Value& value);
    std::vector<uint8_t> take() { return sink_.take(); }

   private:
    void encode_value(const Value& value, size_t depth);
    void encode_sequence(const Value& value, size_t depth);
    void encode_mapping(const Value& value, size_t depth);

    // Enter/leave a container. `depth` is the container's own depth.
    void enter(const Value& container, size_t depth);
    void leave(const Value& container);

    void put_tag(Tag tag) { sink_.put_u8(static_cast<uint8_t>(tag)); }
    void put_length(size_t n, std::string_view what);
    void put_text(std::string_view text, std::string_view what);

    CodecOptions                    options_;
    ByteSink                        sink_;
    std::unordered_set<const void*> active_;
};

}  // namespace jettison::wire
