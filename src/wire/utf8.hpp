#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace jettison::wire
{

// Strict UTF-8 well-formedness (RFC 3629): rejects overlong forms, UTF-16
// surrogates (U+D800..U+DFFF), code points above U+10FFFF, stray
// continuation bytes and truncated sequences.
// Returns the byte index of the first offending sequence, or std::nullopt.
std::optional<size_t> find_invalid_utf8(std::string_view text);

inline bool is_valid_utf8(std::string_view text)
{
    return !find_invalid_utf8(text).has_value();
}

}  // namespace jettison::wire
