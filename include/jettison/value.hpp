#pragma once

#include <jettison/errors.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jettison
{

class Value;

using Bytes    = std::vector<uint8_t>;
using Sequence = std::vector<Value>;
using Member   = std::pair<std::string, Value>;
using Mapping  = std::vector<Member>;  // insertion-ordered

// ─── Value ───────────────────────────────────────────────────────────────────
// One node of the logical value domain: a closed variant with one case per
// wire variant. Scalars are held by value. Sequence and Mapping containers
// are held through a shared handle, so copying a Value shares its container
// the way references do in dynamic languages. This is also what makes a
// self-referential value representable; the encoder rejects those.

class Value
{
   public:
    // Order matches the storage variant's alternatives.
    enum class Kind : uint8_t
    {
        Null,
        Bool,
        Int,
        Float,
        String,
        Bytes,
        Sequence,
        Mapping
    };

    Value() = default;  // Null

    static Value null() { return Value(); }
    static Value boolean(bool v);
    static Value floating(double v);
    static Value string(std::string v);
    static Value bytes(Bytes v);
    static Value sequence(Sequence items = {});
    static Value mapping(Mapping members = {});

    // Accepts any integer type, including signed/unsigned char but not the
    // character types (char, wchar_t, char8_t..char32_t). Throws RangeError if
    // `v` does not fit in int64_t (e.g. a uint64_t above INT64_MAX). Never wraps.
    template <typename T>
    static Value integer(T v);

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_int() const { return kind() == Kind::Int; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_bytes() const { return kind() == Kind::Bytes; }
    bool is_sequence() const { return kind() == Kind::Sequence; }
    bool is_mapping() const { return kind() == Kind::Mapping; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool               as_bool() const { return std::get<bool>(data_); }
    int64_t            as_int() const { return std::get<int64_t>(data_); }
    double             as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Bytes&       as_bytes() const { return std::get<Bytes>(data_); }

    Sequence&       as_sequence() { return *std::get<std::shared_ptr<Sequence>>(data_); }
    const Sequence& as_sequence() const { return *std::get<std::shared_ptr<Sequence>>(data_); }
    Mapping&        as_mapping() { return *std::get<std::shared_ptr<Mapping>>(data_); }
    const Mapping&  as_mapping() const { return *std::get<std::shared_ptr<Mapping>>(data_); }

    // Element/pair count for containers, byte count for String and Bytes,
    // 0 for everything else.
    size_t size() const;

    // Mapping helpers. find() returns the first pair with `key`, or nullptr.
    // set() replaces the first match or appends.
    const Value* find(std::string_view key) const;
    void         set(std::string key, Value v);

    // Sequence helper.
    void push_back(Value v);

    // Address of the shared container for Sequence/Mapping, nullptr for
    // scalars. Two Values with the same identity share one container.
    const void* identity() const;

    static std::string_view kind_name(Kind kind);

    // Deep structural equality. Floats compare by bit pattern (NaN equals an
    // identical NaN, 0.0 differs from -0.0); Int never equals Float; Mapping
    // comparison is order-sensitive. Cyclic values compare without looping:
    // a container pair met again on the current path counts as equal.
    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

   private:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 Bytes,
                                 std::shared_ptr<Sequence>,
                                 std::shared_ptr<Mapping>>;

    Storage data_;
};

template <typename T>
Value Value::integer(T v)
{
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>
                      && !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t>
                      && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>,
                  "Value::integer requires an integer type; cast character types first");
    if (!std::in_range<int64_t>(v))
        throw RangeError("integer " + std::to_string(v) + " does not fit in int64");
    Value out;
    out.data_.template emplace<int64_t>(static_cast<int64_t>(v));
    return out;
}

}  // namespace jettison
