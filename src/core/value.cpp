#include <jettison/value.hpp>

#include <bit>
#include <set>
#include <utility>

namespace jettison
{

Value Value::boolean(bool v)
{
    Value out;
    out.data_.emplace<bool>(v);
    return out;
}

Value Value::floating(double v)
{
    Value out;
    out.data_.emplace<double>(v);
    return out;
}

Value Value::string(std::string v)
{
    Value out;
    out.data_.emplace<std::string>(std::move(v));
    return out;
}

Value Value::bytes(Bytes v)
{
    Value out;
    out.data_.emplace<Bytes>(std::move(v));
    return out;
}

Value Value::sequence(Sequence items)
{
    Value out;
    out.data_.emplace<std::shared_ptr<Sequence>>(std::make_shared<Sequence>(std::move(items)));
    return out;
}

Value Value::mapping(Mapping members)
{
    Value out;
    out.data_.emplace<std::shared_ptr<Mapping>>(std::make_shared<Mapping>(std::move(members)));
    return out;
}

size_t Value::size() const
{
    switch (kind())
    {
        case Kind::String:
            return as_string().size();
        case Kind::Bytes:
            return as_bytes().size();
        case Kind::Sequence:
            return as_sequence().size();
        case Kind::Mapping:
            return as_mapping().size();
        default:
            return 0;
    }
}

const Value* Value::find(std::string_view key) const
{
    for (const auto& [k, v] : as_mapping())
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

void Value::set(std::string key, Value v)
{
    auto& members = as_mapping();
    for (auto& [k, existing] : members)
    {
        if (k == key)
        {
            existing = std::move(v);
            return;
        }
    }
    members.emplace_back(std::move(key), std::move(v));
}

void Value::push_back(Value v)
{
    as_sequence().push_back(std::move(v));
}

const void* Value::identity() const
{
    if (const auto* seq = std::get_if<std::shared_ptr<Sequence>>(&data_))
        return seq->get();
    if (const auto* map = std::get_if<std::shared_ptr<Mapping>>(&data_))
        return map->get();
    return nullptr;
}

std::string_view Value::kind_name(Kind kind)
{
    switch (kind)
    {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "int";
        case Kind::Float:
            return "float";
        case Kind::String:
            return "string";
        case Kind::Bytes:
            return "bytes";
        case Kind::Sequence:
            return "sequence";
        case Kind::Mapping:
            return "mapping";
    }
    return "unknown";
}

// Container pairs currently being compared. Revisiting a pair means both
// sides cycle back at the same place, so that branch compares equal.
using ComparePath = std::set<std::pair<const void*, const void*>>;

static bool equal(const Value& a, const Value& b, ComparePath& path)
{
    if (a.kind() != b.kind())
        return false;

    switch (a.kind())
    {
        case Value::Kind::Null:
            return true;
        case Value::Kind::Bool:
            return a.as_bool() == b.as_bool();
        case Value::Kind::Int:
            return a.as_int() == b.as_int();
        case Value::Kind::Float:
            return std::bit_cast<uint64_t>(a.as_float()) == std::bit_cast<uint64_t>(b.as_float());
        case Value::Kind::String:
            return a.as_string() == b.as_string();
        case Value::Kind::Bytes:
            return a.as_bytes() == b.as_bytes();
        case Value::Kind::Sequence:
        case Value::Kind::Mapping:
            break;
    }

    if (a.identity() == b.identity())
        return true;
    auto key = std::make_pair(a.identity(), b.identity());
    if (!path.insert(key).second)
        return true;

    bool same = true;
    if (a.is_sequence())
    {
        const auto& x = a.as_sequence();
        const auto& y = b.as_sequence();
        same          = x.size() == y.size();
        for (size_t i = 0; same && i < x.size(); ++i)
            same = equal(x[i], y[i], path);
    }
    else
    {
        const auto& x = a.as_mapping();
        const auto& y = b.as_mapping();
        same          = x.size() == y.size();
        for (size_t i = 0; same && i < x.size(); ++i)
            same = x[i].first == y[i].first && equal(x[i].second, y[i].second, path);
    }

    path.erase(key);
    return same;
}

bool operator==(const Value& a, const Value& b)
{
    ComparePath path;
    return equal(a, b, path);
}

}  // namespace jettison
