#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include <jettison/errors.hpp>
#include <jettison/schema.hpp>

using namespace jettison;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static void define_game_packets(Schema& schema)
{
    schema.define("spawn", {Field("id", FieldType::Uint16),
                            Field("x", FieldType::Float32),
                            Field("y", FieldType::Float32)});
    schema.define("health", {Field("id", FieldType::Uint16), Field("value", FieldType::Int8)});
}

// ═══════════════════════════════════════════════════════════════════════════════
// Field types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SchemaFieldType, NamesRoundTrip)
{
    for (auto name : {"boolean", "int8", "int16", "int32", "uint8", "uint16", "uint32",
                      "float32", "float64", "string", "array"})
    {
        EXPECT_EQ(field_type_name(field_type_from_name(name)), name);
    }
    EXPECT_THROW(field_type_from_name("int64"), SchemaError);
}

TEST(SchemaFieldType, Sizes)
{
    EXPECT_EQ(field_type_size(FieldType::Boolean), 1u);
    EXPECT_EQ(field_type_size(FieldType::Int16), 2u);
    EXPECT_EQ(field_type_size(FieldType::Uint32), 4u);
    EXPECT_EQ(field_type_size(FieldType::Float64), 8u);
    EXPECT_FALSE(field_type_size(FieldType::String).has_value());
    EXPECT_FALSE(field_type_size(FieldType::Array).has_value());
}

TEST(SchemaField, Validation)
{
    EXPECT_THROW(Field("", FieldType::Int8), SchemaError);
    EXPECT_THROW(Field("list", FieldType::Array), SchemaError);
    EXPECT_THROW(Field("list", FieldType::Array, FieldType::String), SchemaError);
    EXPECT_NO_THROW(Field("list", FieldType::Array, FieldType::Uint8));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Definition
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SchemaDefinition, BigEndianLayout)
{
    Definition def({Field("a", FieldType::Uint16), Field("b", FieldType::Int32),
                    Field("ok", FieldType::Boolean)});

    auto bytes = def.dumps(Value::mapping({{"a", Value::integer(0x0102)},
                                           {"b", Value::integer(-2)},
                                           {"ok", Value::boolean(true)}}));
    std::vector<uint8_t> expected = {0x01, 0x02, 0xFF, 0xFF, 0xFF, 0xFE, 0x01};
    EXPECT_EQ(bytes, expected);
}

TEST(SchemaDefinition, LittleEndianLayout)
{
    Definition def({Field("a", FieldType::Uint16)}, 0, "le", ByteOrder::Little);
    auto       bytes = def.dumps(Value::mapping({{"a", Value::integer(0x0102)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x02, 0x01}));
}

TEST(SchemaDefinition, StringsAndArrays)
{
    Definition def({Field("name", FieldType::String),
                    Field("scores", FieldType::Array, FieldType::Uint8)});

    auto data  = Value::mapping({{"name", Value::string("ab")},
                                 {"scores", Value::sequence({Value::integer(1), Value::integer(2)})}});
    auto bytes = def.dumps(data);
    std::vector<uint8_t> expected = {0x00, 0x00, 0x00, 0x02, 'a', 'b',
                                     0x00, 0x00, 0x00, 0x02, 0x01, 0x02};
    EXPECT_EQ(bytes, expected);

    auto result = def.loads(bytes);
    EXPECT_EQ(result.value, data);
    EXPECT_EQ(result.next_offset, bytes.size());
}

TEST(SchemaDefinition, ExtraKeysAreIgnoredAndOrderFollowsFields)
{
    Definition def({Field("first", FieldType::Uint8), Field("second", FieldType::Uint8)});
    auto       bytes = def.dumps(Value::mapping({{"extra", Value::string("x")},
                                                 {"second", Value::integer(2)},
                                                 {"first", Value::integer(1)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x01, 0x02}));

    auto out = def.loads(bytes).value;
    EXPECT_EQ(out.as_mapping()[0].first, "first");
    EXPECT_EQ(out.as_mapping()[1].first, "second");
}

TEST(SchemaDefinition, EncodeErrors)
{
    Definition def({Field("n", FieldType::Int8), Field("f", FieldType::Float32)});

    EXPECT_THROW(def.dumps(Value::sequence()), SchemaError);
    EXPECT_THROW(def.dumps(Value::mapping({{"n", Value::integer(1)}})), SchemaError);
    EXPECT_THROW(def.dumps(Value::mapping({{"n", Value::string("1")},
                                           {"f", Value::floating(0.0)}})),
                 SchemaError);
    EXPECT_THROW(def.dumps(Value::mapping({{"n", Value::integer(128)},
                                           {"f", Value::floating(0.0)}})),
                 RangeError);
    EXPECT_THROW(def.dumps(Value::mapping({{"n", Value::integer(-129)},
                                           {"f", Value::floating(0.0)}})),
                 RangeError);
    EXPECT_THROW(def.dumps(Value::mapping({{"n", Value::integer(0)},
                                           {"f", Value::floating(1e300)}})),
                 RangeError);
}

TEST(SchemaDefinition, Float32AcceptsValuesRoundingToMax)
{
    Definition def({Field("f", FieldType::Float32)});

    auto bytes = def.dumps(Value::mapping({{"f", Value::floating(3.4028235e38)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x7F, 0x7F, 0xFF, 0xFF}));

    bytes = def.dumps(Value::mapping({{"f", Value::floating(-3.4028235e38)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0xFF, 0x7F, 0xFF, 0xFF}));

    // Infinity is not an overflow; 3.5e38 rounds past the largest float.
    bytes = def.dumps(Value::mapping({{"f", Value::floating(INFINITY)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x7F, 0x80, 0x00, 0x00}));
    EXPECT_THROW(def.dumps(Value::mapping({{"f", Value::floating(3.5e38)}})), RangeError);
}

TEST(SchemaDefinition, DecodeErrors)
{
    Definition def({Field("s", FieldType::String), Field("v", FieldType::Array, FieldType::Uint32)});

    std::vector<uint8_t> truncated = {0x00, 0x00, 0x00, 0x05, 'a'};
    EXPECT_THROW(def.loads(truncated), TruncatedInputError);

    std::vector<uint8_t> bad_text = {0x00, 0x00, 0x00, 0x01, 0xFF, 0x00, 0x00, 0x00, 0x00};
    EXPECT_THROW(def.loads(bad_text), EncodingError);

    std::vector<uint8_t> forged = {0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_THROW(def.loads(forged), TruncatedInputError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Schema
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Schema, IdsStartAtOne)
{
    Schema schema;
    define_game_packets(schema);

    EXPECT_EQ(schema.size(), 2u);
    EXPECT_EQ(schema.find_by_key("spawn")->id(), 1u);
    EXPECT_EQ(schema.find_by_key("health")->id(), 2u);
    EXPECT_EQ(schema.find_by_id(2)->key(), "health");
    EXPECT_EQ(schema.find_by_id(3), nullptr);
    EXPECT_EQ(schema.find_by_key("missing"), nullptr);
}

TEST(Schema, SpawnPacketLayout)
{
    Schema schema;
    define_game_packets(schema);

    auto bytes = schema.dumps("spawn", Value::mapping({{"id", Value::integer(7)},
                                                        {"x", Value::floating(1.5)},
                                                        {"y", Value::floating(-2.0)}}));
    std::vector<uint8_t> expected = {
        0x01,                    // definition id
        0x00, 0x07,              // id
        0x3F, 0xC0, 0x00, 0x00,  // 1.5f
        0xC0, 0x00, 0x00, 0x00,  // -2.0f
    };
    EXPECT_EQ(bytes, expected);

    auto packet = schema.loads(bytes);
    ASSERT_NE(packet.definition, nullptr);
    EXPECT_EQ(packet.definition->key(), "spawn");
    EXPECT_EQ(packet.value.find("id")->as_int(), 7);
    EXPECT_DOUBLE_EQ(packet.value.find("x")->as_float(), 1.5);
    EXPECT_DOUBLE_EQ(packet.value.find("y")->as_float(), -2.0);
    EXPECT_EQ(packet.next_offset, bytes.size());
}

TEST(Schema, PacketsInOneBuffer)
{
    Schema schema;
    define_game_packets(schema);

    auto buf    = schema.dumps("health", Value::mapping({{"id", Value::integer(3)},
                                                          {"value", Value::integer(-5)}}));
    auto second = schema.dumps("health", Value::mapping({{"id", Value::integer(4)},
                                                          {"value", Value::integer(100)}}));
    buf.insert(buf.end(), second.begin(), second.end());

    auto p1 = schema.loads(buf);
    EXPECT_EQ(p1.value.find("value")->as_int(), -5);
    auto p2 = schema.loads(buf, p1.next_offset);
    EXPECT_EQ(p2.value.find("id")->as_int(), 4);
    EXPECT_EQ(p2.next_offset, buf.size());
}

TEST(Schema, WiderIdType)
{
    Schema schema(FieldType::Uint16);
    schema.define("ping", {Field("seq", FieldType::Uint8)});
    auto bytes = schema.dumps("ping", Value::mapping({{"seq", Value::integer(9)}}));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x00, 0x01, 0x09}));
}

TEST(Schema, Errors)
{
    EXPECT_THROW(Schema{FieldType::Int8}, SchemaError);
    EXPECT_THROW(Schema{FieldType::String}, SchemaError);

    Schema schema;
    define_game_packets(schema);
    EXPECT_THROW(schema.define("spawn", {}), SchemaError);
    EXPECT_THROW(schema.dumps("unknown", Value::mapping()), SchemaError);

    std::vector<uint8_t> unknown_id = {0x09, 0x00};
    EXPECT_THROW(schema.loads(unknown_id), SchemaError);
}

TEST(Schema, IdSpaceExhaustion)
{
    Schema schema(FieldType::Uint8);
    for (int i = 1; i <= 255; ++i)
        schema.define("def" + std::to_string(i), {});
    EXPECT_THROW(schema.define("overflow", {}), RangeError);
    EXPECT_EQ(schema.size(), 255u);
}

TEST(Schema, WideIdSpaceExhaustion)
{
    Schema schema(FieldType::Uint16);
    for (int i = 1; i <= 65535; ++i)
        schema.define("def" + std::to_string(i), {});
    EXPECT_EQ(schema.find_by_key("def65535")->id(), 65535u);
    EXPECT_THROW(schema.define("overflow", {}), RangeError);
    EXPECT_EQ(schema.size(), 65535u);
}
