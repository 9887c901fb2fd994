// Encode a document, decode it back, then exchange schema packets.

#include <cstdio>
#include <jettison/jettison.hpp>

using namespace jettison;

static void print_hex(const std::vector<uint8_t>& bytes)
{
    for (size_t i = 0; i < bytes.size(); ++i)
        std::printf("%02X%s", bytes[i], (i + 1) % 16 == 0 ? "\n" : " ");
    std::printf("\n");
}

int main()
{
    Logger::instance().add_sink(sinks::console_sink(false));

    // --- Self-describing values ---

    auto doc = Value::mapping({
        {"a", Value::integer(1)},
        {"b", Value::sequence({Value::boolean(true), Value::null()})},
    });

    auto bytes = encode(doc);
    std::printf("document encodes to %zu bytes:\n", bytes.size());
    print_hex(bytes);

    Value back = decode_exact(bytes);
    std::printf("round trip %s\n", back == doc ? "ok" : "MISMATCH");

    // --- Schema packets ---

    Schema schema;
    schema.define("spawn", {Field("id", FieldType::Uint16),
                            Field("x", FieldType::Float32),
                            Field("y", FieldType::Float32)});
    schema.define("health", {Field("id", FieldType::Uint16), Field("value", FieldType::Int8)});

    auto packet_bytes = schema.dumps("health", Value::mapping({{"id", Value::integer(3)},
                                                                {"value", Value::integer(-5)}}));
    std::printf("health packet is %zu bytes:\n", packet_bytes.size());
    print_hex(packet_bytes);

    Packet packet = schema.loads(packet_bytes);
    std::printf("decoded '%s' packet, value = %lld\n", packet.definition->key().c_str(),
                static_cast<long long>(packet.value.find("value")->as_int()));

    // --- Errors ---

    try
    {
        bytes.pop_back();
        decode(bytes);
    }
    catch (const TruncatedInputError& e)
    {
        std::printf("truncated buffer rejected: %s\n", e.what());
    }

    return 0;
}
