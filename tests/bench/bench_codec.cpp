#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include <jettison/codec.hpp>
#include <jettison/schema.hpp>

using namespace jettison;

// --- Helpers ---

static Value make_records(std::size_t n)
{
    Sequence records;
    records.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        records.push_back(Value::mapping({
            {"id", Value::integer(static_cast<int64_t>(i))},
            {"name", Value::string("record-" + std::to_string(i))},
            {"score", Value::floating(static_cast<double>(i) * 0.5)},
            {"active", Value::boolean(i % 2 == 0)},
            {"tags", Value::sequence({Value::string("a"), Value::string("b")})},
        }));
    }
    return Value::sequence(std::move(records));
}

static Value make_nested(std::size_t depth)
{
    Value v = Value::null();
    for (std::size_t i = 0; i < depth; ++i)
        v = Value::sequence({v});
    return v;
}

// --- Codec benchmarks ---

static void BM_EncodeRecords(benchmark::State& state)
{
    auto doc = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state)
    {
        auto bytes = encode(doc);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeRecords)->Arg(10)->Arg(1000)->Arg(100000);

static void BM_DecodeRecords(benchmark::State& state)
{
    auto bytes = encode(make_records(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state)
    {
        auto result = decode(bytes);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_DecodeRecords)->Arg(10)->Arg(1000)->Arg(100000);

static void BM_EncodeLargeBytes(benchmark::State& state)
{
    auto blob = Value::bytes(Bytes(static_cast<std::size_t>(state.range(0)), 0xAB));
    for (auto _ : state)
    {
        auto bytes = encode(blob);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeLargeBytes)->Arg(1 << 10)->Arg(1 << 20)->Arg(16 << 20);

static void BM_DecodeLongString(benchmark::State& state)
{
    auto bytes = encode(Value::string(std::string(static_cast<std::size_t>(state.range(0)), 'x')));
    for (auto _ : state)
    {
        auto result = decode(bytes);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeLongString)->Arg(1 << 10)->Arg(1 << 20);

static void BM_RoundTripNested(benchmark::State& state)
{
    auto doc = make_nested(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state)
    {
        auto result = decode_exact(encode(doc));
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RoundTripNested)->Arg(10)->Arg(500)->Arg(1000);

// --- Schema benchmarks ---

static void BM_SchemaPacket(benchmark::State& state)
{
    Schema schema;
    schema.define("spawn", {Field("id", FieldType::Uint16),
                            Field("x", FieldType::Float32),
                            Field("y", FieldType::Float32)});
    auto data = Value::mapping({{"id", Value::integer(7)},
                                {"x", Value::floating(1.5)},
                                {"y", Value::floating(-2.0)}});
    for (auto _ : state)
    {
        auto packet = schema.loads(schema.dumps("spawn", data));
        benchmark::DoNotOptimize(packet);
    }
}
BENCHMARK(BM_SchemaPacket);

BENCHMARK_MAIN();
