// bm_binary.cpp created on 2026-10-18 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include <benchmark/benchmark.h>
#include <pnt/data/BinaryWriter.h>
#include <pnt/data/BinaryReader.h>
#include <pnt/data/Crc32.h>

#include <string>

using namespace pnt::data;


static Value make_config(int n_items)
{
    Array items;
    for (int i = 0; i != n_items; ++i) {
        items.push_back(Object{
            {"id", uint32_t(i)},
            {"name", "item " + std::to_string(i)},
            {"weight", 0.5 * i},
            {"enabled", i % 2 == 0},
        });
    }
    return Object{{"version", 1}, {"items", std::move(items)}};
}


static Bytes encode(const Value& value)
{
    Bytes out;
    VectorSink sink(out);
    BinaryWriter writer(sink);
    writer.write_value(value);
    writer.close();
    return out;
}


static void bm_write_value(benchmark::State& state) {
    const auto config = make_config(int(state.range(0)));
    for (auto _ : state) {
        auto out = encode(config);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(encoded_size(config)));
}
BENCHMARK(bm_write_value)->Arg(10)->Arg(1000);


static void bm_read_value(benchmark::State& state) {
    const auto data = encode(make_config(int(state.range(0))));
    for (auto _ : state) {
        MemorySource source(data);
        BinaryReader reader(source);
        auto value = reader.read_value();
        benchmark::DoNotOptimize(value);
    }
    state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(data.size()));
}
BENCHMARK(bm_read_value)->Arg(10)->Arg(1000);


static void bm_crc32(benchmark::State& state) {
    const Bytes data(size_t(state.range(0)), std::byte{0x5A});
    for (auto _ : state)
        benchmark::DoNotOptimize(Crc32::calculate(data));
    state.SetBytesProcessed(int64_t(state.iterations()) * state.range(0));
}
BENCHMARK(bm_crc32)->Arg(64)->Arg(64 * 1024);


BENCHMARK_MAIN();
