#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

#include "../dmconcept/include/dmconcept/dmconcept.hpp"

using namespace dmconcept;

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct Fixture {
    NDArray array;
    ArrayMetadata metadata;
};

/// Square image when `spectrum_length` is 0, otherwise a width x width spectrum image
Fixture make_fixture(uint64_t width, uint64_t spectrum_length) {
    Fixture fixture;
    std::vector<uint64_t> shape{width, width};
    if (spectrum_length > 0) {
        shape.push_back(spectrum_length);
    }
    uint64_t count = 1;
    for (uint64_t extent : shape) {
        count *= extent;
    }
    std::vector<float> values(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i % 4096);
    }
    fixture.array = NDArray::from_values<float>(DataType::Float32, shape, values);
    fixture.metadata = ArrayMetadata::plain(DataType::Float32, shape);
    if (spectrum_length > 0) {
        fixture.metadata.axes[1].kind = AxisKind::Collection;
        fixture.metadata.axes[2].calibration = Calibration{0.0, 0.5, "eV"};
    }
    return fixture;
}

StreamingParams params_for(int64_t mode) {
    // 0: in memory, 1: streamed with 1 MiB chunks
    return mode == 0 ? StreamingParams::in_memory() : StreamingParams::always(1 << 20);
}

} // namespace

// ============================================================================
// Encode
// ============================================================================

static void BM_Encode(benchmark::State& state) {
    // Params: width, spectrum length, streaming mode, version
    const Fixture fixture = make_fixture(static_cast<uint64_t>(state.range(0)), static_cast<uint64_t>(state.range(1)));
    const CodecOptions options{params_for(state.range(2))};
    const DmVersion version = state.range(3) == 3 ? DmVersion::DM3 : DmVersion::DM4;

    BufferWriter sink;
    int64_t bytes_processed = 0;
    for (auto _ : state) {
        auto res = encode(fixture.array, fixture.metadata, sink, version, options);
        if (res.is_error()) {
            state.SkipWithError(("Failed to encode " + res.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(sink.data().data());
        bytes_processed += static_cast<int64_t>(fixture.array.data.size());
    }

    state.SetBytesProcessed(bytes_processed);
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Decode
// ============================================================================

static void BM_Decode(benchmark::State& state) {
    // Params: width, spectrum length, streaming mode, version
    const Fixture fixture = make_fixture(static_cast<uint64_t>(state.range(0)), static_cast<uint64_t>(state.range(1)));
    const CodecOptions options{params_for(state.range(2))};
    const DmVersion version = state.range(3) == 3 ? DmVersion::DM3 : DmVersion::DM4;

    BufferWriter file;
    auto encoded = encode(fixture.array, fixture.metadata, file, version);
    if (encoded.is_error()) {
        state.SkipWithError(("Failed to prepare the file " + encoded.error().message).c_str());
        return;
    }
    BufferViewReader source{file.buffer()};

    int64_t bytes_processed = 0;
    for (auto _ : state) {
        auto decoded = decode(source, options);
        if (decoded.is_error()) {
            state.SkipWithError(("Failed to decode " + decoded.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(decoded.value().array.data.data());
        bytes_processed += static_cast<int64_t>(fixture.array.data.size());
    }

    state.SetBytesProcessed(bytes_processed);
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Tag tree only
// ============================================================================

static void BM_ReadTagTree(benchmark::State& state) {
    // Params: width; the payload stays in the source
    const Fixture fixture = make_fixture(static_cast<uint64_t>(state.range(0)), 0);

    BufferWriter file;
    auto encoded = encode(fixture.array, fixture.metadata, file);
    if (encoded.is_error()) {
        state.SkipWithError(("Failed to prepare the file " + encoded.error().message).c_str());
        return;
    }
    BufferViewReader source{file.buffer()};
    const TreeDecodeOptions options{StreamingParams::min_external_bytes};

    for (auto _ : state) {
        auto tree = read_tag_file(source, options);
        if (tree.is_error()) {
            state.SkipWithError(("Failed to read the tag tree " + tree.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(tree.value().root);
    }
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Registration
// ============================================================================

BENCHMARK(BM_Encode)
    ->Args({1024, 0, 0, 4})     // 1024x1024 image, in memory
    ->Args({1024, 0, 1, 4})     // 1024x1024 image, streamed
    ->Args({1024, 0, 0, 3})     // DM3
    ->Args({64, 1024, 0, 4})    // 64x64x1024 spectrum image, in memory
    ->Args({64, 1024, 1, 4})    // 64x64x1024 spectrum image, streamed
    ->Name("DmConcept/Encode")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Decode)
    ->Args({1024, 0, 0, 4})
    ->Args({1024, 0, 1, 4})
    ->Args({1024, 0, 0, 3})
    ->Args({64, 1024, 0, 4})
    ->Args({64, 1024, 1, 4})
    ->Name("DmConcept/Decode")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadTagTree)
    ->Arg(512)
    ->Arg(2048)
    ->Name("DmConcept/ReadTagTree")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
