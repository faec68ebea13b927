// docpatch-cpp benchmarks: throughput of the pointer, patch and diff paths

#include <docpatch-cpp/docpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

using namespace docpatch_cpp;

// A plan with `n` layers, each carrying a few activities.
static auto make_plan(std::int64_t n) -> Document {
    auto layers = Document::array();
    for (std::int64_t i = 0; i < n; ++i) {
        layers.push_back({
            {"id", "T" + std::to_string(i)},
            {"name", "Layer " + std::to_string(i)},
            {"activities", {{{"type", "build"}}, {{"type", "test"}}}},
        });
    }
    auto doc = Document::object();
    doc["layers"] = std::move(layers);
    return doc;
}

// =============================================================================
// Pointers
// =============================================================================

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto ptr = Pointer::parse("/layers/42/activities/1/type");
        benchmark::DoNotOptimize(ptr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse);

static void bm_pointer_get(benchmark::State& state) {
    const auto doc = make_plan(100);
    const auto ptr = Pointer::parse("/layers/50/activities/1/type");
    for (auto _ : state) {
        const auto& value = get(doc, ptr);
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_get);

static void bm_array_insert_front(benchmark::State& state) {
    auto doc = make_plan(state.range(0));
    const auto ptr = Pointer::parse("/layers/0");
    for (auto _ : state) {
        add(doc, ptr, Document{{"id", "new"}});
        remove(doc, ptr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_array_insert_front)->Range(10, 1000);

// =============================================================================
// Patches
// =============================================================================

static void bm_apply_patch(benchmark::State& state) {
    const auto doc = make_plan(100);
    const auto patch = parse_patch(parse_document(R"([
        {"op": "test", "path": "/layers/0/id", "value": "T0"},
        {"op": "copy", "from": "/layers/0", "path": "/layers/-"},
        {"op": "replace", "path": "/layers/100/name", "value": "Copy"},
        {"op": "move", "from": "/layers/1", "path": "/layers/-"},
        {"op": "remove", "path": "/layers/2"}
    ])"));
    for (auto _ : state) {
        auto result = patched(doc, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.size()));
}
BENCHMARK(bm_apply_patch);

static void bm_clone_layer(benchmark::State& state) {
    const auto doc = make_plan(state.range(0));
    const auto source = Pointer::parse("/layers/0");
    const auto dest = Pointer::parse("/layers/-");
    for (auto _ : state) {
        auto scratch = doc;
        clone(scratch, source, dest, "Clone");
        benchmark::DoNotOptimize(scratch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_clone_layer)->Range(10, 1000);

// =============================================================================
// Serialization and diff
// =============================================================================

static void bm_serialize(benchmark::State& state) {
    const auto doc = make_plan(state.range(0));
    for (auto _ : state) {
        auto text = serialize(doc);
        benchmark::DoNotOptimize(text);
        state.SetBytesProcessed(static_cast<std::int64_t>(text.size()));
    }
}
BENCHMARK(bm_serialize)->Range(10, 1000);

static void bm_unified_diff(benchmark::State& state) {
    const auto before = make_plan(state.range(0));
    auto after = before;
    after["layers"][0]["name"] = "Renamed";
    after["layers"].back()["name"] = "Renamed too";
    const auto a = serialize(before);
    const auto b = serialize(after);
    for (auto _ : state) {
        auto diff = unified_diff(a, b, "before", "after");
        benchmark::DoNotOptimize(diff);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_unified_diff)->Range(10, 1000);

static void bm_sha256(benchmark::State& state) {
    const auto text = serialize(make_plan(100));
    for (auto _ : state) {
        auto digest = sha256_hex(text);
        benchmark::DoNotOptimize(digest);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_sha256);
