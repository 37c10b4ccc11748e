#include <benchmark/benchmark.h>
#include <string>
#include <vector>
#include "prism_con.hpp"

// ---------------------------------------------------------------------------
// BM_Highlight_NoKeywords
// Only the separator layer: measures the splitting baseline.
// ---------------------------------------------------------------------------
static void BM_Highlight_NoKeywords(benchmark::State& state) {
    prism::Palette palette = prism::Palette::make(true);
    std::vector<prism::KeywordLayer> layers;

    for (auto _ : state) {
        std::string out = prism::HighlightFormatter::format(
            "prism|26-01-01 00:00:00.000| request served\n", palette.dull, layers, palette, "|");
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Highlight_NoKeywords);

// ---------------------------------------------------------------------------
// BM_Highlight_Keywords
// Scoped, global and status layers all populated.
// ---------------------------------------------------------------------------
static void BM_Highlight_Keywords(benchmark::State& state) {
    prism::Palette palette = prism::Palette::make(true);
    prism::WordColourMap high, low, global, status;
    high["request"] = "";
    high["served"] = palette.user;
    low["ms"] = "";
    global["prism"] = "";
    status[prism::kStatusStat] = palette.stat;
    status[prism::kStatusWarn] = palette.warn;
    status[prism::kStatusError] = palette.error;

    std::vector<prism::KeywordLayer> layers;
    layers.push_back(prism::KeywordLayer(&high, palette.highlight));
    layers.push_back(prism::KeywordLayer(&low, palette.lowlight));
    layers.push_back(prism::KeywordLayer(&global, palette.highlight));
    layers.push_back(prism::KeywordLayer(&status, palette.highlight));

    for (auto _ : state) {
        std::string out = prism::HighlightFormatter::format(
            "prism|STAT|26-01-01 00:00:00.000| request served in 12 ms\n",
            palette.dull, layers, palette, "|");
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Highlight_Keywords);

// ---------------------------------------------------------------------------
// BM_ErrorPrefix
// Line-prefix injection done for every error fragment.
// ---------------------------------------------------------------------------
static void BM_ErrorPrefix(benchmark::State& state) {
    std::string text = "first line\nsecond line\nthird line\n";
    std::string prefix = prism::Palette::make(true).stderrPrefix;

    for (auto _ : state) {
        std::string out = prism::detail::replaceAll(text, "\n", "\n" + prefix);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ErrorPrefix);

// ---------------------------------------------------------------------------
// BM_LogPrefix
// Timestamped "prefix|type|timestamp|" construction.
// ---------------------------------------------------------------------------
static void BM_LogPrefix(benchmark::State& state) {
    prism::ConsoleContext ctx(prism::Palette::make(false), "prism", std::chrono::milliseconds(20));

    for (auto _ : state) {
        std::string out = ctx.logPrefix(prism::kStatusStat);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LogPrefix);
