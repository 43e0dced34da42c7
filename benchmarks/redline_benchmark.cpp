// redline-cpp benchmarks — measures throughput of the diff pipeline.

#include <redline-cpp/redline.hpp>

#include "samples.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace redline_cpp;

// A long procedure where every tenth step is edited.
static auto make_procedure(std::size_t steps, bool edited) -> std::string {
    auto html = std::string{"<h2>Inspection procedure</h2><ol>"};
    for (std::size_t i = 0; i < steps; ++i) {
        html += "<li>Check item " + std::to_string(i) + " is in place";
        if (edited && i % 10 == 0) html += " and recorded in the digital logbook";
        html += ".</li>";
    }
    html += "</ol>";
    return html;
}

// =============================================================================
// Inline diff
// =============================================================================

static void bm_inline_diff_sentence(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            inline_diff("Stay calm and do not run.", "Stay calm and walk quickly."));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_inline_diff_sentence);

static void bm_inline_diff_paragraph(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto a = std::string{};
    auto b = std::string{};
    for (std::size_t i = 0; i < n; ++i) {
        a += "word" + std::to_string(i) + " ";
        b += (i % 7 == 0 ? "edited" : "word") + std::to_string(i) + " ";
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(inline_diff(a, b));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * (a.size() + b.size())));
}
BENCHMARK(bm_inline_diff_paragraph)->Range(16, 4096);

// Every word differs, so the edit distance grows with the paragraph.
static void bm_inline_diff_rewrite(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto a = std::string{};
    auto b = std::string{};
    for (std::size_t i = 0; i < n; ++i) {
        a += "alpha" + std::to_string(i) + " ";
        b += "beta" + std::to_string(i) + " ";
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(inline_diff(a, b));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * (a.size() + b.size())));
}
BENCHMARK(bm_inline_diff_rewrite)->Range(16, 4096);

// =============================================================================
// Parse / diff / resolve
// =============================================================================

static void bm_parse_html(benchmark::State& state) {
    const auto html = make_procedure(static_cast<std::size_t>(state.range(0)), false);
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse_html(html));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * html.size()));
}
BENCHMARK(bm_parse_html)->Range(8, 1024);

static void bm_diff_html(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    const auto original = make_procedure(steps, false);
    const auto modified = make_procedure(steps, true);
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff_html(original, modified));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * steps));
}
BENCHMARK(bm_diff_html)->Range(8, 1024);

static void bm_resolve(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    const auto tree = diff_html(make_procedure(steps, false), make_procedure(steps, true));
    if (!tree) {
        state.SkipWithError("nothing to diff");
        return;
    }
    const auto decisions = uniform_decisions(*tree, Decision::accept);
    for (auto _ : state) {
        benchmark::DoNotOptimize(resolve(*tree, decisions));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * steps));
}
BENCHMARK(bm_resolve)->Range(8, 1024);

static void bm_samples_pipeline(benchmark::State& state) {
    for (auto _ : state) {
        for (const auto& sample : samples::all) {
            if (auto tree = diff_html(sample.original, sample.modified)) {
                benchmark::DoNotOptimize(resolve(*tree, uniform_decisions(*tree, Decision::accept)));
            }
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * samples::all.size()));
}
BENCHMARK(bm_samples_pipeline);
