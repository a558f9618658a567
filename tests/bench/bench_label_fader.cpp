#include <benchmark/benchmark.h>
#include <cmath>
#include <trigon/label_fader.hpp>

using namespace trigon;

static void place_orbit(LabelOverlapFader& fader, float t)
{
    for (Label l : kAllLabels)
    {
        float phase = t + static_cast<float>(index_of(l)) * 0.7f;
        fader.set_position(l, {std::cos(phase) * 60.0f, std::sin(phase * 1.3f) * 60.0f});
    }
}

static void BM_Fader_EvaluateOverlaps(benchmark::State& state)
{
    LabelOverlapFader fader;
    place_orbit(fader, 0.3f);

    for (auto _ : state)
    {
        fader.evaluate_overlaps();
        bool fading = fader.should_fade(Label::Unit);
        benchmark::DoNotOptimize(fading);
    }
}
BENCHMARK(BM_Fader_EvaluateOverlaps)->Unit(benchmark::kNanosecond);

static void BM_Fader_Update(benchmark::State& state)
{
    LabelOverlapFader fader;
    float             t = 0.0f;

    for (auto _ : state)
    {
        place_orbit(fader, t);
        fader.update(1.0f / 60.0f);
        t += 0.01f;
        float opacity = fader.get_opacity(Label::Sine);
        benchmark::DoNotOptimize(opacity);
    }
}
BENCHMARK(BM_Fader_Update)->Unit(benchmark::kNanosecond);

static void BM_Fader_AllOverlapping(benchmark::State& state)
{
    LabelOverlapFader fader;
    for (Label l : kAllLabels)
        fader.set_position(l, {0.0f, 0.0f});

    for (auto _ : state)
    {
        fader.update(1.0f / 60.0f);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_Fader_AllOverlapping)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
