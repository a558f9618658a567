#include <benchmark/benchmark.h>
#include <string>
#include <trigon/export.hpp>
#include <trigon/scene.hpp>
#include <vector>

#include "render/scene_painter.hpp"

using namespace trigon;

// Counts draw calls without producing output.
class NullCanvas : public Canvas
{
   public:
    void clear(const Color&) override { ++calls; }
    void line(Vec2, Vec2, float, const Color&) override { ++calls; }
    void circle(Vec2, float, float, const Color&) override { ++calls; }
    void fill_circle(Vec2, float, const Color&) override { ++calls; }
    void polyline(const std::vector<Vec2>& points, float, const Color&) override
    {
        calls += points.size();
    }
    void text(Vec2, std::string_view, const TextStyle&, const Color&) override { ++calls; }

    size_t calls = 0;
};

static void BM_Scene_Update(benchmark::State& state)
{
    SceneModel scene;

    for (auto _ : state)
    {
        scene.update(1.0f / 60.0f);
        float s = scene.values().sin;
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_Scene_Update)->Unit(benchmark::kNanosecond);

static void BM_Scene_UpdateWithPointer(benchmark::State& state)
{
    SceneModel scene;
    bool       down = false;

    for (auto _ : state)
    {
        scene.update(1.0f / 60.0f, {500.0f, 150.0f}, down);
        down = !down;
        bool visible = scene.function_visible(TrigFunction::Sine);
        benchmark::DoNotOptimize(visible);
    }
}
BENCHMARK(BM_Scene_UpdateWithPointer)->Unit(benchmark::kNanosecond);

static void BM_Painter_Paint(benchmark::State& state)
{
    SceneModel scene;
    scene.set_theta(4.0f);
    ScenePainter painter;
    NullCanvas   canvas;

    for (auto _ : state)
    {
        painter.paint(scene, canvas);
    }
    benchmark::DoNotOptimize(canvas.calls);
}
BENCHMARK(BM_Painter_Paint)->Unit(benchmark::kMicrosecond);

static void BM_Svg_ToString(benchmark::State& state)
{
    SceneModel scene;
    scene.set_theta(static_cast<float>(state.range(0)) * 0.01f);

    for (auto _ : state)
    {
        std::string svg = SvgExporter::to_string(scene);
        benchmark::DoNotOptimize(svg);
    }
}
BENCHMARK(BM_Svg_ToString)->Arg(1)->Arg(300)->Arg(600)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
