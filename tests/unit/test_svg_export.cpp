#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <trigon/export.hpp>
#include <trigon/scene.hpp>
#include <vector>

#include "io/svg_canvas.hpp"

using namespace trigon;

namespace fs = std::filesystem;

static size_t count_occurrences(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos        = haystack.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}

// ─── SvgCanvas ───────────────────────────────────────────────────────────────

TEST(SvgCanvas, EmptyDocument)
{
    SvgCanvas   canvas(400, 300);
    std::string svg = canvas.finish();
    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("width=\"400\" height=\"300\""), std::string::npos);
    EXPECT_NE(svg.find("viewBox=\"0 0 400 300\""), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST(SvgCanvas, ClearResetsBody)
{
    SvgCanvas canvas(800, 800);
    canvas.line({0.0f, 0.0f}, {10.0f, 0.0f}, 1.0f, colors::red);
    canvas.clear(colors::black);
    std::string svg = canvas.finish();
    EXPECT_EQ(svg.find("<line"), std::string::npos);
    EXPECT_NE(svg.find("fill=\"rgb(0,0,0)\""), std::string::npos);
}

TEST(SvgCanvas, MapsDiagramSpaceToPixels)
{
    SvgCanvas canvas(800, 800);
    // Diagram origin sits 120 units left of the window centre, y flipped
    canvas.fill_circle({0.0f, 100.0f}, 8.0f, colors::white);
    std::string svg = canvas.finish();
    EXPECT_NE(svg.find("cx=\"280\" cy=\"300\" r=\"8\""), std::string::npos);
}

TEST(SvgCanvas, SentinelLinesAreClamped)
{
    SvgCanvas canvas(800, 800);
    canvas.line({0.0f, 0.0f}, {0.0f, kTrigSentinel}, 3.0f, colors::cyan);
    std::string svg = canvas.finish();
    EXPECT_EQ(svg.find("e+38"), std::string::npos);
    EXPECT_NE(svg.find("y2=\"-3200\""), std::string::npos);
}

TEST(SvgCanvas, TextIsEscapedAndStyled)
{
    SvgCanvas canvas(800, 800);
    TextStyle ts;
    ts.style = FontStyle::Italic;
    ts.align = TextAlign::Left;
    canvas.text({0.0f, 0.0f}, "a<b & c", ts, colors::white.faded(0.5f));
    std::string svg = canvas.finish();
    EXPECT_NE(svg.find("a&lt;b &amp; c"), std::string::npos);
    EXPECT_NE(svg.find("font-style=\"italic\""), std::string::npos);
    EXPECT_NE(svg.find("text-anchor=\"start\""), std::string::npos);
    EXPECT_NE(svg.find("fill-opacity=\"0.5\""), std::string::npos);
}

TEST(SvgCanvas, PolylineNeedsTwoPoints)
{
    SvgCanvas canvas(800, 800);
    canvas.polyline(std::vector<Vec2>{{0.0f, 0.0f}}, 1.0f, colors::white);
    EXPECT_EQ(canvas.finish().find("<polyline"), std::string::npos);

    canvas.polyline(std::vector<Vec2>{{0.0f, 0.0f}, {10.0f, 10.0f}}, 1.0f, colors::white);
    EXPECT_NE(canvas.finish().find("<polyline"), std::string::npos);
}

// ─── SvgExporter ─────────────────────────────────────────────────────────────

TEST(SvgExporter, ToStringContainsScene)
{
    SceneModel  scene;
    std::string svg = SvgExporter::to_string(scene);

    EXPECT_NE(svg.find("<svg"), std::string::npos);
    EXPECT_NE(svg.find("cos θ = 1.00"), std::string::npos);
    EXPECT_NE(svg.find("csc θ = inf"), std::string::npos);
    EXPECT_NE(svg.find("rate = 0.25 rad/s"), std::string::npos);
    EXPECT_EQ(count_occurrences(svg, "<line"), 9u);
    EXPECT_EQ(count_occurrences(svg, "<text"), 17u);
}

TEST(SvgExporter, ArcAppearsPastZero)
{
    SceneModel scene;
    EXPECT_EQ(SvgExporter::to_string(scene).find("<polyline"), std::string::npos);

    scene.set_theta(1.0f);
    EXPECT_NE(SvgExporter::to_string(scene).find("<polyline"), std::string::npos);
}

TEST(SvgExporter, StillFrameCarriesFadedLabels)
{
    SceneModel placed;
    placed.set_theta(0.05f);
    SceneModel still;
    still.prepare_still(0.05f);
    EXPECT_NE(SvgExporter::to_string(placed), SvgExporter::to_string(still));
}

TEST(SvgExporter, WriteSvgCreatesFile)
{
    fs::path path = fs::temp_directory_path() / "trigon_test_export.svg";
    fs::remove(path);

    SceneModel scene;
    scene.set_theta(0.8f);
    ASSERT_TRUE(SvgExporter::write_svg(path.string(), scene, 640, 480));

    std::ifstream     f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    std::string content = ss.str();
    EXPECT_NE(content.find("width=\"640\" height=\"480\""), std::string::npos);
    EXPECT_NE(content.find("θ = 0.80"), std::string::npos);

    fs::remove(path);
}

TEST(SvgExporter, ZeroSizeRejected)
{
    SceneModel scene;
    fs::path   path = fs::temp_directory_path() / "trigon_test_zero.svg";
    fs::remove(path);
    EXPECT_FALSE(SvgExporter::write_svg(path.string(), scene, 0, 600));
    EXPECT_FALSE(fs::exists(path));
}

TEST(SvgExporter, UnwritablePathFails)
{
    SceneModel scene;
    EXPECT_FALSE(SvgExporter::write_svg("/nonexistent_dir_trigon/out.svg", scene));
}
