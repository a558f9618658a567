#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <trigon/scene.hpp>

using namespace trigon;

TEST(SceneModel, Defaults)
{
    SceneModel scene;
    EXPECT_TRUE(scene.running());
    EXPECT_TRUE(scene.show_labels());
    EXPECT_TRUE(scene.show_values());
    EXPECT_TRUE(scene.show_theta());
    EXPECT_FLOAT_EQ(scene.rate(), 0.25f);
    EXPECT_FLOAT_EQ(scene.radius(), 200.0f);
    EXPECT_FLOAT_EQ(scene.theta(), 0.0f);
    for (TrigFunction fn : kAllTrigFunctions)
        EXPECT_TRUE(scene.function_visible(fn));
}

TEST(SceneModel, ConstructorComputesInitialValues)
{
    SceneModel scene;
    EXPECT_FLOAT_EQ(scene.values().cos, 1.0f);
    EXPECT_FLOAT_EQ(scene.scaled().cos, 200.0f);
    // Cosine label sits halfway along the cosine segment
    EXPECT_FLOAT_EQ(scene.label_position(Label::Cosine).x, 100.0f);
}

TEST(SceneModel, InvalidConfigThrows)
{
    SceneConfig cfg;
    cfg.min_radius     = 100.0f;
    cfg.default_radius = 50.0f;
    EXPECT_THROW(SceneModel{cfg}, std::invalid_argument);

    SceneConfig neg_rate;
    neg_rate.default_rate = -1.0f;
    EXPECT_THROW(SceneModel{neg_rate}, std::invalid_argument);

    SceneConfig bad_fade;
    bad_fade.fade.fade_out_seconds = 0.0f;
    EXPECT_THROW(SceneModel{bad_fade}, std::invalid_argument);
}

// ─── Animation ───────────────────────────────────────────────────────────────

TEST(SceneModel, UpdateAdvancesTheta)
{
    SceneModel scene;
    scene.update(2.0f);
    EXPECT_NEAR(scene.theta(), 0.5f, 1e-6f);
    EXPECT_NEAR(scene.values().sin, std::sin(0.5f), 1e-6f);
}

TEST(SceneModel, PausedUpdateKeepsTheta)
{
    SceneModel scene;
    scene.toggle_running();
    EXPECT_FALSE(scene.running());
    scene.update(2.0f);
    EXPECT_FLOAT_EQ(scene.theta(), 0.0f);
}

TEST(SceneModel, RateFloorsAtZero)
{
    SceneModel scene;
    for (int i = 0; i < 10; ++i)
        scene.decrement_rate();
    EXPECT_FLOAT_EQ(scene.rate(), 0.0f);

    scene.update(1.0f);
    EXPECT_FLOAT_EQ(scene.theta(), 0.0f);
}

TEST(SceneModel, RateIncrementAndReset)
{
    SceneModel scene;
    scene.increment_rate();
    scene.increment_rate();
    EXPECT_NEAR(scene.rate(), 0.41f, 1e-6f);
    scene.reset_rate();
    EXPECT_FLOAT_EQ(scene.rate(), 0.25f);
}

TEST(SceneModel, ResetTheta)
{
    SceneModel scene;
    scene.update(4.0f);
    scene.reset_theta();
    EXPECT_FLOAT_EQ(scene.theta(), 0.0f);
    EXPECT_FLOAT_EQ(scene.values().sin, 0.0f);
}

TEST(SceneModel, SetThetaRefreshesValuesAndLabels)
{
    SceneModel scene;
    scene.set_theta(1.0f);
    EXPECT_FLOAT_EQ(scene.theta(), 1.0f);
    EXPECT_NEAR(scene.values().sin, std::sin(1.0f), 1e-6f);
    EXPECT_NEAR(scene.label_position(Label::Cosine).x, 100.0f * std::cos(1.0f), 1e-3f);

    scene.set_theta(-0.5f);
    EXPECT_NEAR(scene.theta(), kTau - 0.5f, 1e-5f);
}

// ─── Radius ──────────────────────────────────────────────────────────────────

TEST(SceneModel, PrepareStillSettlesFadedLabels)
{
    // Near zero the secant label sits on top of the cosine label.
    SceneModel scene;
    scene.set_theta(0.05f);
    EXPECT_FLOAT_EQ(scene.label_opacity(Label::Cosine), 1.0f);

    scene.prepare_still(0.05f);
    EXPECT_FLOAT_EQ(scene.theta(), 0.05f);
    EXPECT_TRUE(scene.fader().should_fade(Label::Cosine));
    EXPECT_FLOAT_EQ(scene.label_opacity(Label::Cosine), scene.config().fade.min_opacity());
}

TEST(SceneModel, RadiusFloorsAtMinimum)
{
    SceneModel scene;
    for (int i = 0; i < 20; ++i)
        scene.decrement_radius();
    EXPECT_FLOAT_EQ(scene.radius(), scene.config().min_radius);
}

TEST(SceneModel, RadiusIncrementAndReset)
{
    SceneModel scene;
    scene.increment_radius();
    EXPECT_FLOAT_EQ(scene.radius(), 220.0f);
    scene.update(0.0f);
    EXPECT_FLOAT_EQ(scene.scaled().cos, 220.0f);

    scene.reset_radius();
    EXPECT_FLOAT_EQ(scene.radius(), 200.0f);
}

// ─── Toggles ─────────────────────────────────────────────────────────────────

TEST(SceneModel, ViewToggles)
{
    SceneModel scene;
    scene.toggle_labels();
    scene.toggle_values();
    scene.toggle_theta();
    EXPECT_FALSE(scene.show_labels());
    EXPECT_FALSE(scene.show_values());
    EXPECT_FALSE(scene.show_theta());

    scene.toggle_labels();
    EXPECT_TRUE(scene.show_labels());
}

TEST(SceneModel, ToggleFunctionDisablesFaderTarget)
{
    SceneModel scene;
    scene.toggle_function(TrigFunction::Tangent);
    EXPECT_FALSE(scene.function_visible(TrigFunction::Tangent));
    EXPECT_FALSE(scene.fader().enabled(Label::Tangent));

    scene.toggle_function(TrigFunction::Tangent);
    EXPECT_TRUE(scene.function_visible(TrigFunction::Tangent));
    EXPECT_TRUE(scene.fader().enabled(Label::Tangent));
}

// ─── Readout clicks ──────────────────────────────────────────────────────────

TEST(SceneModel, ReadoutRowRects)
{
    Aabb sin_row = readout::row_rect(TrigFunction::Sine);
    EXPECT_FLOAT_EQ(sin_row.left(), 430.0f);
    EXPECT_FLOAT_EQ(sin_row.right(), 580.0f);
    EXPECT_FLOAT_EQ(sin_row.bottom(), 135.0f);
    EXPECT_FLOAT_EQ(sin_row.top(), 165.0f);
    EXPECT_FLOAT_EQ(readout::row_y(TrigFunction::Cosecant), -150.0f);
}

TEST(SceneModel, ClickTogglesOncePerPress)
{
    SceneModel scene;
    Vec2       on_cos{500.0f, 100.0f};

    scene.update(0.016f, on_cos, true);
    EXPECT_FALSE(scene.function_visible(TrigFunction::Cosine));

    // Held button does not toggle again
    scene.update(0.016f, on_cos, true);
    EXPECT_FALSE(scene.function_visible(TrigFunction::Cosine));

    scene.update(0.016f, on_cos, false);
    scene.update(0.016f, on_cos, true);
    EXPECT_TRUE(scene.function_visible(TrigFunction::Cosine));
}

TEST(SceneModel, ClickOutsideRowsDoesNothing)
{
    SceneModel scene;
    scene.update(0.016f, {0.0f, 0.0f}, true);
    scene.update(0.016f, {500.0f, 75.0f}, false);
    scene.update(0.016f, {500.0f, 75.0f}, true);   // between cos and tan rows
    for (TrigFunction fn : kAllTrigFunctions)
        EXPECT_TRUE(scene.function_visible(fn));
}

TEST(SceneModel, ClicksIgnoredWhenValuesHidden)
{
    SceneModel scene;
    scene.toggle_values();
    scene.update(0.016f, {500.0f, 150.0f}, true);
    EXPECT_TRUE(scene.function_visible(TrigFunction::Sine));
}

TEST(SceneModel, PressThatStartedOffRowDoesNotToggleWhenDraggedOn)
{
    SceneModel scene;
    scene.update(0.016f, {0.0f, 0.0f}, true);
    scene.update(0.016f, {500.0f, -50.0f}, true);
    EXPECT_TRUE(scene.function_visible(TrigFunction::Cotangent));
}

// ─── Labels ──────────────────────────────────────────────────────────────────

TEST(SceneModel, LabelPositionsStayFinite)
{
    SceneModel scene;
    for (float theta : {0.0f, kTau * 0.25f, kTau * 0.5f, kTau * 0.75f})
    {
        scene.set_theta(theta);
        for (Label l : kAllLabels)
        {
            Vec2 p = scene.label_position(l);
            EXPECT_FALSE(std::isnan(p.x));
            EXPECT_FALSE(std::isnan(p.y));
            EXPECT_FALSE(std::isinf(p.x));
            EXPECT_FALSE(std::isinf(p.y));
        }
    }
}

TEST(SceneModel, OpacitiesStayInRangeOverATurn)
{
    SceneModel  scene;
    const float floor = scene.config().fade.min_opacity();
    for (int i = 0; i < 2000; ++i)
    {
        scene.update(1.0f / 60.0f * 10.0f);
        for (Label l : kAllLabels)
        {
            float o = scene.label_opacity(l);
            ASSERT_GE(o, floor - 1e-6f);
            ASSERT_LE(o, 1.0f);
        }
    }
}
