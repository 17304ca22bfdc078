#include <colorkit/manipulation/manipulation.h>

#include <gtest/gtest.h>

using namespace colorkit;

// ------------------------------------------------------------------
// 1. Lightness and chroma
// ------------------------------------------------------------------

TEST(ManipulationTest, LightenMovesTowardsWhite) {
    Color c = lighten(Color{0.5, 0.1, 120, 1}, 0.5);
    EXPECT_DOUBLE_EQ(c.l, 0.75);
    EXPECT_DOUBLE_EQ(c.c, 0.1);
    EXPECT_DOUBLE_EQ(c.h, 120);
    EXPECT_DOUBLE_EQ(lighten(Color{0.9, 0, 0, 1}, 1).l, 1.0);
}

TEST(ManipulationTest, DarkenMovesTowardsBlack) {
    EXPECT_DOUBLE_EQ(darken(Color{0.5, 0.1, 120, 1}, 0.5).l, 0.25);
    EXPECT_DOUBLE_EQ(darken(Color{0.5, 0.1, 120, 1}, 2).l, 0.0);
}

TEST(ManipulationTest, SaturateAddsFractionOfCeiling) {
    EXPECT_NEAR(saturate(Color{0.5, 0.1, 30, 1}, 0.25).c, 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(saturate(Color{0.5, 0.35, 30, 1}, 0.5).c, 0.4);
}

TEST(ManipulationTest, DesaturateScalesChroma) {
    EXPECT_DOUBLE_EQ(desaturate(Color{0.5, 0.1, 30, 1}, 0.5).c, 0.05);
    EXPECT_DOUBLE_EQ(desaturate(Color{0.5, 0.1, 30, 1}, 1).c, 0.0);
}

// ------------------------------------------------------------------
// 2. Hue and alpha
// ------------------------------------------------------------------

TEST(ManipulationTest, AdjustHueWraps) {
    EXPECT_NEAR(adjust_hue(Color{0.5, 0.1, 350, 1}, 20).h, 10, 1e-9);
    EXPECT_NEAR(adjust_hue(Color{0.5, 0.1, 10, 1}, -30).h, 340, 1e-9);
}

TEST(ManipulationTest, SetAlphaClamps) {
    EXPECT_DOUBLE_EQ(set_alpha(Color{0.5, 0.1, 10, 1}, 0.3).alpha, 0.3);
    EXPECT_DOUBLE_EQ(set_alpha(Color{0.5, 0.1, 10, 1}, 1.5).alpha, 1.0);
    EXPECT_DOUBLE_EQ(set_alpha(Color{0.5, 0.1, 10, 1}, -0.2).alpha, 0.0);
}

// ------------------------------------------------------------------
// 3. Mixing
// ------------------------------------------------------------------

TEST(ManipulationTest, MixInterpolatesChannels) {
    Color a{0.2, 0.1, 100, 1};
    Color b{0.6, 0.3, 140, 0.5};
    Color m = mix(a, b);
    EXPECT_NEAR(m.l, 0.4, 1e-12);
    EXPECT_NEAR(m.c, 0.2, 1e-12);
    EXPECT_NEAR(m.h, 120, 1e-9);
    EXPECT_NEAR(m.alpha, 0.75, 1e-12);

    EXPECT_EQ(mix(a, b, 0), a);
}

TEST(ManipulationTest, MixTakesShortestHueArc) {
    Color m = mix(Color{0.5, 0.1, 350, 1}, Color{0.5, 0.1, 10, 1});
    EXPECT_NEAR(m.h, 0, 1e-9);

    m = mix(Color{0.5, 0.1, 10, 1}, Color{0.5, 0.1, 350, 1}, 0.25);
    EXPECT_NEAR(m.h, 5, 1e-9);
}

// ------------------------------------------------------------------
// 4. Invert and grayscale
// ------------------------------------------------------------------

TEST(ManipulationTest, InvertComplementsLightnessAndHue) {
    Color c = invert(Color{0.3, 0.12, 200, 0.8});
    EXPECT_DOUBLE_EQ(c.l, 0.7);
    EXPECT_DOUBLE_EQ(c.c, 0.12);
    EXPECT_NEAR(c.h, 20, 1e-9);
    EXPECT_DOUBLE_EQ(c.alpha, 0.8);
}

TEST(ManipulationTest, GrayscaleDropsChroma) {
    Color c = grayscale(Color{0.3, 0.12, 200, 0.8});
    EXPECT_EQ(c, (Color{0.3, 0, 200, 0.8}));
}
