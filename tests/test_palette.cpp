#include "palette.hpp"
#include "fractal.hpp"

#include <gtest/gtest.h>

TEST(BandColor, InteriorIsBlack)
{
    EXPECT_EQ(band_color(MAX_ITER, MAX_ITER), (Rgb8{0, 0, 0}));
    EXPECT_EQ(band_of(MAX_ITER, MAX_ITER), Band::Interior);
}

TEST(BandColor, BandEdges)
{
    EXPECT_EQ(band_color(0,   MAX_ITER), (Rgb8{50, 60, 50}));
    EXPECT_EQ(band_color(30,  MAX_ITER), (Rgb8{50, 60, 50}));
    EXPECT_EQ(band_color(31,  MAX_ITER), (Rgb8{224, 224, 20}));
    EXPECT_EQ(band_color(90,  MAX_ITER), (Rgb8{165, 165, 20}));
    EXPECT_EQ(band_color(91,  MAX_ITER), (Rgb8{40, 164, 164}));
    EXPECT_EQ(band_color(200, MAX_ITER), (Rgb8{40, 55, 55}));
    EXPECT_EQ(band_color(201, MAX_ITER), (Rgb8{10, 20, 54}));
    EXPECT_EQ(band_color(254, MAX_ITER), (Rgb8{10, 20, 1}));
}

TEST(BandColor, EveryCountFallsInExactlyOneBand)
{
    for (int v = 0; v < MAX_ITER; ++v) {
        const Band b = band_of(v, MAX_ITER);
        const int hits = (v <= 30) + (v > 30 && v <= 90) + (v > 90 && v <= 200) + (v > 200);
        EXPECT_EQ(hits, 1);
        EXPECT_NE(b, Band::Interior);
        if (v <= 30)       EXPECT_EQ(b, Band::Low);
        else if (v <= 90)  EXPECT_EQ(b, Band::Mid);
        else if (v <= 200) EXPECT_EQ(b, Band::High);
        else               EXPECT_EQ(b, Band::Top);
        EXPECT_EQ(band_color(v, MAX_ITER), band_color(v, MAX_ITER));
    }
}

TEST(BandColor, SaturatesAbove255)
{
    EXPECT_EQ(band_color(255, 1000), (Rgb8{10, 20, 0}));
    EXPECT_EQ(band_color(300, 1000), (Rgb8{10, 20, 0}));
    EXPECT_EQ(band_color(-7,  MAX_ITER), band_color(0, MAX_ITER));
}

TEST(BandColor, RgbIsPacked)
{
    EXPECT_EQ(sizeof(Rgb8), 3u);
    Rgb8 px[2];
    EXPECT_EQ(sizeof(px), 6u);
}
