#include <gtest/gtest.h>

#include "textsynth/Compositor.h"
#include "textsynth/Errors.h"

using namespace TextSynth;

namespace {

  void setConstant(textsynth::RandomParameter* param, double value)
  {
    param->set_type(textsynth::RandomParameter::UNIFORM);
    param->set_min(value);
    param->set_max(value);
  }

  /// Background kept as is, fixed text height and ink strength
  textsynth::MergeParameter deterministicMerge()
  {
    textsynth::MergeParameter param;
    setConstant(param.mutable_bg_alpha(), 1.);
    setConstant(param.mutable_bg_beta(), 0.);
    setConstant(param.mutable_height_diff(), 8.);
    setConstant(param.mutable_font_alpha(), 1.);
    param.set_reverse_prob(0.);
    return param;
  }

}  // namespace

TEST(CompositorTest, BackgroundColorIsClampedAndTruncated) {
  ImageU8 img(4, 1, 1, 1, 0);
  img(1,0) = 40;
  img(2,0) = 100;
  img(3,0) = 255;
  const ImageU8 same = changeBackgroundColor(img, 1., 0.);
  EXPECT_EQ(same(0,0), 50);
  EXPECT_EQ(same(1,0), 50);
  EXPECT_EQ(same(2,0), 100);
  EXPECT_EQ(same(3,0), 255);

  const ImageU8 scaled = changeBackgroundColor(img, 0.75, 10.3);
  EXPECT_EQ(scaled(2,0), 85);
  EXPECT_EQ(scaled(3,0), 201);
}

TEST(CompositorTest, InvalidParametersAreRejected) {
  textsynth::MergeParameter param;
  param.set_reverse_prob(1.5);
  EXPECT_THROW(Compositor compositor(param), InvalidConfiguration);

  param.set_reverse_prob(0.5);
  param.set_iterations(0);
  EXPECT_THROW(Compositor compositor(param), InvalidConfiguration);

  param.set_iterations(500);
  param.mutable_font_alpha()->set_min(1.);
  param.mutable_font_alpha()->set_max(0.2);
  EXPECT_THROW(Compositor compositor(param), InvalidConfiguration);
}

TEST(CompositorTest, RandomPadHasBackgroundDimensions) {
  const Compositor compositor((textsynth::MergeParameter()));
  RNG::RandomSource rng(11);
  const ImageU8 text(180, 30, 1, 1, 255);
  for (int i = 0; i < 50; ++i) {
    const ImageU8 padded = compositor.randomPad(text, 64, 1000, rng);
    ASSERT_EQ(padded.width(), 1000);
    ASSERT_EQ(padded.height(), 64);
    /// The text never touches the first row
    ASSERT_EQ(padded.get_row(0).max(), 0);
    ASSERT_EQ(padded.max(), 255);
  }
}

TEST(CompositorTest, RandomPadClampsWideText) {
  const Compositor compositor(deterministicMerge());
  RNG::RandomSource rng(12);
  const ImageU8 text(100, 20, 1, 1, 200);
  const ImageU8 padded = compositor.randomPad(text, 60, 200, rng);
  ASSERT_EQ(padded.width(), 200);
  ASSERT_EQ(padded.height(), 60);
  /// 52 rows of text spanning the full width
  int text_rows = 0;
  for (int y = 0; y < 60; ++y)
    if (padded(0,y) == 200 and padded(199,y) == 200)
      ++text_rows;
  EXPECT_EQ(text_rows, 52);
}

TEST(CompositorTest, RandomPadRejectsTinyBackground) {
  const Compositor compositor((textsynth::MergeParameter()));
  RNG::RandomSource rng(13);
  EXPECT_THROW(compositor.randomPad(ImageU8(10, 10, 1, 1, 0), 1, 10, rng),
               DimensionMismatch);
}

TEST(CompositorTest, GrayTextOnWhiteBlendsInside) {
  const Compositor compositor(deterministicMerge());
  RNG::RandomSource rng(14);
  const ImageU8 foreground(100, 20, 1, 1, 128);
  const ImageU8 background(200, 60, 1, 1, 255);

  const ImageU8 out = compositor.poissonEdit(foreground, background, rng);
  ASSERT_EQ(out.width(), 200);
  ASSERT_EQ(out.height(), 60);
  ASSERT_EQ(out.spectrum(), 1);

  /// Text occupies rows [top, top+51] with top in [1, 8]
  for (int x = 0; x < 200; ++x)
    EXPECT_EQ(out(x,0), 255) << "at column " << x;
  for (int y = 0; y < 60; ++y) {
    EXPECT_EQ(out(0,y), 255) << "at row " << y;
    EXPECT_EQ(out(199,y), 255) << "at row " << y;
  }
  const int center = out(100,30);
  EXPECT_GT(center, 0);
  EXPECT_LT(center, 255);
}

TEST(CompositorTest, OutputKeepsBackgroundSize) {
  const Compositor compositor((textsynth::MergeParameter()));
  RNG::RandomSource rng(15);
  ImageU8 foreground(150, 32, 1, 1, 255);
  cimg_forXY(foreground,x,y) {
    if (x % 9 < 3 and y > 6 and y < 26)
      foreground(x,y) = 0;
  }
  ImageU8 background(300, 48, 1, 1, 0);
  cimg_forXY(background,x,y) background(x,y) = static_cast<unsigned char>(
        (x*3 + y*5) % 256);

  for (int i = 0; i < 3; ++i) {
    const ImageU8 out = compositor.poissonEdit(foreground, background, rng);
    ASSERT_EQ(out.width(), 300);
    ASSERT_EQ(out.height(), 48);
  }
}

TEST(CompositorTest, ColorBackgroundIsRejected) {
  const Compositor compositor((textsynth::MergeParameter()));
  RNG::RandomSource rng(16);
  EXPECT_THROW(compositor.poissonEdit(ImageU8(50, 10, 1, 1, 255),
                                      ImageU8(100, 30, 1, 3, 255), rng),
               DimensionMismatch);
}
