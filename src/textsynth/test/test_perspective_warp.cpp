#include <gtest/gtest.h>

#include <algorithm>

#include "textsynth/Errors.h"
#include "textsynth/PerspectiveWarp.h"

using namespace TextSynth;

TEST(PerspectiveWarpTest, IdentityHomographyCopiesImage) {
  ImageU8 img(12, 8, 1, 1, 0);
  cimg_forXY(img,x,y) img(x,y) = static_cast<unsigned char>(10*x + 3*y);
  const ImageU8 out = getPerspectiveWarpedImage(img,
                                                Eigen::Matrix3d::Identity(),
                                                16, 0);
  ASSERT_EQ(out.width(), 16);
  ASSERT_EQ(out.height(), 16);
  for (int y = 1; y < 7; ++y)
    for (int x = 1; x < 11; ++x)
      EXPECT_NEAR(out(x,y), img(x,y), 1) << "at " << x << "," << y;
  /// Outside the source: fill value
  EXPECT_EQ(out(15,15), 0);
}

TEST(PerspectiveWarpTest, ZeroRotationIsNearIdentity) {
  /// Ramp rising along both axes, so a shift or a mirror shows up
  ImageU8 img(100, 40, 1, 1);
  cimg_forXY(img,x,y) img(x,y) = static_cast<unsigned char>(60 + x + 2*y);
  const ImageU8 out = warpPerspective(img, Geometry::Rotation());
  ASSERT_LE(out.width(), 100);
  ASSERT_LE(out.height(), 40);
  EXPECT_TRUE(out.width() == 100 or out.height() == 40);
  EXPECT_GE(out.width(), 95);
  EXPECT_GE(out.height(), 36);

  const ImageU8 ref = resizeTriangle(img, out.width(), out.height());
  const int margin = 4;
  for (int y = margin; y < out.height()-margin; ++y) {
    for (int x = margin; x < out.width()-margin; ++x) {
      ASSERT_NEAR(out(x,y), ref(x,y), 5) << "at " << x << "," << y;
      ASSERT_LE(out(x-1,y), out(x,y)) << "at " << x << "," << y;
      ASSERT_LE(out(x,y-1), out(x,y)) << "at " << x << "," << y;
    }
  }
}

TEST(PerspectiveWarpTest, RotatedOutputFitsInput) {
  const ImageU8 img(160, 32, 1, 1, 255);
  const Geometry::Rotation rotations[] = { Geometry::Rotation(15., 0., 0.),
                                           Geometry::Rotation(0., -15., 0.),
                                           Geometry::Rotation(10., 12., 3.) };
  for (const Geometry::Rotation& rotation : rotations) {
    const ImageU8 out = warpPerspective(img, rotation);
    EXPECT_LE(out.width(), 160);
    EXPECT_LE(out.height(), 32);
    EXPECT_TRUE(out.width() == 160 or out.height() == 32);
  }
}

TEST(PerspectiveWarpTest, NonInvertibleHomographyIsSingular) {
  const ImageU8 img(8, 8, 1, 1, 100);
  EXPECT_THROW(getPerspectiveWarpedImage(img, Eigen::Matrix3d::Zero(), 8),
               SingularTransform);
}

TEST(PerspectiveWarpTest, RejectsColorInput) {
  const ImageU8 rgb(20, 10, 1, 3, 100);
  EXPECT_THROW(warpPerspective(rgb, Geometry::Rotation()), DimensionMismatch);
}
