#include <gtest/gtest.h>

#include <cmath>

#include "textsynth/Errors.h"
#include "textsynth/ProjectiveGeometry.h"

using namespace TextSynth;
using namespace TextSynth::Geometry;

namespace {

  double cross(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
               const Eigen::Vector2d& c)
  {
    return (b.x()-a.x())*(c.y()-a.y()) - (b.y()-a.y())*(c.x()-a.x());
  }

}  // namespace

TEST(ProjectiveGeometryTest, ZeroRotationMatrixIsIdentity) {
  EXPECT_TRUE(rotationMatrix(Rotation()).isApprox(Eigen::Matrix4d::Identity()));
}

TEST(ProjectiveGeometryTest, RotationAboutZ) {
  const Eigen::Matrix4d r = rotationMatrix(Rotation(0., 0., 90.));
  const Eigen::Vector4d p = r * Eigen::Vector4d(1., 0., 0., 1.);
  EXPECT_NEAR(p.x(), 0., 1e-12);
  EXPECT_NEAR(p.y(), 1., 1e-12);
}

TEST(ProjectiveGeometryTest, HomographyMapsCornersOntoProjection) {
  const Rotation rotations[] = { Rotation(0., 0., 0.),
                                 Rotation(15., -10., 3.),
                                 Rotation(-14., 12., -2.5),
                                 Rotation(0., 25., 0.) };
  for (const Rotation& rotation : rotations) {
    const Projection proj = buildProjection(320, 48, rotation, 1., 50.);
    for (int i = 0; i < 4; ++i) {
      const Eigen::Vector2d mapped =
            applyHomography(proj.homography, proj.points_in.row(i).transpose());
      EXPECT_NEAR(mapped.x(), proj.points_out(i,0), 1e-6);
      EXPECT_NEAR(mapped.y(), proj.points_out(i,1), 1e-6);
    }
  }
}

TEST(ProjectiveGeometryTest, ZeroRotationIsCenteredUniformScaling) {
  const double w = 100., h = 40., fovy_half = 25. * M_PI / 180.;
  const Projection proj = buildProjection(100, 40, Rotation(), 1., 50.);

  const double d = std::sqrt(w*w + h*h);
  const double side = d / std::cos(fovy_half);
  const double hyp = d / (2. * std::sin(fovy_half));
  /// Homogeneous w of the camera is hyp + 1
  const double k = hyp / (hyp + 1.);
  EXPECT_NEAR(proj.side_length, side, 1e-9);

  const Eigen::Matrix3d& H = proj.homography;
  EXPECT_NEAR(H(0,0), k, 1e-9);
  EXPECT_NEAR(H(1,1), k, 1e-9);
  EXPECT_NEAR(H(0,1), 0., 1e-9);
  EXPECT_NEAR(H(1,0), 0., 1e-9);
  EXPECT_NEAR(H(2,0), 0., 1e-9);
  EXPECT_NEAR(H(2,1), 0., 1e-9);
  EXPECT_NEAR(H(0,2), side/2. - k*w/2., 1e-6);
  EXPECT_NEAR(H(1,2), side/2. - k*h/2., 1e-6);
}

TEST(ProjectiveGeometryTest, ProjectedQuadIsConvexAndContainsCenter) {
  const Projection proj = buildProjection(100, 40, Rotation(0., 0., 0.),
                                          1., 50.);
  ASSERT_GT(proj.side_length, 0.);

  const Eigen::Vector2d center(proj.side_length/2., proj.side_length/2.);
  double orientation = 0.;
  for (int i = 0; i < 4; ++i) {
    const Eigen::Vector2d a = proj.points_out.row(i).transpose();
    const Eigen::Vector2d b = proj.points_out.row((i+1)%4).transpose();
    const Eigen::Vector2d c = proj.points_out.row((i+2)%4).transpose();
    const double turn = cross(a, b, c);
    const double side_of_center = cross(a, b, center);
    ASSERT_NE(turn, 0.);
    if (i == 0)
      orientation = turn;
    EXPECT_GT(turn * orientation, 0.);
    EXPECT_GT(side_of_center * orientation, 0.);
  }
}

TEST(ProjectiveGeometryTest, DegenerateCorrespondencesAreSingular) {
  Points4x2 in;
  in << 0., 0.,
        0., 0.,
        0., 0.,
        0., 0.;
  Points4x2 out;
  out << 0., 0.,
         1., 0.,
         1., 1.,
         0., 1.;
  EXPECT_THROW(solveHomography(in, out), SingularTransform);
}
