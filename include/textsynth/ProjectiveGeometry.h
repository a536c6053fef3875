#ifndef TEXTSYNTH_PROJECTIVEGEOMETRY_H__
#define TEXTSYNTH_PROJECTIVEGEOMETRY_H__

/// Eigen
#include <Eigen/Dense>

namespace TextSynth {
namespace Geometry {

  typedef Eigen::Matrix<double,4,2> Points4x2;
  typedef Eigen::Matrix<double,4,3> Points4x3;

  /// Rotation angles in degrees, applied in X, then Y, then Z order
  struct Rotation {
    Rotation(double x=0., double y=0., double z=0.)
      : x(x), y(y), z(z)
    { }
    double x, y, z;
  };

  /**
   * Result of buildProjection: the 3x3 homography mapping the image corners
   * (points_in) onto the projected corners (points_out) inside a square
   * canvas of side_length pixels.
   */
  struct Projection {
    Eigen::Matrix3d homography;
    double side_length;
    Points4x2 points_in;
    Points4x2 points_out;

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
  };

  /// Combined rotation R = Rx * Ry * Rz (angles in degrees)
  Eigen::Matrix4d rotationMatrix(const Rotation& rotation);

  /**
   * Map 3D points through a 4x4 transform, dividing each mapped point by its
   * homogeneous coordinate
   */
  Points4x3 perspectiveTransform(const Points4x3& points,
                                 const Eigen::Matrix4d& transform);

  /**
   * Homography from 4 point correspondences:
   *   x' = (a*x + b*y + c) / (g*x + h*y + 1)
   *   y' = (d*x + e*y + f) / (g*x + h*y + 1)
   * Throws SingularTransform if the 8x8 system has no unique solution.
   */
  Eigen::Matrix3d solveHomography(const Points4x2& points_in,
                                  const Points4x2& points_out);

  /**
   * Virtual-camera projection of a width x height image rotated in 3D.
   * fovy is the vertical field of view in degrees, scale enlarges the
   * output canvas.
   */
  Projection buildProjection(int width,
                             int height,
                             const Rotation& rotation,
                             double scale,
                             double fovy);

  /// Apply a homography to a single 2D point
  Eigen::Vector2d applyHomography(const Eigen::Matrix3d& homography,
                                  const Eigen::Vector2d& point);

}  // namespace Geometry
}  // namespace TextSynth

#endif  // TEXTSYNTH_PROJECTIVEGEOMETRY_H__
