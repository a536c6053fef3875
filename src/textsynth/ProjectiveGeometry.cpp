/**
 * Camera model after
 *   https://stackoverflow.com/questions/17087446
 * (perspective transform from rotation angles)
 */

/// System/STL
#include <cmath>
#include <sstream>

#include "textsynth/Errors.h"
#include "textsynth/ProjectiveGeometry.h"

namespace TextSynth {
namespace Geometry {

  namespace {
    inline double deg2rad(double deg) {
      return deg * M_PI / 180.;
    }
  }  // namespace


  Eigen::Matrix4d rotationMatrix(const Rotation& rotation)
  {
    const double x{deg2rad(rotation.x)};
    const double y{deg2rad(rotation.y)};
    const double z{deg2rad(rotation.z)};

    const double sin_x{std::sin(x)}, cos_x{std::cos(x)};
    const double sin_y{std::sin(y)}, cos_y{std::cos(y)};
    const double sin_z{std::sin(z)}, cos_z{std::cos(z)};

    Eigen::Matrix4d matrix_x;
    matrix_x <<  1.,    0.,     0., 0.,
                 0., cos_x, -sin_x, 0.,
                 0., sin_x,  cos_x, 0.,
                 0.,    0.,     0., 1.;

    Eigen::Matrix4d matrix_y;
    matrix_y << cos_y, 0., sin_y, 0.,
                   0., 1.,    0., 0.,
               -sin_y, 0., cos_y, 0.,
                   0., 0.,    0., 1.;

    Eigen::Matrix4d matrix_z;
    matrix_z << cos_z, -sin_z, 0., 0.,
                sin_z,  cos_z, 0., 0.,
                   0.,     0., 1., 0.,
                   0.,     0., 0., 1.;

    return matrix_x * matrix_y * matrix_z;
  }


  Points4x3 perspectiveTransform(const Points4x3& points,
                                 const Eigen::Matrix4d& transform)
  {
    /// One homogeneous point per column
    Eigen::Matrix4d padded;
    padded.topRows<3>() = points.transpose();
    padded.row(3).setOnes();

    const Eigen::Matrix4d mapped = transform * padded;

    Points4x3 result;
    for (int i = 0; i < 4; ++i) {
      const double w{mapped(3,i)};
      result.row(i) = mapped.col(i).head<3>().transpose() / w;
    }
    return result;
  }


  Eigen::Matrix3d solveHomography(const Points4x2& points_in,
                                  const Points4x2& points_out)
  {
    Eigen::Matrix<double,8,8> left;
    Eigen::Matrix<double,8,1> right;
    for (int i = 0; i < 4; ++i) {
      const double x{points_in(i,0)}, y{points_in(i,1)};
      const double u{points_out(i,0)}, v{points_out(i,1)};
      left.row(i)   << x, y, 1., 0., 0., 0., -x*u, -y*u;
      left.row(i+4) << 0., 0., 0., x, y, 1., -x*v, -y*v;
      right(i)   = u;
      right(i+4) = v;
    }

    const Eigen::FullPivLU<Eigen::Matrix<double,8,8> > decomp(left);
    if (not decomp.isInvertible()) {
      std::ostringstream oss;
      oss << "point correspondences are degenerate (rank " << decomp.rank()
          << " of 8)";
      throw SingularTransform(oss.str());
    }
    const Eigen::Matrix<double,8,1> h = decomp.solve(right);

    Eigen::Matrix3d result;
    result << h(0), h(1), h(2),
              h(3), h(4), h(5),
              h(6), h(7), 1.;
    return result;
  }


  Projection buildProjection(int width,
                             int height,
                             const Rotation& rotation,
                             double scale,
                             double fovy)
  {
    const double w{static_cast<double>(width)};
    const double h{static_cast<double>(height)};

    const double fovy_half{deg2rad(fovy * 0.5)};
    const double distance{std::sqrt(w*w + h*h)};
    const double side_length{scale * distance / std::cos(fovy_half)};
    const double hypotenuse{distance / (2. * std::sin(fovy_half))};
    const double near{hypotenuse - distance * 0.5};
    const double far{hypotenuse + distance * 0.5};

    Eigen::Matrix4d translation_mat = Eigen::Matrix4d::Identity();
    translation_mat(2,3) = -hypotenuse;

    const Eigen::Matrix4d rotation_mat = rotationMatrix(rotation);

    Eigen::Matrix4d projection_mat = Eigen::Matrix4d::Identity();
    projection_mat(0,0) = 1. / std::tan(fovy_half);
    projection_mat(1,1) = projection_mat(0,0);
    projection_mat(2,2) = -(far + near) / (far - near);
    projection_mat(2,3) = -(2. * far * near) / (far - near);
    projection_mat(3,2) = -1.;
    projection_mat(3,3) = 1.;

    const Eigen::Matrix4d transform_mat =
          projection_mat * translation_mat * rotation_mat;

    const double w_half{w * 0.5};
    const double h_half{h * 0.5};

    Points4x3 corners;
    corners << -w_half,  h_half, 0.,
                w_half,  h_half, 0.,
                w_half, -h_half, 0.,
               -w_half, -h_half, 0.;

    const Points4x3 projected = perspectiveTransform(corners, transform_mat);

    Projection result;
    result.side_length = side_length;
    const double side_half{side_length * 0.5};
    for (int i = 0; i < 4; ++i) {
      result.points_in(i,0)  = corners(i,0) + w_half;
      result.points_in(i,1)  = corners(i,1) + h_half;
      result.points_out(i,0) = (projected(i,0) + 1.) * side_half;
      result.points_out(i,1) = (projected(i,1) + 1.) * side_half;
    }
    result.homography = solveHomography(result.points_in, result.points_out);
    return result;
  }


  Eigen::Vector2d applyHomography(const Eigen::Matrix3d& homography,
                                  const Eigen::Vector2d& point)
  {
    const Eigen::Vector3d mapped = homography * point.homogeneous();
    return mapped.head<2>() / mapped(2);
  }

}  // namespace Geometry
}  // namespace TextSynth
