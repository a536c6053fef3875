#ifndef TEXTSYNTH_PERSPECTIVEWARP_H__
#define TEXTSYNTH_PERSPECTIVEWARP_H__

/// Eigen
#include <Eigen/Dense>

#include "textsynth/Image.h"
#include "textsynth/ProjectiveGeometry.h"

namespace TextSynth {

  /// Vertical field of view of the virtual camera (degrees)
  static const double WARP_FOVY = 50.;

  /**
   * Backward-warp a grayscale image into a side_length x side_length canvas.
   * Each canvas pixel is mapped through the inverse homography and sampled
   * bilinearly; samples outside the source read as fill_value.
   */
  ImageU8 getPerspectiveWarpedImage(const ImageU8& input,
                                    const Eigen::Matrix3d& homography,
                                    int side_length,
                                    unsigned char fill_value=0);

  /**
   * Simulate a camera looking at the text from a rotated viewpoint. The
   * projected text area is cropped and rescaled (aspect-preserving) so that
   * it fits within the input's dimensions.
   */
  ImageU8 warpPerspective(const ImageU8& image,
                          const Geometry::Rotation& rotation);

}  /// namespace TextSynth

#endif  // TEXTSYNTH_PERSPECTIVEWARP_H__
