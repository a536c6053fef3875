/// System/STL
#include <algorithm>
#include <cmath>
#include <sstream>
/// AGG (Anti-Grain Geometry)
#include "agg_basics.h"
#include "agg_image_accessors.h"
#include "agg_path_storage.h"
#include "agg_pixfmt_gray.h"
#include "agg_rasterizer_scanline_aa.h"
#include "agg_renderer_base.h"
#include "agg_renderer_scanline.h"
#include "agg_rendering_buffer.h"
#include "agg_scanline_u.h"
#include "agg_span_allocator.h"
#include "agg_span_image_filter_gray.h"
#include "agg_span_interpolator_trans.h"
#include "agg_trans_perspective.h"

#include "textsynth/Errors.h"
#include "textsynth/PerspectiveWarp.h"

using namespace cimg_library;

namespace TextSynth {

  ///
  /// Transform an image given a perspective transformation
  ///
  ImageU8 getPerspectiveWarpedImage(const ImageU8& input,
                                    const Eigen::Matrix3d& homography,
                                    int side_length,
                                    unsigned char fill_value)
  {
    requireGrayscale(input, "Warp input");
    if (side_length <= 0) {
      std::ostringstream oss;
      oss << "warp canvas side length must be positive (got " << side_length
          << ")";
      throw DimensionMismatch(oss.str());
    }

    /// AGG needs a mutable buffer even for reading
    ImageU8 source_image(input);
    const int src_W = source_image.width();
    const int src_H = source_image.height();

    /// AGG image source wrapper
    agg::rendering_buffer source_rbuf;
    source_rbuf.attach(source_image.data(), src_W, src_H, src_W);
    /// 8-bit grayscale type
    typedef agg::pixfmt_gray8 PIX_GRAY_T;
    PIX_GRAY_T source_pixf(source_rbuf);
    /// Everything outside the source reads as the fill value
    typedef agg::image_accessor_clip<PIX_GRAY_T> IMG_SRC_T;
    IMG_SRC_T source_img(source_pixf, agg::gray8(fill_value));

    /// Allocate memory for the warped output
    ImageU8 output(side_length, side_length, 1, 1, fill_value);
    agg::rendering_buffer target_rbuf;
    target_rbuf.attach(output.data(), side_length, side_length, side_length);
    PIX_GRAY_T target_pixf(target_rbuf);
    agg::renderer_base<PIX_GRAY_T> renderer_base(target_pixf);

    /// The image transformation (AGG order: sx, shy, w0, shx, sy, w1, tx, ty, w2)
    agg::trans_perspective image_mtx(homography(0,0), homography(1,0),
                                     homography(2,0), homography(0,1),
                                     homography(1,1), homography(2,1),
                                     homography(0,2), homography(1,2),
                                     homography(2,2));
    /// Inverse transformation (backward warping)
    if (not image_mtx.invert())
      throw SingularTransform("homography cannot be inverted");

    /// Exact per-pixel perspective mapping
    typedef agg::span_interpolator_trans<agg::trans_perspective> TEX_INTERP_T;
    TEX_INTERP_T interpolator(image_mtx);
    agg::span_allocator<agg::gray8> span_allocator;
    agg::span_image_filter_gray_bilinear<IMG_SRC_T,TEX_INTERP_T>
        span_generator(source_img, interpolator);

    agg::rasterizer_scanline_aa<> rasterizer;
    agg::scanline_u8 scanline;
    /// Render a polygon which covers the entire canvas
    agg::path_storage path;
    path.move_to(0, 0);
    path.line_to(side_length, 0);
    path.line_to(side_length, side_length);
    path.line_to(0, side_length);
    path.close_polygon();
    rasterizer.add_path(path);

    /// Finally, render the warped image
    agg::render_scanlines_aa(rasterizer, scanline, renderer_base,
                             span_allocator, span_generator);

    return output;
  }


  ImageU8 warpPerspective(const ImageU8& image,
                          const Geometry::Rotation& rotation)
  {
    requireGrayscale(image, "Warp input");
    const int raw_W = image.width();
    const int raw_H = image.height();

    const Geometry::Projection projection =
          Geometry::buildProjection(raw_W, raw_H, rotation, 1., WARP_FOVY);
    const int side_length = static_cast<int>(std::ceil(projection.side_length));

    const ImageU8 warped(getPerspectiveWarpedImage(image,
                                                   projection.homography,
                                                   side_length,
                                                   0));

    /// Bounding box of the projected corners, inside the canvas
    const Geometry::Points4x2& points_out = projection.points_out;
    const int min_x = std::max(0,
          static_cast<int>(std::floor(points_out.col(0).minCoeff())));
    const int min_y = std::max(0,
          static_cast<int>(std::floor(points_out.col(1).minCoeff())));
    const int max_x = std::min(side_length-1,
          static_cast<int>(std::ceil(points_out.col(0).maxCoeff())));
    const int max_y = std::min(side_length-1,
          static_cast<int>(std::ceil(points_out.col(1).maxCoeff())));
    if (max_x < min_x or max_y < min_y) {
      std::ostringstream oss;
      oss << "rotation (" << rotation.x << ", " << rotation.y << ", "
          << rotation.z << ") projects the image outside the canvas";
      throw SingularTransform(oss.str());
    }

    const ImageU8 crop(warped.get_crop(min_x, min_y, max_x, max_y));
    const double new_W = crop.width();
    const double new_H = crop.height();

    /// Match the original height, unless that makes the result too wide
    const int resize_W = static_cast<int>(std::ceil(new_W * raw_H / new_H));
    if (resize_W <= raw_W)
      return resizeTriangle(crop, resize_W, raw_H);

    const int resize_H = static_cast<int>(std::ceil(new_H * raw_W / new_W));
    return resizeTriangle(crop, raw_W, std::min(raw_H, resize_H));
  }

}  /// namespace TextSynth
