#ifndef TEXTSYNTH_IMAGE_H__
#define TEXTSYNTH_IMAGE_H__

/// System/STL
#include <cstddef>
#include <vector>

/// CImg (>= 2.0.0)
#include "CImg.h"

namespace TextSynth {

  /// 8-bit raster, 1 channel (grayscale) or 3 channels (RGB)
  typedef cimg_library::CImg<unsigned char> ImageU8;
  /// Dense 64-bit float matrix, (x,y) = (column,row)
  typedef cimg_library::CImg<double> MatrixD;

  /**
   * Build an image from an interleaved, row-major byte buffer. Throws
   * DimensionMismatch if length != width*height*channels.
   */
  ImageU8 imageFromBuffer(const unsigned char* data,
                          std::size_t length,
                          int width,
                          int height,
                          int channels=1);

  /// Interleaved, row-major copy of the image samples
  std::vector<unsigned char> imageToBuffer(const ImageU8& image);

  /// Rec. 709 luma of an RGB(A) image; grayscale input is copied
  ImageU8 toGrayscale(const ImageU8& image);

  /// Throws DimensionMismatch unless the image is non-empty and single-channel
  void requireGrayscale(const ImageU8& image, const char* what);

  /**
   * Triangle-filter style resampling: area averaging when shrinking,
   * linear interpolation when enlarging
   */
  ImageU8 resizeTriangle(const ImageU8& image, int width, int height);

  /// Cubic (Catmull-Rom) resampling, clamped to the sample range
  ImageU8 resizeCubic(const ImageU8& image, int width, int height);

  /// 255 - p on every sample
  ImageU8 invert(const ImageU8& image);

}  /// namespace TextSynth

#endif  // TEXTSYNTH_IMAGE_H__
