/// System/STL
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include "textsynth/Errors.h"
#include "textsynth/Image.h"

using namespace cimg_library;

namespace TextSynth {

  ImageU8 imageFromBuffer(const unsigned char* data,
                          std::size_t length,
                          int width,
                          int height,
                          int channels)
  {
    if (width <= 0 or height <= 0 or channels <= 0 or not data) {
      std::ostringstream oss;
      oss << "cannot build a " << width << "x" << height << "x" << channels
          << " image";
      throw DimensionMismatch(oss.str());
    }
    const std::size_t expected{static_cast<std::size_t>(width) *
                               static_cast<std::size_t>(height) *
                               static_cast<std::size_t>(channels)};
    if (length != expected) {
      std::ostringstream oss;
      oss << "buffer holds " << length << " bytes, but " << width << "x"
          << height << "x" << channels << " needs " << expected;
      throw DimensionMismatch(oss.str());
    }

    /// The "C,X,Y,Z" dimensions emulate the interleaved RGBRGB..RGB layout
    ImageU8 result(data, channels, width, height, 1);
    /// Change pixel layout from RGBRGB..RGB to RR..RGG..GBB..B
    result.permute_axes("YZCX");
    return result;
  }

  std::vector<unsigned char> imageToBuffer(const ImageU8& image)
  {
    /// Change pixel layout from RR..RGG..GBB..B to RGBRGB..RGB
    const ImageU8 interleaved(image.get_permute_axes("CXYZ"));
    return std::vector<unsigned char>(interleaved.begin(), interleaved.end());
  }

  ImageU8 toGrayscale(const ImageU8& image)
  {
    if (image.spectrum() == 1)
      return image;
    if (image.spectrum() != 3 and image.spectrum() != 4) {
      std::ostringstream oss;
      oss << "cannot convert a " << image.spectrum() << "-channel image to "
          << "grayscale";
      throw DimensionMismatch(oss.str());
    }

    ImageU8 gray(image.width(), image.height(), 1, 1);
    cimg_forXY(gray,x,y) {
      const float luma{0.2126f*image(x,y,0,0) +
                       0.7152f*image(x,y,0,1) +
                       0.0722f*image(x,y,0,2)};
      gray(x,y) = static_cast<unsigned char>(
            std::min(255.f, std::max(0.f, std::round(luma))));
    }
    return gray;
  }

  void requireGrayscale(const ImageU8& image, const char* what)
  {
    if (image.is_empty() or image.spectrum() != 1 or image.depth() != 1) {
      std::ostringstream oss;
      oss << what << " must be a non-empty single-channel image (got "
          << image.width() << "x" << image.height() << "x"
          << image.spectrum() << ")";
      throw DimensionMismatch(oss.str());
    }
  }

  namespace {

    /// Resample in float, then round back to 8 bit
    ImageU8 resampled(const ImageU8& image, int width, int height,
                      int interpolation)
    {
      CImg<float> result(image);
      result.resize(width, height, -100, -100, interpolation);
      result.round().cut(0.f, 255.f);
      return ImageU8(result);
    }

  }  // namespace

  ImageU8 resizeTriangle(const ImageU8& image, int width, int height)
  {
    width  = std::max(1, width);
    height = std::max(1, height);
    if (width == image.width() and height == image.height())
      return image;
    const bool shrinking{width <= image.width() and
                         height <= image.height()};
    /// 2 = moving average, 3 = linear
    return resampled(image, width, height, shrinking ? 2 : 3);
  }

  ImageU8 resizeCubic(const ImageU8& image, int width, int height)
  {
    width  = std::max(1, width);
    height = std::max(1, height);
    if (width == image.width() and height == image.height())
      return image;
    /// 5 = cubic (Catmull-Rom); overshoot is cut back to [0,255]
    return resampled(image, width, height, 5);
  }

  ImageU8 invert(const ImageU8& image)
  {
    ImageU8 result(image);
    cimg_for(result,ptr,unsigned char) *ptr = 255-*ptr;
    return result;
  }

}  /// namespace TextSynth
