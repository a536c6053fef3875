/// System/STL
#include <cmath>
#include <sstream>
/// AGG (Anti-Grain Geometry)
#include "agg_basics.h"
#include "agg_pixfmt_gray.h"
#include "agg_renderer_base.h"
#include "agg_rendering_buffer.h"
/// glog
#include <glog/logging.h>

#include "textsynth/Config.h"
#include "textsynth/EffectPipeline.h"
#include "textsynth/Errors.h"
#include "textsynth/PerspectiveWarp.h"

using namespace cimg_library;

namespace TextSynth {

  namespace {

    ImageU8 correlate3x3(const ImageU8& image, const CImg<float>& kernel)
    {
      requireGrayscale(image, "Filter input");
      /// Replicated borders (boundary condition 1), no normalization
      CImg<float> filtered(CImg<float>(image).get_correlate(kernel, 1, false));
      filtered.round().cut(0.f, 255.f);
      return ImageU8(filtered);
    }

  }  // namespace


  ImageU8 applyEmboss(const ImageU8& image)
  {
    const CImg<float> kernel(3, 3, 1, 1,
                             -2, -1,  0,
                             -1,  1,  1,
                              0,  1,  2);
    return correlate3x3(image, kernel);
  }

  ImageU8 applySharpen(const ImageU8& image)
  {
    const CImg<float> kernel(3, 3, 1, 1,
                             -1, -1, -1,
                             -1,  9, -1,
                             -1, -1, -1);
    return correlate3x3(image, kernel);
  }

  ImageU8 gaussianBlur(const ImageU8& image, double sigma)
  {
    requireGrayscale(image, "Blur input");
    if (sigma <= 0.)
      return image;
    CImg<float> blurred(image);
    /// Neumann borders, true Gaussian (Van Vliet recursive filter)
    blurred.blur(static_cast<float>(sigma), true, true);
    blurred.round().cut(0.f, 255.f);
    return ImageU8(blurred);
  }

  ImageU8 applyDownUp(const ImageU8& image, RNG::RandomSource& rng)
  {
    requireGrayscale(image, "Down-up input");
    const int W = image.width();
    const int H = image.height();
    /// Closed interval [1,2]
    const double scale{rng.uniformReal(1., std::nextafter(2., 3.))};
    const int small_W = static_cast<int>(W / scale);
    const int small_H = static_cast<int>(H / scale);
    const ImageU8 small(resizeTriangle(image, small_W, small_H));
    return resizeTriangle(small, W, H);
  }

  ImageU8 drawOcclusionBox(const ImageU8& image,
                           double padding_alpha,
                           RNG::RandomSource& rng)
  {
    requireGrayscale(image, "Occlusion box input");
    if (not (padding_alpha > 1.)) {
      std::ostringstream oss;
      oss << "occlusion box padding factor must be > 1 (got "
          << padding_alpha << ")";
      throw InvalidConfiguration(oss.str());
    }

    const int W = image.width();
    const int H = image.height();
    const int pad_W = static_cast<int>(std::ceil(W * padding_alpha));
    const int pad_H = static_cast<int>(std::ceil(H * padding_alpha));

    /// Place the original somewhere inside a black canvas
    const int top  = rng.uniformInt(1, std::max(1, pad_H - H));
    const int left = rng.uniformInt(1, std::max(1, pad_W - W));
    ImageU8 padded(pad_W, pad_H, 1, 1, 0);
    padded.draw_image(left, top, image);

    /// The box encloses the original
    const int box_left = rng.uniformInt(1, left);
    const int box_top  = rng.uniformInt(1, top);
    const int box_W = rng.uniformInt(W + left - box_left, pad_W - box_left);
    const int box_H = rng.uniformInt(H + top - box_top, pad_H - box_top);
    const int right  = box_left + box_W - 1;
    const int bottom = box_top + box_H - 1;
    const int thickness = rng.uniformInt(1, 2);
    const agg::gray8 color(static_cast<unsigned>(rng.uniformInt(50, 255)));

    agg::rendering_buffer rbuf;
    rbuf.attach(padded.data(), pad_W, pad_H, pad_W);
    agg::pixfmt_gray8 pixf(rbuf);
    agg::renderer_base<agg::pixfmt_gray8> renderer(pixf);
    /// Outline bands; anything beyond the canvas is clipped
    renderer.copy_bar(box_left, box_top, right, box_top+thickness-1, color);
    renderer.copy_bar(box_left, bottom, right, bottom+thickness-1, color);
    renderer.copy_bar(box_left, box_top, box_left+thickness-1, bottom, color);
    renderer.copy_bar(right, box_top, right+thickness-1, bottom, color);

    return resizeTriangle(padded, W, H);
  }


  EffectPipeline::EffectPipeline(const textsynth::EffectParameter& param)
    : m_box_prob(param.box_prob()),
      m_box_padding(param.box_padding()),
      m_perspective_prob(param.perspective_prob()),
      m_perspective_x(RandomVariableOrDefault(
            param.has_perspective_x(), param.perspective_x(),
            RNG::RandomVariable::gaussian(-15., 15.))),
      m_perspective_y(RandomVariableOrDefault(
            param.has_perspective_y(), param.perspective_y(),
            RNG::RandomVariable::gaussian(-15., 15.))),
      m_perspective_z(RandomVariableOrDefault(
            param.has_perspective_z(), param.perspective_z(),
            RNG::RandomVariable::gaussian(-3., 3.))),
      m_blur_prob(param.blur_prob()),
      m_blur_sigma(RandomVariableOrDefault(
            param.has_blur_sigma(), param.blur_sigma(),
            RNG::RandomVariable::uniform(0., 1.5))),
      m_filter_prob(param.filter_prob()),
      m_emboss_prob(param.emboss_prob()),
      m_sharp_prob(param.sharp_prob())
  {
    CheckProbability(m_box_prob,         "box_prob");
    CheckProbability(m_perspective_prob, "perspective_prob");
    CheckProbability(m_blur_prob,        "blur_prob");
    CheckProbability(m_filter_prob,      "filter_prob");
    CheckProbability(m_emboss_prob,      "emboss_prob");
    CheckProbability(m_sharp_prob,       "sharp_prob");
    if (std::fabs(m_emboss_prob + m_sharp_prob - 1.) > 1e-9) {
      std::ostringstream oss;
      oss << "emboss_prob + sharp_prob must be 1 (got "
          << m_emboss_prob << " + " << m_sharp_prob << ")";
      throw InvalidConfiguration(oss.str());
    }
    if (not (m_box_padding > 1.)) {
      std::ostringstream oss;
      oss << "box_padding must be > 1 (got " << m_box_padding << ")";
      throw InvalidConfiguration(oss.str());
    }
  }

  ImageU8 EffectPipeline::apply(const ImageU8& image,
                                RNG::RandomSource& rng) const
  {
    requireGrayscale(image, "Effect input");
    ImageU8 result(image);

    if (rng.trigger(m_box_prob)) {
      result = drawOcclusionBox(result, m_box_padding, rng);
    }

    if (rng.trigger(m_perspective_prob)) {
      /// Drawn one by one to keep the sampling order fixed
      const double angle_x{m_perspective_x.sample(rng)};
      const double angle_y{m_perspective_y.sample(rng)};
      const double angle_z{m_perspective_z.sample(rng)};
      const Geometry::Rotation rotation(angle_x, angle_y, angle_z);
      DLOG(INFO) << "Perspective rotation (" << rotation.x << ", "
                 << rotation.y << ", " << rotation.z << ")";
      result = warpPerspective(result, rotation);
    }

    if (rng.trigger(m_blur_prob)) {
      result = gaussianBlur(result, m_blur_sigma.sample(rng));
      if (rng.trigger(m_filter_prob)) {
        if (rng.trigger(m_emboss_prob))
          result = applyEmboss(result);
        else
          result = applySharpen(result);
      }
    }

    return result;
  }


  ImageU8 applyEffect(const ImageU8& image,
                      const textsynth::EffectParameter& param,
                      RNG::RandomSource& rng)
  {
    return EffectPipeline(param).apply(image, rng);
  }

}  /// namespace TextSynth
