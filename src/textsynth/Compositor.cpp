/// System/STL
#include <algorithm>
#include <sstream>
/// glog
#include <glog/logging.h>

#include "textsynth/Compositor.h"
#include "textsynth/Config.h"
#include "textsynth/Errors.h"

using namespace cimg_library;

namespace TextSynth {

  ImageU8 changeBackgroundColor(const ImageU8& image, double alpha, double beta)
  {
    requireGrayscale(image, "Background");
    ImageU8 result(image.width(), image.height(), 1, 1);
    cimg_forXY(result,x,y) {
      const double val{image(x,y) * alpha + beta};
      result(x,y) = static_cast<unsigned char>(
            std::min(255., std::max(50., val)));
    }
    return result;
  }


  Compositor::Compositor(const textsynth::MergeParameter& param)
    : m_height_diff(RandomVariableOrDefault(
            param.has_height_diff(), param.height_diff(),
            RNG::RandomVariable::uniform(2., 10.))),
      m_bg_alpha(RandomVariableOrDefault(
            param.has_bg_alpha(), param.bg_alpha(),
            RNG::RandomVariable::gaussian(0.5, 1.5))),
      m_bg_beta(RandomVariableOrDefault(
            param.has_bg_beta(), param.bg_beta(),
            RNG::RandomVariable::gaussian(-50., 50.))),
      m_font_alpha(RandomVariableOrDefault(
            param.has_font_alpha(), param.font_alpha(),
            RNG::RandomVariable::uniform(0.2, 1.))),
      m_reverse_prob(param.reverse_prob()),
      m_iterations(param.iterations()),
      m_mask_threshold(param.mask_threshold())
  {
    CheckProbability(m_reverse_prob, "reverse_prob");
    if (m_iterations <= 0) {
      std::ostringstream oss;
      oss << "iterations must be positive (got " << m_iterations << ")";
      throw InvalidConfiguration(oss.str());
    }
  }

  ImageU8 Compositor::randomChangeBackgroundColor(const ImageU8& background,
                                                  RNG::RandomSource& rng) const
  {
    const double alpha{m_bg_alpha.sample(rng)};
    const double beta{m_bg_beta.sample(rng)};
    return changeBackgroundColor(background, alpha, beta);
  }

  ImageU8 Compositor::randomPad(const ImageU8& foreground,
                                int background_height,
                                int background_width,
                                RNG::RandomSource& rng) const
  {
    requireGrayscale(foreground, "Foreground");
    if (background_height < 2 or background_width < 1) {
      std::ostringstream oss;
      oss << "cannot pad onto a " << background_width << "x"
          << background_height << " background";
      throw DimensionMismatch(oss.str());
    }

    /// Keep at least one row above the text
    const int resize_H = std::min(background_height-1, std::max(1,
          static_cast<int>(background_height - m_height_diff.sample(rng))));
    const int resize_W = std::min(background_width, std::max(1,
          static_cast<int>(static_cast<double>(foreground.width()) *
                           resize_H / foreground.height())));
    const ImageU8 scaled(resizeCubic(foreground, resize_W, resize_H));

    const int top  = rng.uniformInt(1, background_height - resize_H);
    const int left = rng.uniformInt(0, background_width - resize_W);

    ImageU8 padded(background_width, background_height, 1, 1, 0);
    padded.draw_image(left, top, scaled);
    return padded;
  }

  ImageU8 Compositor::poissonEdit(const ImageU8& foreground,
                                  const ImageU8& background,
                                  RNG::RandomSource& rng) const
  {
    requireGrayscale(background, "Background");
    const ImageU8 target(randomChangeBackgroundColor(background, rng));
    const ImageU8 padded(randomPad(foreground, target.height(),
                                   target.width(), rng));

    /// Dark ink on light paper becomes a bright source
    const double font_alpha{m_font_alpha.sample(rng)};
    ImageU8 source(padded.width(), padded.height(), 1, 1);
    cimg_forXY(source,x,y) {
      const double val{(255. - padded(x,y)) * font_alpha};
      source(x,y) = static_cast<unsigned char>(
            std::min(255., std::max(0., val)));
    }

    PoissonEditor editor;
    editor.reset(source, padded, target, Offset(0, 0), Offset(0, 0),
                 GradientMode::Maximum, m_mask_threshold);
    const SolverResult solved(editor.step(m_iterations));
    VLOG(1) << "Poisson residual after " << m_iterations << " iterations: "
            << solved.residual;

    if (rng.trigger(m_reverse_prob))
      return invert(solved.image);
    return solved.image;
  }

}  /// namespace TextSynth
