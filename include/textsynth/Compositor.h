#ifndef TEXTSYNTH_COMPOSITOR_H__
#define TEXTSYNTH_COMPOSITOR_H__

#include "textsynth/Image.h"
#include "textsynth/PoissonSolver.h"
#include "textsynth/SimpleRandom.h"
#include "textsynth/proto/textsynth.pb.h"

namespace TextSynth {

  /// clamp(p*alpha + beta, 50, 255), truncated, on every pixel
  ImageU8 changeBackgroundColor(const ImageU8& image, double alpha, double beta);

  /**
   * Blends a rendered text raster into a background: tone jitter of the
   * background, random placement of the (rescaled) text, ink inversion,
   * Poisson cloning with maximum gradient mixing and an optional final
   * inversion.
   */
  class Compositor
  {
  public:
    /// Throws InvalidConfiguration on invalid probabilities or distributions
    explicit Compositor(const textsynth::MergeParameter& param);

    /// changeBackgroundColor with alpha ~ bg_alpha and beta ~ bg_beta
    ImageU8 randomChangeBackgroundColor(const ImageU8& background,
                                        RNG::RandomSource& rng) const;

    /**
     * Rescale foreground to height background_height - height_diff (aspect
     * preserved, width clamped to [1, background_width]) and paste it at a
     * random position (top >= 1) on a black background_width x
     * background_height canvas.
     */
    ImageU8 randomPad(const ImageU8& foreground,
                      int background_height,
                      int background_width,
                      RNG::RandomSource& rng) const;

    /// Full blend; the result has the background's dimensions
    ImageU8 poissonEdit(const ImageU8& foreground,
                        const ImageU8& background,
                        RNG::RandomSource& rng) const;

  private:
    RNG::RandomVariable m_height_diff;
    RNG::RandomVariable m_bg_alpha;
    RNG::RandomVariable m_bg_beta;
    RNG::RandomVariable m_font_alpha;
    double m_reverse_prob;
    int m_iterations;
    int m_mask_threshold;
  };

}  /// namespace TextSynth

#endif  // TEXTSYNTH_COMPOSITOR_H__
