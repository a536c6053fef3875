#ifndef TEXTSYNTH_EFFECTPIPELINE_H__
#define TEXTSYNTH_EFFECTPIPELINE_H__

#include "textsynth/Image.h"
#include "textsynth/SimpleRandom.h"
#include "textsynth/proto/textsynth.pb.h"

namespace TextSynth {

  /// 3x3 emboss kernel, row-major
  ImageU8 applyEmboss(const ImageU8& image);
  /// 3x3 sharpen kernel, row-major
  ImageU8 applySharpen(const ImageU8& image);
  /// Gaussian blur; sigma <= 0 returns an unchanged copy
  ImageU8 gaussianBlur(const ImageU8& image, double sigma);
  /// Downscale by a random factor in [1,2] and scale back up
  ImageU8 applyDownUp(const ImageU8& image, RNG::RandomSource& rng);

  /**
   * Pad the image by padding_alpha, draw a random rectangle outline around
   * the (randomly placed) original and resize back to the input dimensions.
   * padding_alpha must be > 1.
   */
  ImageU8 drawOcclusionBox(const ImageU8& image,
                           double padding_alpha,
                           RNG::RandomSource& rng);


  /**
   * Randomly gated sequence of degradations for rendered text rasters:
   * occlusion box, perspective warp, blur and (after a blur only) emboss or
   * sharpen.
   */
  class EffectPipeline
  {
  public:
    /// Throws InvalidConfiguration on invalid probabilities or distributions
    explicit EffectPipeline(const textsynth::EffectParameter& param);

    ImageU8 apply(const ImageU8& image, RNG::RandomSource& rng) const;

    double boxProb() const { return m_box_prob; }
    double perspectiveProb() const { return m_perspective_prob; }
    double blurProb() const { return m_blur_prob; }
    double filterProb() const { return m_filter_prob; }

  private:
    double m_box_prob;
    double m_box_padding;
    double m_perspective_prob;
    RNG::RandomVariable m_perspective_x;
    RNG::RandomVariable m_perspective_y;
    RNG::RandomVariable m_perspective_z;
    double m_blur_prob;
    RNG::RandomVariable m_blur_sigma;
    double m_filter_prob;
    double m_emboss_prob;
    double m_sharp_prob;
  };


  /// One-shot EffectPipeline(param).apply(image, rng)
  ImageU8 applyEffect(const ImageU8& image,
                      const textsynth::EffectParameter& param,
                      RNG::RandomSource& rng);

}  /// namespace TextSynth

#endif  // TEXTSYNTH_EFFECTPIPELINE_H__
