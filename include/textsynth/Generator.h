#ifndef TEXTSYNTH_GENERATOR_H__
#define TEXTSYNTH_GENERATOR_H__

/// System/STL
#include <memory>
#include <vector>

#include "textsynth/BackgroundPool.h"
#include "textsynth/Compositor.h"
#include "textsynth/EffectPipeline.h"
#include "textsynth/Image.h"
#include "textsynth/SimpleRandom.h"
#include "textsynth/proto/textsynth.pb.h"

namespace TextSynth {

  /**
   * Turns rendered text rasters into training samples: effects, a random
   * background crop and Poisson blending. Owns its random source, so one
   * instance must not be shared between threads.
   */
  class Generator
  {
  public:
    /// Loads the background pool from param.background().source()
    explicit Generator(const textsynth::GeneratorParameter& param);
    /// Uses the given images instead of loading backgrounds from disk
    Generator(const textsynth::GeneratorParameter& param,
              const std::vector<ImageU8>& backgrounds);

    /**
     * With apply_effect == false the raster is returned unchanged.
     * Otherwise the result is a grayscale image with the background size.
     */
    ImageU8 generate(const ImageU8& raster, bool apply_effect);

    /// Rebuild the background pool from the same source at a new size
    void setBackgroundSize(int height, int width);

    const BackgroundPool& backgrounds() const { return *m_backgrounds; }

  private:
    RNG::RandomSource m_rng;
    EffectPipeline m_effects;
    Compositor m_compositor;
    std::unique_ptr<BackgroundPool> m_backgrounds;
    /// Decoded images behind an in-memory pool (empty for a disk source)
    std::vector<ImageU8> m_background_images;
  };

}  /// namespace TextSynth

#endif  // TEXTSYNTH_GENERATOR_H__
