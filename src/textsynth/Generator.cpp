/// glog
#include <glog/logging.h>

#include "textsynth/Generator.h"

namespace TextSynth {

  Generator::Generator(const textsynth::GeneratorParameter& param)
    : m_rng(param.seed()),
      m_effects(param.effect()),
      m_compositor(param.merge())
  {
    m_backgrounds.reset(new BackgroundPool(param.background().source(),
                                           param.background().height(),
                                           param.background().width(),
                                           m_rng));
  }

  Generator::Generator(const textsynth::GeneratorParameter& param,
                       const std::vector<ImageU8>& backgrounds)
    : m_rng(param.seed()),
      m_effects(param.effect()),
      m_compositor(param.merge()),
      m_background_images(backgrounds)
  {
    m_backgrounds.reset(new BackgroundPool(m_background_images,
                                           param.background().height(),
                                           param.background().width(),
                                           m_rng));
  }

  ImageU8 Generator::generate(const ImageU8& raster, bool apply_effect)
  {
    if (not apply_effect)
      return raster;

    const ImageU8 gray(toGrayscale(raster));
    const ImageU8 text(m_effects.apply(gray, m_rng));
    const ImageU8& background = m_backgrounds->random(m_rng);
    return m_compositor.poissonEdit(text, background, m_rng);
  }

  void Generator::setBackgroundSize(int height, int width)
  {
    std::unique_ptr<BackgroundPool> pool;
    if (m_background_images.empty()) {
      pool.reset(new BackgroundPool(m_backgrounds->source(), height, width,
                                    m_rng));
    } else {
      pool.reset(new BackgroundPool(m_background_images, height, width,
                                    m_rng));
    }
    m_backgrounds.swap(pool);
    LOG(INFO) << "Background size set to " << width << "x" << height;
  }

}  /// namespace TextSynth
