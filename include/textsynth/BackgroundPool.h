#ifndef TEXTSYNTH_BACKGROUNDPOOL_H__
#define TEXTSYNTH_BACKGROUNDPOOL_H__

/// System/STL
#include <cstddef>
#include <string>
#include <vector>

#include "textsynth/Image.h"
#include "textsynth/SimpleRandom.h"

namespace TextSynth {

  /**
   * Fixed-size grayscale background crops, prepared once at construction.
   * Every image is converted to grayscale, upscaled (aspect preserved) if it
   * does not cover height x width, and randomly cropped to exactly
   * height x width.
   */
  class BackgroundPool
  {
  public:
    /**
     * source is either a directory (all .png/.jpg/.jpeg files in it) or a
     * text file listing one image path per line. Unreadable images are
     * skipped; no usable image at all is EmptyResourcePool.
     */
    BackgroundPool(const std::string& source,
                   int height,
                   int width,
                   RNG::RandomSource& rng);

    /// Pool over already decoded images
    BackgroundPool(const std::vector<ImageU8>& images,
                   int height,
                   int width,
                   RNG::RandomSource& rng);

    const ImageU8& random(RNG::RandomSource& rng) const;
    /// Throws std::out_of_range for index >= len()
    const ImageU8& get(std::size_t index) const;

    std::size_t len() const { return m_images.size(); }
    int height() const { return m_height; }
    int width() const { return m_width; }
    const std::string& source() const { return m_source; }

  private:
    void addImage(const ImageU8& image, RNG::RandomSource& rng);
    void checkNotEmpty() const;

    std::vector<ImageU8> m_images;
    int m_height, m_width;
    std::string m_source;
  };

}  /// namespace TextSynth

#endif  // TEXTSYNTH_BACKGROUNDPOOL_H__
