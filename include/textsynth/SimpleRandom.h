/**
 * Random source and configurable distributions
 */

#ifndef TEXTSYNTH_SIMPLERANDOM_H__
#define TEXTSYNTH_SIMPLERANDOM_H__

/// System/STL
#include <algorithm>
#include <random>
#include <sstream>

#include "textsynth/Errors.h"

namespace TextSynth {
namespace RNG {

  /**
   * Raw randomness source. One instance is threaded explicitly through every
   * sampling call; nothing in the pipeline owns a hidden generator.
   */
  class RandomSource
  {
    public:
      /// A negative seed draws the seed from std::random_device
      explicit RandomSource(int seed = -1)
      {
        if (seed >= 0) {
          m_mersenne = std::mt19937(seed);
        } else {
          std::random_device randev;
          m_mersenne = std::mt19937(randev());
        }
      }

      /// Uniform integer in [a,b] (bounds may come in either order)
      int uniformInt(int a, int b)
      {
        if (a > b) std::swap(a, b);
        return std::uniform_int_distribution<int>(a, b)(m_mersenne);
      }

      /// Uniform real in [a,b)
      double uniformReal(double a = 0., double b = 1.)
      {
        if (a == b) return a;
        if (a > b) std::swap(a, b);
        return std::uniform_real_distribution<double>(a, b)(m_mersenne);
      }

      double normal(double mean, double stddev)
      {
        return std::normal_distribution<double>(mean, stddev)(m_mersenne);
      }

      /// Bernoulli gate; a probability of 1 always fires, 0 never does
      bool trigger(double probability)
      {
        return (uniformReal(0., 1.) < probability);
      }

      std::mt19937& engine() { return m_mersenne; }

    private:
      /// Mersenne Twister engine
      std::mt19937 m_mersenne;
  };


  /**
   * Distribution over a closed interval [min,max], either uniform or a
   * Gaussian centered on the interval (sigma = width/6) whose samples are
   * clamped to the interval. Immutable once built.
   */
  class RandomVariable
  {
    public:
      enum class Kind {
        Uniform  = 0,
        Gaussian = 1,
      };

      RandomVariable()
        : m_kind(Kind::Uniform), m_min(0.), m_max(0.)
      { }

      RandomVariable(Kind kind, double min_val, double max_val)
        : m_kind(kind), m_min(min_val), m_max(max_val)
      {
        if (not (min_val <= max_val)) {
          std::ostringstream oss;
          oss << "random interval [" << min_val << ", " << max_val << "]"
              << " has min > max";
          throw InvalidConfiguration(oss.str());
        }
      }

      static RandomVariable uniform(double min_val, double max_val)
      {
        return RandomVariable(Kind::Uniform, min_val, max_val);
      }

      static RandomVariable gaussian(double min_val, double max_val)
      {
        return RandomVariable(Kind::Gaussian, min_val, max_val);
      }

      /// A degenerate interval that always yields the same value
      static RandomVariable constant(double value)
      {
        return RandomVariable(Kind::Uniform, value, value);
      }

      double sample(RandomSource& rng) const
      {
        if (m_min == m_max)
          return m_min;

        switch (m_kind) {
          case Kind::Uniform: {
            return std::uniform_real_distribution<double>(m_min, m_max)(
                  rng.engine());
          }
          case Kind::Gaussian: {
            const double mean{(m_min+m_max)/2.};
            const double sigma{(m_max-m_min)/6.};
            const double val{rng.normal(mean, sigma)};
            return std::min(m_max, std::max(m_min, val));
          }
        }
        return m_min;
      }

      Kind kind() const { return m_kind; }
      double min() const { return m_min; }
      double max() const { return m_max; }

    private:
      Kind m_kind;
      double m_min, m_max;
  };

}  // namespace RNG
}  // namespace TextSynth


#endif  // TEXTSYNTH_SIMPLERANDOM_H__
