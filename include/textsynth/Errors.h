#ifndef TEXTSYNTH_ERRORS_H__
#define TEXTSYNTH_ERRORS_H__

/// System/STL
#include <stdexcept>
#include <string>

namespace TextSynth {

  /**
   * Common base of all errors raised by the synthesis pipeline
   */
  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string& what)
      : std::runtime_error(what)
    { }
  };


  /// Probability/weight invariants violated, or unusable config file
  class InvalidConfiguration : public Error
  {
  public:
    explicit InvalidConfiguration(const std::string& what)
      : Error("Invalid configuration: "+what)
    { }
  };


  /// Buffer length vs. width*height, or solver matrix shapes diverging
  class DimensionMismatch : public Error
  {
  public:
    explicit DimensionMismatch(const std::string& what)
      : Error("Dimension mismatch: "+what)
    { }
  };


  /// The homography system has no solution (degenerate correspondences)
  class SingularTransform : public Error
  {
  public:
    explicit SingularTransform(const std::string& what)
      : Error("Singular transform: "+what)
    { }
  };


  /// No usable image left in a background pool
  class EmptyResourcePool : public Error
  {
  public:
    explicit EmptyResourcePool(const std::string& what)
      : Error("Empty resource pool: "+what)
    { }
  };

}  /// namespace TextSynth

#endif  // TEXTSYNTH_ERRORS_H__
