/**
 * Gradient-domain (Poisson) image blending on 8-bit grayscale rasters
 */

#ifndef TEXTSYNTH_POISSONSOLVER_H__
#define TEXTSYNTH_POISSONSOLVER_H__

#include "textsynth/Image.h"

namespace TextSynth {

  /// How the guidance field combines source and target gradients
  enum class GradientMode {
    Maximum = 0,  ///< per direction, whichever has the larger magnitude
    Source  = 1,  ///< source gradient only
    Average = 2,  ///< mean of both
  };

  /// Position of the mask's top-left corner inside an image
  struct Offset {
    Offset(int x=0, int y=0)
      : x(x), y(y)
    { }
    int x, y;
  };

  /**
   * Guidance field of the Poisson problem: for every cell with mask != 0,
   * the sum over its in-bounds 4-neighbours of the mixed difference
   * centre-minus-neighbour of source and target, scaled by the mask value.
   * Unmasked cells are 0. In Maximum mode a tie picks the source.
   */
  MatrixD guidanceField(const MatrixD& source,
                        const MatrixD& target,
                        const MatrixD& mask,
                        GradientMode mode);

  struct SolverResult {
    /// Current solution, clamped to [0,255] and truncated to 8 bit
    ImageU8 image;
    /// L1 norm of the discrete Poisson residual over the masked cells
    double residual;
  };


  /**
   * Jacobi relaxation of  4*t(x,y) - sum(4-neighbours of t) = grad(x,y)
   * on the cells where mask == 1. Unmasked cells act as fixed boundary
   * values; cells beyond the matrix edge read as 0.
   */
  class PoissonSolver
  {
  public:
    PoissonSolver() { }

    /**
     * Load a new problem and run one warm-start sweep. All three matrices
     * must have the same shape (DimensionMismatch otherwise).
     */
    void reset(const MatrixD& mask, const MatrixD& target, const MatrixD& grad);

    /// Run a fixed number of sweeps; the residual is reported, never used
    SolverResult step(int iterations);

    /// grad + the 4-neighbour sum of target (zero padded)
    static MatrixD gridIter(const MatrixD& grad, const MatrixD& target);

  private:
    void sweep(const MatrixD& neighbour_sum);

    MatrixD m_mask;
    MatrixD m_mask_not;
    MatrixD m_target;
    MatrixD m_grad;
  };


  /**
   * Seamless cloning of a masked source region into a target image. The
   * solver only runs on the mask's bounding box grown by one pixel; the
   * result is written back into a full-size copy of the target.
   */
  class PoissonEditor
  {
  public:
    PoissonEditor()
      : m_empty(true)
    { }

    /**
     * Mask pixels >= mask_threshold belong to the cloned region (the mask's
     * outermost rows and columns never do). The mask is placed at
     * mask_on_source inside the source and at mask_on_target inside the
     * target; both placements must keep the region inside the image.
     */
    void reset(const ImageU8& source,
               const ImageU8& mask,
               const ImageU8& target,
               const Offset& mask_on_source = Offset(),
               const Offset& mask_on_target = Offset(),
               GradientMode mode = GradientMode::Average,
               int mask_threshold = 128);

    /// Relax and return the full target; an empty mask leaves it unchanged
    SolverResult step(int iterations);

    bool emptyMask() const { return m_empty; }

  private:
    PoissonSolver m_solver;
    ImageU8 m_target;
    /// Top-left corner of the solved region inside the target
    int m_roi_x, m_roi_y;
    bool m_empty;
  };

}  /// namespace TextSynth

#endif  // TEXTSYNTH_POISSONSOLVER_H__
