/// System/STL
#include <algorithm>
#include <cmath>
#include <sstream>
/// glog
#include <glog/logging.h>

#include "textsynth/Errors.h"
#include "textsynth/PoissonSolver.h"

using namespace cimg_library;

namespace TextSynth {

  namespace {

    bool sameShape(const MatrixD& a, const MatrixD& b)
    {
      return (a.width() == b.width() and a.height() == b.height());
    }

    double mixGradient(double source, double target, GradientMode mode)
    {
      switch (mode) {
        case GradientMode::Source:
          return source;
        case GradientMode::Average:
          return (source + target) / 2.;
        case GradientMode::Maximum:
        default:
          return (std::fabs(source) >= std::fabs(target) ? source : target);
      }
    }

    /// Throws unless [x0,x1]x[y0,y1] lies inside image
    void requireRegion(const ImageU8& image, const char* what,
                       int x0, int y0, int x1, int y1)
    {
      if (x0 < 0 or y0 < 0 or x1 >= image.width() or y1 >= image.height()) {
        std::ostringstream oss;
        oss << what << " region [" << x0 << "," << x1 << "]x[" << y0 << ","
            << y1 << "] exceeds the " << image.width() << "x"
            << image.height() << " image";
        throw DimensionMismatch(oss.str());
      }
    }

  }  // namespace


  MatrixD guidanceField(const MatrixD& source,
                        const MatrixD& target,
                        const MatrixD& mask,
                        GradientMode mode)
  {
    if (not sameShape(source, mask) or not sameShape(target, mask))
      throw DimensionMismatch("source, target and mask shapes differ");

    const int W = mask.width();
    const int H = mask.height();
    MatrixD grad(W, H, 1, 1, 0.);
    const int dx[4] = { 0, 0, -1, 1 };
    const int dy[4] = { -1, 1, 0, 0 };
    cimg_forXY(grad,x,y) {
      if (mask(x,y) == 0.)
        continue;
      double sum{0.};
      for (int d = 0; d < 4; ++d) {
        const int nx = x + dx[d];
        const int ny = y + dy[d];
        if (nx < 0 or ny < 0 or nx >= W or ny >= H)
          continue;
        sum += mixGradient(source(x,y) - source(nx,ny),
                           target(x,y) - target(nx,ny),
                           mode);
      }
      grad(x,y) = sum * mask(x,y);
    }
    return grad;
  }


  MatrixD PoissonSolver::gridIter(const MatrixD& grad, const MatrixD& target)
  {
    if (not sameShape(grad, target))
      throw DimensionMismatch("gradient and target shapes differ");

    const int W = target.width();
    const int H = target.height();
    MatrixD result(grad);
    cimg_forXY(result,x,y) {
      double sum{0.};
      if (y > 0)   sum += target(x,y-1);
      if (y < H-1) sum += target(x,y+1);
      if (x > 0)   sum += target(x-1,y);
      if (x < W-1) sum += target(x+1,y);
      result(x,y) += sum;
    }
    return result;
  }

  void PoissonSolver::sweep(const MatrixD& neighbour_sum)
  {
    cimg_forXY(m_target,x,y) {
      m_target(x,y) = m_target(x,y) * m_mask_not(x,y) +
                      neighbour_sum(x,y) * m_mask(x,y) / 4.;
    }
  }

  void PoissonSolver::reset(const MatrixD& mask,
                            const MatrixD& target,
                            const MatrixD& grad)
  {
    if (mask.is_empty() or not sameShape(mask, target) or
        not sameShape(mask, grad)) {
      std::ostringstream oss;
      oss << "mask " << mask.width() << "x" << mask.height()
          << ", target " << target.width() << "x" << target.height()
          << ", gradient " << grad.width() << "x" << grad.height();
      throw DimensionMismatch(oss.str());
    }

    m_mask = mask;
    m_mask_not = mask.get_fill(1.) - mask;
    m_target = target;
    m_grad = grad;

    /// Warm start
    sweep(gridIter(m_grad, m_target));
  }

  SolverResult PoissonSolver::step(int iterations)
  {
    if (iterations < 0) {
      std::ostringstream oss;
      oss << "iteration count must not be negative (got " << iterations << ")";
      throw InvalidConfiguration(oss.str());
    }
    if (m_target.is_empty())
      throw DimensionMismatch("no problem loaded (step before reset)");

    for (int i = 0; i < iterations; ++i)
      sweep(gridIter(m_grad, m_target));

    const int W = m_target.width();
    const int H = m_target.height();
    double residual{0.};
    cimg_forXY(m_target,x,y) {
      if (m_mask(x,y) == 0.)
        continue;
      double r{4.*m_target(x,y) - m_grad(x,y)};
      if (y > 0)   r -= m_target(x,y-1);
      if (y < H-1) r -= m_target(x,y+1);
      if (x > 0)   r -= m_target(x-1,y);
      if (x < W-1) r -= m_target(x+1,y);
      residual += std::fabs(m_mask(x,y) * r);
    }

    SolverResult result;
    result.image.assign(W, H, 1, 1);
    cimg_forXY(m_target,x,y) {
      result.image(x,y) = static_cast<unsigned char>(
            std::min(255., std::max(0., m_target(x,y))));
    }
    result.residual = residual;
    return result;
  }


  void PoissonEditor::reset(const ImageU8& source,
                            const ImageU8& mask,
                            const ImageU8& target,
                            const Offset& mask_on_source,
                            const Offset& mask_on_target,
                            GradientMode mode,
                            int mask_threshold)
  {
    requireGrayscale(source, "Poisson source");
    requireGrayscale(mask,   "Poisson mask");
    requireGrayscale(target, "Poisson target");

    m_target = target;
    m_empty = true;
    m_roi_x = m_roi_y = 0;

    /// Binary mask with the outermost ring cleared
    const int mask_W = mask.width();
    const int mask_H = mask.height();
    MatrixD binary(mask_W, mask_H, 1, 1, 0.);
    int x0 = mask_W, y0 = mask_H, x1 = -1, y1 = -1;
    for (int y = 1; y < mask_H-1; ++y) {
      for (int x = 1; x < mask_W-1; ++x) {
        if (mask(x,y) >= mask_threshold) {
          binary(x,y) = 1.;
          x0 = std::min(x0, x);  x1 = std::max(x1, x);
          y0 = std::min(y0, y);  y1 = std::max(y1, y);
        }
      }
    }
    if (x1 < 0) {
      DLOG(INFO) << "Poisson mask is empty; target is left unchanged";
      return;
    }

    /// Region of interest: bounding box plus one pixel on each side
    --x0; --y0; ++x1; ++y1;
    requireRegion(source, "Poisson source",
                  mask_on_source.x+x0, mask_on_source.y+y0,
                  mask_on_source.x+x1, mask_on_source.y+y1);
    requireRegion(target, "Poisson target",
                  mask_on_target.x+x0, mask_on_target.y+y0,
                  mask_on_target.x+x1, mask_on_target.y+y1);

    const MatrixD mask_crop(binary.get_crop(x0, y0, x1, y1));
    const MatrixD source_crop(MatrixD(source).get_crop(
          mask_on_source.x+x0, mask_on_source.y+y0,
          mask_on_source.x+x1, mask_on_source.y+y1));
    const MatrixD target_crop(MatrixD(target).get_crop(
          mask_on_target.x+x0, mask_on_target.y+y0,
          mask_on_target.x+x1, mask_on_target.y+y1));

    const MatrixD grad(guidanceField(source_crop, target_crop, mask_crop,
                                     mode));
    m_solver.reset(mask_crop, target_crop, grad);
    m_roi_x = mask_on_target.x + x0;
    m_roi_y = mask_on_target.y + y0;
    m_empty = false;
  }

  SolverResult PoissonEditor::step(int iterations)
  {
    if (m_empty) {
      if (iterations < 0) {
        std::ostringstream oss;
        oss << "iteration count must not be negative (got " << iterations
            << ")";
        throw InvalidConfiguration(oss.str());
      }
      SolverResult result;
      result.image = m_target;
      result.residual = 0.;
      return result;
    }

    SolverResult result(m_solver.step(iterations));
    m_target.draw_image(m_roi_x, m_roi_y, result.image);
    result.image = m_target;
    return result;
  }

}  /// namespace TextSynth
