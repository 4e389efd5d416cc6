// Ticket: 0006_bezier_spline_source

#ifndef SCOL_SIM_SPLINE_BEZIER_SPLINE_HPP
#define SCOL_SIM_SPLINE_BEZIER_SPLINE_HPP

#include <cstddef>
#include <vector>

#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Spline/Curve.hpp"

namespace scol_sim
{

/**
 * @brief Piecewise cubic Bezier spline
 *
 * Control points are laid out as P0, C0a, C0b, P1, C1a, C1b, P2, ... so a
 * spline with k pieces has 3k + 1 control points, and consecutive pieces
 * share their end knot.
 *
 * The normalized parameter t is split evenly between pieces: piece i covers
 * t in [i/k, (i+1)/k]. Within a piece the Bezier parameter is used directly,
 * so sampling uniformly in t is not uniform in arc length. This matches how
 * authoring tools expose spline evaluation.
 *
 * Arc length is approximated once at construction by summing chord lengths
 * over kChordSamplesPerPiece sub-steps per piece.
 */
class BezierSpline : public Curve
{
public:
  /**
   * @brief Construct from a flat list of control points
   * @param controlPoints 3k + 1 points with k >= 1
   * @throws std::invalid_argument if the count is not of the form 3k + 1
   */
  explicit BezierSpline(std::vector<Coordinate> controlPoints);

  ~BezierSpline() override = default;

  [[nodiscard]] Coordinate position(double t) const override;
  [[nodiscard]] double length() const override;

  /**
   * @brief Number of cubic pieces in the spline
   */
  [[nodiscard]] size_t getPieceCount() const;

  BezierSpline(const BezierSpline&) = default;
  BezierSpline& operator=(const BezierSpline&) = default;
  BezierSpline(BezierSpline&&) noexcept = default;
  BezierSpline& operator=(BezierSpline&&) noexcept = default;

private:
  [[nodiscard]] Coordinate evaluatePiece(size_t piece, double u) const;

  static constexpr size_t kChordSamplesPerPiece{64};

  std::vector<Coordinate> controlPoints_;
  double length_{0.0};
};

}  // namespace scol_sim

#endif  // SCOL_SIM_SPLINE_BEZIER_SPLINE_HPP
