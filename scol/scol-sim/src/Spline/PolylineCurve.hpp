// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_SPLINE_POLYLINE_CURVE_HPP
#define SCOL_SIM_SPLINE_POLYLINE_CURVE_HPP

#include <vector>

#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Spline/Curve.hpp"

namespace scol_sim
{

/**
 * @brief Piecewise-linear curve through a list of points
 *
 * The parameter t is proportional to arc length, so position(0.5) is the
 * point halfway along the polyline. Coincident consecutive points are allowed
 * and simply contribute zero length.
 */
class PolylineCurve : public Curve
{
public:
  /**
   * @brief Construct from an ordered list of points
   * @param points At least two points
   * @throws std::invalid_argument if fewer than two points are given
   */
  explicit PolylineCurve(std::vector<Coordinate> points);

  ~PolylineCurve() override = default;

  [[nodiscard]] Coordinate position(double t) const override;
  [[nodiscard]] double length() const override;

  PolylineCurve(const PolylineCurve&) = default;
  PolylineCurve& operator=(const PolylineCurve&) = default;
  PolylineCurve(PolylineCurve&&) noexcept = default;
  PolylineCurve& operator=(PolylineCurve&&) noexcept = default;

private:
  std::vector<Coordinate> points_;
  std::vector<double> cumulativeLength_;  // cumulativeLength_[i] = length up to points_[i]
};

}  // namespace scol_sim

#endif  // SCOL_SIM_SPLINE_POLYLINE_CURVE_HPP
