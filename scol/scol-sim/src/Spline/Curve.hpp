// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_SPLINE_CURVE_HPP
#define SCOL_SIM_SPLINE_CURVE_HPP

#include "scol-sim/src/DataTypes/Coordinate.hpp"

namespace scol_sim
{

/**
 * @brief Abstract interface for a curve that segments are baked along
 *
 * The baker only needs two things from a curve: a world-space position for a
 * normalized parameter and the total arc length. How the parameter maps to
 * arc length is up to the implementation; the baker samples uniformly in t.
 *
 * Implementations must be deterministic: the same t always yields the same
 * position for an unchanged curve.
 *
 * Thread safety: Read-only methods after construction (thread-safe)
 */
class Curve
{
public:
  virtual ~Curve() = default;

  /**
   * @brief Evaluate the world-space position at parameter t
   * @param t Normalized parameter, clamped by implementations to [0, 1]
   * @return Position on the curve [m]
   */
  [[nodiscard]] virtual Coordinate position(double t) const = 0;

  /**
   * @brief Total arc length of the curve [m]
   */
  [[nodiscard]] virtual double length() const = 0;

protected:
  Curve() = default;
  Curve(const Curve&) = default;
  Curve& operator=(const Curve&) = default;
  Curve(Curve&&) noexcept = default;
  Curve& operator=(Curve&&) noexcept = default;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_SPLINE_CURVE_HPP
