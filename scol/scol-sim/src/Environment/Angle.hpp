// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_ANGLE_HPP
#define SCOL_SIM_ANGLE_HPP

#include <algorithm>
#include <cmath>
#include <numbers>

#include "scol-sim/src/DataTypes/Vector3D.hpp"

namespace scol_sim
{

// Conversion constants
static constexpr double RAD_TO_DEG = 180.0 / std::numbers::pi;
static constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;

/**
 * @brief Unsigned angle value stored in radians
 *
 * Angles here are geometric magnitudes (the angle between two directions,
 * a bend threshold), so no wrap-around normalization is applied.
 */
class Angle
{
public:
  Angle() : rad_{0.0}
  {
  }

  static Angle fromRadians(double radians)
  {
    return Angle{radians};
  }

  static Angle fromDegrees(double degrees)
  {
    return Angle{degrees * DEG_TO_RAD};
  }

  /**
   * @brief Unsigned angle between two directions, in [0, pi]
   *
   * Returns zero when either direction is (nearly) zero length, so the
   * result never carries a NaN from a degenerate input. The cosine is
   * clamped to [-1, 1] before acos to absorb rounding.
   */
  static Angle between(const Vector3D& a, const Vector3D& b)
  {
    double const denominator = std::sqrt(a.squaredNorm() * b.squaredNorm());
    if (denominator < kDegenerateNorm)
    {
      return Angle{};
    }
    double const cosine = std::clamp(a.dot(b) / denominator, -1.0, 1.0);
    return Angle{std::acos(cosine)};
  }

  [[nodiscard]] double getRad() const
  {
    return rad_;
  }

  [[nodiscard]] double toDeg() const
  {
    return rad_ * RAD_TO_DEG;
  }

  Angle operator+(const Angle& other) const
  {
    return Angle{rad_ + other.rad_};
  }

  Angle operator-(const Angle& other) const
  {
    return Angle{rad_ - other.rad_};
  }

  bool operator<(const Angle& other) const
  {
    return rad_ < other.rad_;
  }

  bool operator>(const Angle& other) const
  {
    return rad_ > other.rad_;
  }

  bool operator<=(const Angle& other) const
  {
    return rad_ <= other.rad_;
  }

  bool operator>=(const Angle& other) const
  {
    return rad_ >= other.rad_;
  }

private:
  explicit Angle(double radians) : rad_{radians}
  {
  }

  static constexpr double kDegenerateNorm{1e-15};

  double rad_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_ANGLE_HPP
