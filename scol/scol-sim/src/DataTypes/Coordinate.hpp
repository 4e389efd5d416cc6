// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_COORDINATE_HPP
#define SCOL_SIM_COORDINATE_HPP

#include "scol-sim/src/DataTypes/Vec3DBase.hpp"

namespace scol_sim
{

/**
 * @brief Position in world space [m]
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  /**
   * @brief Point halfway between two positions
   */
  static Coordinate midpoint(const Coordinate& a, const Coordinate& b)
  {
    return Coordinate{(a + b) * 0.5};
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_COORDINATE_HPP
