// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_VECTOR3D_HPP
#define SCOL_SIM_VECTOR3D_HPP

#include "scol-sim/src/DataTypes/Vec3DBase.hpp"

namespace scol_sim
{

/**
 * @brief Direction / displacement vector in world space
 *
 * Use Coordinate for positions. Vector3D is what you get from subtracting
 * two positions and what rotations operate on.
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  static Vector3D unitY()
  {
    return Vector3D{0.0, 1.0, 0.0};
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_VECTOR3D_HPP
