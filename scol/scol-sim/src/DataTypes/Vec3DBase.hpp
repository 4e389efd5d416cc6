// Ticket: 0001_spline_sampling_core
// Base CRTP template for 3D vector types

#ifndef SCOL_SIM_VEC3D_BASE_HPP
#define SCOL_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace scol_sim::detail
{

/**
 * @brief CRTP base class for 3D vector types
 *
 * Inherits from Eigen::Vector3d so every Eigen expression (dot, cross, norm,
 * arithmetic) is available on the derived types. Derived types use:
 *
 *   struct MyVec3Type final : Vec3DBase<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }

  /**
   * @brief True when all three components are finite (no NaN/inf)
   */
  [[nodiscard]] bool isFinite() const
  {
    return this->allFinite();
  }

  /**
   * @brief True when the squared norm is below the given tolerance
   */
  [[nodiscard]] bool isNearlyZero(double tolerance = 1e-15) const
  {
    return this->squaredNorm() < tolerance;
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace scol_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // SCOL_SIM_VEC3D_BASE_HPP
