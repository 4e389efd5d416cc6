// Ticket: 0001_spline_sampling_core
// Quaternion wrapper used for segment orientations

#ifndef SCOL_SIM_QUATERNION_HPP
#define SCOL_SIM_QUATERNION_HPP

#include <Eigen/Geometry>
#include <utility>

#include "scol-sim/src/DataTypes/Vector3D.hpp"

namespace scol_sim
{

/**
 * @brief Unit quaternion orientation
 *
 * Wraps Eigen::Quaterniond via composition (Eigen::Quaterniond is not a
 * matrix type, so the Vec3DBase inheritance trick does not apply).
 *
 * Uses Eigen/Hamilton convention: q = w + xi + yj + zk
 */
struct QuaternionD final
{
  QuaternionD() : quat_{Eigen::Quaterniond::Identity()}
  {
  }

  QuaternionD(double w, double x, double y, double z) : quat_{w, x, y, z}
  {
  }

  explicit QuaternionD(Eigen::Quaterniond quat) : quat_{std::move(quat)}
  {
  }

  /**
   * @brief Shortest-arc rotation taking direction @p from onto @p to
   *
   * Neither input needs to be normalized. If either vector is (nearly) zero
   * the rotation is undefined and identity is returned instead, so the
   * result is always a finite unit quaternion.
   *
   * Antiparallel inputs are handled by Eigen (a 180 degree rotation about
   * an arbitrary perpendicular axis).
   */
  static QuaternionD fromTo(const Vector3D& from, const Vector3D& to)
  {
    if (from.isNearlyZero() || to.isNearlyZero())
    {
      return QuaternionD{};
    }
    return QuaternionD{
      Eigen::Quaterniond::FromTwoVectors(from.normalized(), to.normalized())};
  }

  [[nodiscard]] double w() const
  {
    return quat_.w();
  }
  [[nodiscard]] double x() const
  {
    return quat_.x();
  }
  [[nodiscard]] double y() const
  {
    return quat_.y();
  }
  [[nodiscard]] double z() const
  {
    return quat_.z();
  }

  [[nodiscard]] Vector3D rotate(const Vector3D& v) const
  {
    return Vector3D{quat_ * static_cast<const Eigen::Vector3d&>(v)};
  }

  [[nodiscard]] QuaternionD inverse() const
  {
    return QuaternionD{quat_.conjugate()};
  }

  [[nodiscard]] double norm() const
  {
    return quat_.norm();
  }

  [[nodiscard]] bool isFinite() const
  {
    return quat_.coeffs().allFinite();
  }

  QuaternionD(const QuaternionD&) = default;
  QuaternionD(QuaternionD&&) noexcept = default;
  QuaternionD& operator=(const QuaternionD&) = default;
  QuaternionD& operator=(QuaternionD&&) noexcept = default;
  ~QuaternionD() = default;

private:
  Eigen::Quaterniond quat_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_QUATERNION_HPP
