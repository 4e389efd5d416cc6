// Ticket: 0001_spline_sampling_core

#ifndef SCOL_SIM_BAKING_SAMPLE_POINT_HPP
#define SCOL_SIM_BAKING_SAMPLE_POINT_HPP

#include "scol-sim/src/DataTypes/Coordinate.hpp"

namespace scol_sim
{

/**
 * @brief One evaluated point on the curve
 *
 * Sequences of sample points are kept in strictly increasing t. They live only
 * for the duration of one bake and are rebuilt from scratch on the next.
 */
struct SamplePoint
{
  double t{0.0};        // Normalized curve parameter [0, 1]
  Coordinate position;  // World-space position at t [m]
};

}  // namespace scol_sim

#endif  // SCOL_SIM_BAKING_SAMPLE_POINT_HPP
