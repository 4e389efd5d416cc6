// Ticket: 0001_spline_sampling_core
// Ticket: 0002_bend_post_processing

#ifndef SCOL_SIM_BAKING_SPLINE_SAMPLER_HPP
#define SCOL_SIM_BAKING_SPLINE_SAMPLER_HPP

#include <vector>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/Baking/SamplePoint.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Environment/Angle.hpp"
#include "scol-sim/src/Spline/Curve.hpp"

namespace scol_sim
{

/**
 * @brief Turns a continuous curve into an ordered list of sample points
 *
 * The sampling pipeline runs in four phases:
 * 1. Segment count resolution (fixed count, or ceil(length / spacing))
 * 2. Uniform sampling at t = i / n for i in [0, n]
 * 3. Optional merge pass removing interior points on shallow bends
 * 4. Optional subdivide pass inserting midpoints on sharp bends
 *
 * Each phase is exposed separately so it can be tested in isolation;
 * sample() runs the whole pipeline for a settings object.
 *
 * The sampler holds a non-owning reference to the curve, which must outlive
 * it.
 *
 * Thread safety: Read-only after construction (thread-safe)
 */
class SplineSampler
{
public:
  explicit SplineSampler(const Curve& curve);

  /**
   * @brief Resolve the pre-post-processing segment count
   *
   * Count mode returns settings.segmentCount. Distance mode returns
   * ceil(curveLength / segmentSpacing), so a length that is an exact multiple
   * of the spacing yields the exact quotient. The result is never below 1,
   * which also covers zero-length curves.
   *
   * @param curveLength Total arc length of the curve [m]
   * @param settings Clamped bake settings
   */
  [[nodiscard]] static int computeSegmentCount(double curveLength,
                                               const BakeSettings& settings);

  /**
   * @brief Sample n + 1 points at t = i / n
   * @param segmentCount n, must be >= 1
   */
  [[nodiscard]] std::vector<SamplePoint> sampleUniform(int segmentCount) const;

  /**
   * @brief Remove interior points whose bend is at or below the threshold
   *
   * Single left-to-right sweep. When a point is removed the index is held,
   * so the point that slid into its slot is tested against its new
   * neighbours before the sweep advances. This can cascade several removals
   * at one index, but the sweep never restarts from the beginning.
   *
   * Endpoints are never removed.
   */
  static void mergeShallowBends(std::vector<SamplePoint>& points,
                                double minBendAngleDegrees);

  /**
   * @brief Insert curve midpoints where consecutive samples bend sharply
   *
   * Pairs whose t-span is already at most (1 / segmentCount) / 2^maxDepth
   * are skipped. For wider pairs the curve is evaluated at the midpoint t;
   * if the bend at that midpoint exceeds the threshold it is inserted. The
   * scan then moves on to the pair starting at the inserted point, so a
   * sharp region keeps splitting until the span cutoff is reached.
   */
  void subdivideSharpBends(std::vector<SamplePoint>& points,
                           int segmentCount,
                           int maxSubdivisionDepth,
                           double minBendAngleDegrees) const;

  /**
   * @brief Run the full sampling pipeline
   * @param settings Bake settings; expected to be clamped already
   */
  [[nodiscard]] std::vector<SamplePoint> sample(
    const BakeSettings& settings) const;

  /**
   * @brief Bend angle at a vertex between two neighbours
   *
   * 180 degrees minus the angle between (previous - vertex) and
   * (next - vertex): 0 for a straight line, 180 for a full reversal.
   * A vertex coinciding with a neighbour reports a bend of 180 degrees.
   */
  [[nodiscard]] static Angle bendAngle(const Coordinate& previous,
                                       const Coordinate& vertex,
                                       const Coordinate& next);

  SplineSampler(const SplineSampler&) = default;
  SplineSampler(SplineSampler&&) noexcept = default;
  SplineSampler& operator=(const SplineSampler&) = delete;
  SplineSampler& operator=(SplineSampler&&) noexcept = delete;
  ~SplineSampler() = default;

private:
  const Curve& curve_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_BAKING_SPLINE_SAMPLER_HPP
