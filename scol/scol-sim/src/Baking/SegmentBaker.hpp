// Ticket: 0003_segment_emission

#ifndef SCOL_SIM_BAKING_SEGMENT_BAKER_HPP
#define SCOL_SIM_BAKING_SEGMENT_BAKER_HPP

#include <cstddef>
#include <vector>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/Baking/SamplePoint.hpp"
#include "scol-sim/src/Baking/SegmentDescriptor.hpp"
#include "scol-sim/src/Physics/VolumeHost.hpp"
#include "scol-sim/src/Spline/Curve.hpp"

namespace scol_sim
{

/**
 * @brief A segment descriptor together with the volume created for it
 */
struct BakedSegment
{
  SegmentDescriptor descriptor;
  VolumeHandle handle{kInvalidVolumeHandle};
};

/**
 * @brief Owns the baked set: the volumes created along a curve by one bake
 *
 * bake() always clears the previous generation first, so the host never
 * sees volumes from two bakes at once. Every handle obtained from the host
 * is returned through destroyVolume() on clear(), on the next bake() or on
 * destruction.
 *
 * The host must outlive the baker.
 *
 * Thread safety: Not thread-safe
 */
class SegmentBaker
{
public:
  explicit SegmentBaker(VolumeHost& host);

  ~SegmentBaker();

  /**
   * @brief Replace the baked set with a fresh one for the curve
   *
   * Settings are clamped before use. Consecutive sample pairs that coincide
   * produce no volume.
   *
   * @return The new baked set in curve order
   */
  const std::vector<BakedSegment>& bake(const Curve& curve,
                                        const BakeSettings& settings);

  /**
   * @brief Destroy every baked volume; safe to call repeatedly
   */
  void clear();

  /**
   * @brief Pure sampling + segment emission, without touching the host
   */
  [[nodiscard]] static std::vector<SegmentDescriptor> buildSegments(
    const std::vector<SamplePoint>& points,
    const BakeSettings& settings);

  [[nodiscard]] bool hasBakedSegments() const;
  [[nodiscard]] bool ownsVolume(VolumeHandle handle) const;
  [[nodiscard]] size_t getSegmentCount() const;

  [[nodiscard]] const std::vector<BakedSegment>& getSegments() const;

  /**
   * @brief Sample points that produced the current baked set
   */
  [[nodiscard]] const std::vector<SamplePoint>& getSamplePoints() const;

  /**
   * @brief Clamped settings used by the most recent bake
   */
  [[nodiscard]] const BakeSettings& getEffectiveSettings() const;

  /**
   * @brief Arc length of the curve at the most recent bake [m]
   */
  [[nodiscard]] double getCurveLength() const;

  SegmentBaker(const SegmentBaker&) = delete;
  SegmentBaker& operator=(const SegmentBaker&) = delete;
  SegmentBaker(SegmentBaker&&) = delete;
  SegmentBaker& operator=(SegmentBaker&&) = delete;

private:
  VolumeHost& host_;
  std::vector<SamplePoint> samplePoints_;
  std::vector<BakedSegment> segments_;
  BakeSettings effectiveSettings_;
  double curveLength_{0.0};
};

}  // namespace scol_sim

#endif  // SCOL_SIM_BAKING_SEGMENT_BAKER_HPP
