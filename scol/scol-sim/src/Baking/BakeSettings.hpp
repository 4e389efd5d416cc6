// Ticket: 0001_spline_sampling_core
// Ticket: 0005_bake_settings_validation

#ifndef SCOL_SIM_BAKING_BAKE_SETTINGS_HPP
#define SCOL_SIM_BAKING_BAKE_SETTINGS_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace scol_sim
{

/**
 * @brief Collision volume used for every baked segment
 */
enum class SegmentShape : uint8_t
{
  Capsule,
  Box
};

/**
 * @brief How the number of segments is derived before post-processing
 */
enum class SamplingMode : uint8_t
{
  Distance,  // ceil(curve length / segment spacing)
  Count      // fixed segment count
};

/**
 * @brief Optional refinement passes applied to the sampled points
 */
enum class PostProcess : uint8_t
{
  None = 0,
  MergeShallowBends = 1 << 0,
  SubdivideSharpBends = 1 << 1
};

constexpr PostProcess operator|(PostProcess a, PostProcess b)
{
  return static_cast<PostProcess>(static_cast<uint8_t>(a) |
                                  static_cast<uint8_t>(b));
}

constexpr PostProcess operator&(PostProcess a, PostProcess b)
{
  return static_cast<PostProcess>(static_cast<uint8_t>(a) &
                                  static_cast<uint8_t>(b));
}

constexpr bool hasFlag(PostProcess set, PostProcess flag)
{
  return (set & flag) == flag && flag != PostProcess::None;
}

[[nodiscard]] std::string_view toString(SegmentShape shape);
[[nodiscard]] std::string_view toString(SamplingMode mode);

/**
 * @brief User-tunable bake configuration
 *
 * Owned by the host and read by SegmentBaker on every bake. Values are not
 * validated on assignment; clamped() produces the copy that is actually used,
 * so out-of-range input is corrected silently (with a warning log) instead of
 * failing the bake.
 *
 * Defaults match a freshly added collider component.
 */
struct BakeSettings
{
  SegmentShape shape{SegmentShape::Capsule};
  SamplingMode samplingMode{SamplingMode::Distance};
  PostProcess postProcess{PostProcess::None};
  bool isTrigger{false};

  int segmentCount{20};         // Count mode only
  double segmentSpacing{2.0};   // Distance mode only [m]
  double radius{0.5};           // Capsule radius / half box width [m]

  double minBendAngleDegrees{5.0};  // Merge/subdivide threshold [deg]
  int maxSubdivisionDepth{1};       // Subdivide span cutoff exponent

  static constexpr int kMinSegmentCount{1};
  static constexpr double kMinSegmentSpacing{0.2};
  static constexpr double kMinRadius{std::numeric_limits<double>::min()};
  static constexpr double kMinBendAngleDegrees{0.5};
  static constexpr double kMaxBendAngleDegrees{179.0};
  static constexpr int kMinSubdivisionDepth{1};
  static constexpr int kMaxSubdivisionDepth{5};

  // Thresholds for the density advisory
  static constexpr double kDenseSpacing{0.5};
  static constexpr int kDenseSegmentCount{50};

  /**
   * @brief Copy of these settings with every value clamped to its valid range
   *
   * segmentCount >= 1, segmentSpacing >= 0.2, radius > 0,
   * minBendAngleDegrees in [0.5, 179], maxSubdivisionDepth in [1, 5].
   * Non-finite values map to the lower bound. Each adjusted field is
   * reported with spdlog::warn.
   */
  [[nodiscard]] BakeSettings clamped() const;

  /**
   * @brief Advisory when the settings are likely to produce many volumes
   *
   * Only raised when no post-processing is enabled: Distance mode with a
   * spacing below 0.5, or Count mode with 50 or more segments.
   *
   * @return Message text, or std::nullopt when the settings look reasonable
   */
  [[nodiscard]] std::optional<std::string> densityWarning() const;

  [[nodiscard]] bool hasPostProcess(PostProcess flag) const
  {
    return hasFlag(postProcess, flag);
  }

  bool operator==(const BakeSettings&) const = default;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_BAKING_BAKE_SETTINGS_HPP
