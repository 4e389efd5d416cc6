// Ticket: 0005_bake_settings_validation

#include "scol-sim/src/Baking/BakeSettings.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace scol_sim
{

namespace
{

double clampField(const char* name, double value, double lo, double hi)
{
  double const result = std::isfinite(value) ? std::clamp(value, lo, hi) : lo;
  if (result != value)
  {
    spdlog::warn("BakeSettings: {} = {} clamped to {}", name, value, result);
  }
  return result;
}

int clampField(const char* name, int value, int lo, int hi)
{
  int const result = std::clamp(value, lo, hi);
  if (result != value)
  {
    spdlog::warn("BakeSettings: {} = {} clamped to {}", name, value, result);
  }
  return result;
}

}  // namespace

std::string_view toString(SegmentShape shape)
{
  switch (shape)
  {
    case SegmentShape::Capsule:
      return "Capsule";
    case SegmentShape::Box:
      return "Box";
  }
  return "Unknown";
}

std::string_view toString(SamplingMode mode)
{
  switch (mode)
  {
    case SamplingMode::Distance:
      return "Distance";
    case SamplingMode::Count:
      return "Count";
  }
  return "Unknown";
}

BakeSettings BakeSettings::clamped() const
{
  BakeSettings result = *this;

  result.segmentCount = clampField("segmentCount",
                                   segmentCount,
                                   kMinSegmentCount,
                                   std::numeric_limits<int>::max());
  result.segmentSpacing = clampField("segmentSpacing",
                                     segmentSpacing,
                                     kMinSegmentSpacing,
                                     std::numeric_limits<double>::max());
  result.radius = clampField(
    "radius", radius, kMinRadius, std::numeric_limits<double>::max());
  result.minBendAngleDegrees = clampField("minBendAngleDegrees",
                                          minBendAngleDegrees,
                                          kMinBendAngleDegrees,
                                          kMaxBendAngleDegrees);
  result.maxSubdivisionDepth = clampField("maxSubdivisionDepth",
                                          maxSubdivisionDepth,
                                          kMinSubdivisionDepth,
                                          kMaxSubdivisionDepth);

  return result;
}

std::optional<std::string> BakeSettings::densityWarning() const
{
  if (postProcess != PostProcess::None)
  {
    return std::nullopt;
  }

  constexpr const char* kTryPostProcessing = " Try post-processing instead.";

  if (samplingMode == SamplingMode::Distance && segmentSpacing < kDenseSpacing)
  {
    return std::string{"Small distance may create many colliders."} +
           kTryPostProcessing;
  }
  if (samplingMode == SamplingMode::Count &&
      segmentCount >= kDenseSegmentCount)
  {
    return std::string{"High segments count may create many colliders."} +
           kTryPostProcessing;
  }
  return std::nullopt;
}

}  // namespace scol_sim
