// Ticket: 0001_spline_sampling_core
// Ticket: 0002_bend_post_processing

#include "scol-sim/src/Baking/SplineSampler.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

#include <spdlog/spdlog.h>

namespace scol_sim
{

SplineSampler::SplineSampler(const Curve& curve) : curve_{curve}
{
}

int SplineSampler::computeSegmentCount(double curveLength,
                                       const BakeSettings& settings)
{
  if (settings.samplingMode == SamplingMode::Count)
  {
    return std::max(settings.segmentCount, BakeSettings::kMinSegmentCount);
  }

  if (!std::isfinite(curveLength) || curveLength <= 0.0)
  {
    return BakeSettings::kMinSegmentCount;
  }

  double const quotient =
    std::ceil(curveLength / std::max(settings.segmentSpacing,
                                     BakeSettings::kMinSegmentSpacing));

  // Guard the int conversion for absurdly long curves
  double const capped =
    std::min(quotient, static_cast<double>(std::numeric_limits<int>::max()));
  return std::max(static_cast<int>(capped), BakeSettings::kMinSegmentCount);
}

std::vector<SamplePoint> SplineSampler::sampleUniform(int segmentCount) const
{
  int const n = std::max(segmentCount, 1);

  std::vector<SamplePoint> points;
  points.reserve(static_cast<size_t>(n) + 1);
  for (int i = 0; i <= n; ++i)
  {
    double const t = static_cast<double>(i) / static_cast<double>(n);
    points.push_back(SamplePoint{t, curve_.position(t)});
  }
  return points;
}

void SplineSampler::mergeShallowBends(std::vector<SamplePoint>& points,
                                      double minBendAngleDegrees)
{
  size_t i = 1;
  while (i + 1 < points.size())
  {
    Angle const bend = bendAngle(
      points[i - 1].position, points[i].position, points[i + 1].position);

    if (bend.toDeg() <= minBendAngleDegrees)
    {
      // Hold i: the next point now sits here and gets tested against the
      // same predecessor
      points.erase(points.begin() + static_cast<std::ptrdiff_t>(i));
    }
    else
    {
      ++i;
    }
  }
}

void SplineSampler::subdivideSharpBends(std::vector<SamplePoint>& points,
                                        int segmentCount,
                                        int maxSubdivisionDepth,
                                        double minBendAngleDegrees) const
{
  double const baseSpan = 1.0 / static_cast<double>(std::max(segmentCount, 1));
  double const maxSplitSpan =
    baseSpan / std::pow(2.0, static_cast<double>(maxSubdivisionDepth));

  for (size_t i = 0; i + 1 < points.size(); ++i)
  {
    double const startT = points[i].t;
    double const endT = points[i + 1].t;
    if (endT - startT <= maxSplitSpan)
    {
      continue;
    }

    double const midT = 0.5 * (startT + endT);
    Coordinate const midPosition = curve_.position(midT);

    Angle const bend =
      bendAngle(points[i].position, midPosition, points[i + 1].position);
    if (bend.toDeg() > minBendAngleDegrees)
    {
      points.insert(points.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                    SamplePoint{midT, midPosition});
    }
  }
}

std::vector<SamplePoint> SplineSampler::sample(
  const BakeSettings& settings) const
{
  double const curveLength = curve_.length();
  int const segmentCount = computeSegmentCount(curveLength, settings);

  std::vector<SamplePoint> points = sampleUniform(segmentCount);
  size_t const uniformCount = points.size();

  if (settings.hasPostProcess(PostProcess::MergeShallowBends))
  {
    mergeShallowBends(points, settings.minBendAngleDegrees);
  }

  if (settings.hasPostProcess(PostProcess::SubdivideSharpBends))
  {
    // Span cutoff is based on the original n, not the post-merge count
    subdivideSharpBends(points,
                        segmentCount,
                        settings.maxSubdivisionDepth,
                        settings.minBendAngleDegrees);
  }

  spdlog::debug(
    "SplineSampler: length {:.3f} m, n = {}, {} uniform samples -> {} after "
    "post-processing",
    curveLength,
    segmentCount,
    uniformCount,
    points.size());

  return points;
}

Angle SplineSampler::bendAngle(const Coordinate& previous,
                               const Coordinate& vertex,
                               const Coordinate& next)
{
  Vector3D const toPrevious = previous - vertex;
  Vector3D const toNext = next - vertex;
  return Angle::fromDegrees(180.0 - Angle::between(toPrevious, toNext).toDeg());
}

}  // namespace scol_sim
