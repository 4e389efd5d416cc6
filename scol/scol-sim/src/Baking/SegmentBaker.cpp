// Ticket: 0003_segment_emission

#include "scol-sim/src/Baking/SegmentBaker.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "scol-sim/src/Baking/SplineSampler.hpp"

namespace scol_sim
{

SegmentBaker::SegmentBaker(VolumeHost& host) : host_{host}
{
}

SegmentBaker::~SegmentBaker()
{
  clear();
}

const std::vector<BakedSegment>& SegmentBaker::bake(
  const Curve& curve,
  const BakeSettings& settings)
{
  clear();

  BakeSettings const effective = settings.clamped();
  if (auto warning = effective.densityWarning())
  {
    spdlog::warn("SegmentBaker: {}", *warning);
  }

  SplineSampler const sampler{curve};
  std::vector<SamplePoint> points = sampler.sample(effective);
  std::vector<SegmentDescriptor> descriptors =
    buildSegments(points, effective);

  segments_.reserve(descriptors.size());
  for (auto& descriptor : descriptors)
  {
    VolumeHandle const handle = host_.createVolume(descriptor);
    segments_.push_back(BakedSegment{std::move(descriptor), handle});
  }
  samplePoints_ = std::move(points);
  effectiveSettings_ = effective;
  curveLength_ = curve.length();

  size_t const pairCount =
    samplePoints_.empty() ? 0 : samplePoints_.size() - 1;
  spdlog::debug(
    "SegmentBaker: baked {} {} segments from {} samples ({} zero-length "
    "pairs skipped){}",
    segments_.size(),
    toString(effective.shape),
    samplePoints_.size(),
    pairCount - segments_.size(),
    effective.isTrigger ? " (trigger)" : "");

  return segments_;
}

void SegmentBaker::clear()
{
  if (segments_.empty() && samplePoints_.empty())
  {
    return;
  }

  for (const auto& segment : segments_)
  {
    host_.destroyVolume(segment.handle);
  }

  spdlog::debug("SegmentBaker: cleared {} segments", segments_.size());
  segments_.clear();
  samplePoints_.clear();
}

std::vector<SegmentDescriptor> SegmentBaker::buildSegments(
  const std::vector<SamplePoint>& points,
  const BakeSettings& settings)
{
  std::vector<SegmentDescriptor> descriptors;
  if (points.size() < 2)
  {
    return descriptors;
  }

  descriptors.reserve(points.size() - 1);
  for (size_t i = 0; i + 1 < points.size(); ++i)
  {
    auto descriptor = SegmentDescriptor::fromEndpoints(
      points[i].position, points[i + 1].position, settings);
    if (descriptor)
    {
      descriptors.push_back(*descriptor);
    }
  }
  return descriptors;
}

bool SegmentBaker::hasBakedSegments() const
{
  return !segments_.empty();
}

bool SegmentBaker::ownsVolume(VolumeHandle handle) const
{
  return std::any_of(segments_.begin(),
                     segments_.end(),
                     [handle](const BakedSegment& segment)
                     { return segment.handle == handle; });
}

size_t SegmentBaker::getSegmentCount() const
{
  return segments_.size();
}

const std::vector<BakedSegment>& SegmentBaker::getSegments() const
{
  return segments_;
}

const std::vector<SamplePoint>& SegmentBaker::getSamplePoints() const
{
  return samplePoints_;
}

const BakeSettings& SegmentBaker::getEffectiveSettings() const
{
  return effectiveSettings_;
}

double SegmentBaker::getCurveLength() const
{
  return curveLength_;
}

}  // namespace scol_sim
