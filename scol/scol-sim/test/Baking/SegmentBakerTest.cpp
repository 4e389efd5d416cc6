// Ticket: 0003_segment_emission

#include <gtest/gtest.h>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/Baking/SegmentBaker.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Spline/PolylineCurve.hpp"
#include "scol-sim/test/Helpers/RecordingVolumeHost.hpp"

using namespace scol_sim;
using scol_sim::test::RecordingVolumeHost;

namespace
{

PolylineCurve createStraightLine(double length)
{
  return PolylineCurve{{Coordinate{0, 0, 0}, Coordinate{length, 0, 0}}};
}

BakeSettings countSettings(int count)
{
  BakeSettings settings;
  settings.samplingMode = SamplingMode::Count;
  settings.segmentCount = count;
  return settings;
}

}  // namespace

// ============================================================================
// Bake
// ============================================================================

TEST(SegmentBakerTest, CountModeCreatesOneVolumePerSegment)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(5.0);

  auto const& segments = baker.bake(curve, countSettings(5));

  EXPECT_EQ(segments.size(), 5u);
  EXPECT_EQ(host.liveCount(), 5u);
  EXPECT_TRUE(baker.hasBakedSegments());
  EXPECT_EQ(baker.getSamplePoints().size(), 6u);
}

TEST(SegmentBakerTest, StraightLineWithMergeBakesSingleSegment)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(8.0);

  BakeSettings settings = countSettings(4);
  settings.postProcess = PostProcess::MergeShallowBends;
  settings.minBendAngleDegrees = 10.0;

  auto const& segments = baker.bake(curve, settings);

  ASSERT_EQ(segments.size(), 1u);
  EXPECT_DOUBLE_EQ(segments[0].descriptor.length, 8.0);
  EXPECT_EQ(host.liveCount(), 1u);
}

TEST(SegmentBakerTest, SegmentsAreContiguousAndInCurveOrder)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve{
    {Coordinate{0, 0, 0}, Coordinate{3, 0, 0}, Coordinate{3, 3, 0}}};

  auto const& segments = baker.bake(curve, countSettings(6));

  ASSERT_EQ(segments.size(), 6u);
  for (size_t i = 1; i < segments.size(); ++i)
  {
    Coordinate const& previousEnd = segments[i - 1].descriptor.end;
    Coordinate const& start = segments[i].descriptor.start;
    EXPECT_NEAR((previousEnd - start).norm(), 0.0, 1e-12);
  }
}

TEST(SegmentBakerTest, SettingsAreClampedBeforeUse)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(1.0);

  BakeSettings settings;
  settings.segmentSpacing = 0.01;  // clamps to 0.2
  settings.radius = -3.0;

  auto const& segments = baker.bake(curve, settings);

  EXPECT_EQ(segments.size(), 5u);
  EXPECT_GT(segments.front().descriptor.radius, 0.0);
  EXPECT_DOUBLE_EQ(baker.getEffectiveSettings().segmentSpacing, 0.2);
  EXPECT_DOUBLE_EQ(baker.getCurveLength(), 1.0);
}

TEST(SegmentBakerTest, ZeroLengthCurveCreatesNoVolumes)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve{{Coordinate{1, 1, 1}, Coordinate{1, 1, 1}}};

  auto const& segments = baker.bake(curve, BakeSettings{});

  EXPECT_TRUE(segments.empty());
  EXPECT_FALSE(baker.hasBakedSegments());
  EXPECT_EQ(host.liveCount(), 0u);
}

// ============================================================================
// Clear / Re-bake
// ============================================================================

TEST(SegmentBakerTest, RebakeReleasesPreviousGeneration)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(4.0);

  baker.bake(curve, countSettings(4));
  std::vector<VolumeHandle> firstHandles;
  for (const auto& segment : baker.getSegments())
  {
    firstHandles.push_back(segment.handle);
  }

  baker.bake(curve, countSettings(2));

  EXPECT_EQ(host.liveCount(), 2u);
  EXPECT_EQ(host.destroyed().size(), 4u);
  for (VolumeHandle handle : firstHandles)
  {
    EXPECT_FALSE(host.isLive(handle));
    EXPECT_FALSE(baker.ownsVolume(handle));
  }
  EXPECT_EQ(host.invalidDestroyCount(), 0u);
}

TEST(SegmentBakerTest, ClearIsIdempotent)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(3.0);

  baker.bake(curve, countSettings(3));
  baker.clear();
  baker.clear();

  EXPECT_FALSE(baker.hasBakedSegments());
  EXPECT_TRUE(baker.getSamplePoints().empty());
  EXPECT_EQ(host.liveCount(), 0u);
  EXPECT_EQ(host.destroyed().size(), 3u);
  EXPECT_EQ(host.invalidDestroyCount(), 0u);
}

TEST(SegmentBakerTest, DestructorReleasesVolumes)
{
  RecordingVolumeHost host;
  {
    SegmentBaker baker{host};
    PolylineCurve const curve = createStraightLine(3.0);
    baker.bake(curve, countSettings(3));
    EXPECT_EQ(host.liveCount(), 3u);
  }
  EXPECT_EQ(host.liveCount(), 0u);
}

TEST(SegmentBakerTest, OwnsOnlyItsOwnHandles)
{
  RecordingVolumeHost host;
  SegmentBaker baker{host};
  PolylineCurve const curve = createStraightLine(2.0);

  auto const& segments = baker.bake(curve, countSettings(2));

  EXPECT_TRUE(baker.ownsVolume(segments[0].handle));
  EXPECT_FALSE(baker.ownsVolume(kInvalidVolumeHandle));
  EXPECT_FALSE(baker.ownsVolume(9999));
}

// ============================================================================
// Pure Segment Emission
// ============================================================================

TEST(SegmentBakerTest, BuildSegmentsSkipsCoincidentPairs)
{
  std::vector<SamplePoint> const points{{0.0, Coordinate{0, 0, 0}},
                                        {0.5, Coordinate{1, 0, 0}},
                                        {0.75, Coordinate{1, 0, 0}},
                                        {1.0, Coordinate{2, 0, 0}}};

  auto descriptors = SegmentBaker::buildSegments(points, BakeSettings{});
  EXPECT_EQ(descriptors.size(), 2u);
}
