// Ticket: 0001_spline_sampling_core

#include "scol-sim/src/Spline/PolylineCurve.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace scol_sim
{

PolylineCurve::PolylineCurve(std::vector<Coordinate> points)
  : points_{std::move(points)}
{
  if (points_.size() < 2)
  {
    throw std::invalid_argument(
      "PolylineCurve requires at least two points");
  }

  cumulativeLength_.reserve(points_.size());
  cumulativeLength_.push_back(0.0);
  for (size_t i = 1; i < points_.size(); ++i)
  {
    double const step = (points_[i] - points_[i - 1]).norm();
    cumulativeLength_.push_back(cumulativeLength_.back() + step);
  }
}

Coordinate PolylineCurve::position(double t) const
{
  double const total = cumulativeLength_.back();
  if (total <= 0.0)
  {
    return points_.front();
  }

  double const target = std::clamp(t, 0.0, 1.0) * total;

  // First cumulative length strictly greater than the target marks the end
  // of the span containing it
  auto upper = std::upper_bound(
    cumulativeLength_.begin(), cumulativeLength_.end(), target);
  if (upper == cumulativeLength_.end())
  {
    return points_.back();
  }

  auto const endIdx =
    static_cast<size_t>(std::distance(cumulativeLength_.begin(), upper));
  size_t const startIdx = endIdx - 1;

  double const spanLength =
    cumulativeLength_[endIdx] - cumulativeLength_[startIdx];
  double const u = (target - cumulativeLength_[startIdx]) / spanLength;

  return Coordinate{points_[startIdx] +
                    u * (points_[endIdx] - points_[startIdx])};
}

double PolylineCurve::length() const
{
  return cumulativeLength_.back();
}

}  // namespace scol_sim
