// Ticket: 0006_bezier_spline_source

#include "scol-sim/src/Spline/BezierSpline.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace scol_sim
{

BezierSpline::BezierSpline(std::vector<Coordinate> controlPoints)
  : controlPoints_{std::move(controlPoints)}
{
  if (controlPoints_.size() < 4 || (controlPoints_.size() - 1) % 3 != 0)
  {
    throw std::invalid_argument(
      "BezierSpline requires 3k + 1 control points (k >= 1), got " +
      std::to_string(controlPoints_.size()));
  }

  for (size_t piece = 0; piece < getPieceCount(); ++piece)
  {
    Coordinate previous = evaluatePiece(piece, 0.0);
    for (size_t step = 1; step <= kChordSamplesPerPiece; ++step)
    {
      double const u =
        static_cast<double>(step) / static_cast<double>(kChordSamplesPerPiece);
      Coordinate const current = evaluatePiece(piece, u);
      length_ += (current - previous).norm();
      previous = current;
    }
  }
}

Coordinate BezierSpline::position(double t) const
{
  size_t const pieces = getPieceCount();
  double const scaled = std::clamp(t, 0.0, 1.0) * static_cast<double>(pieces);

  // t == 1 belongs to the last piece at u == 1
  auto piece = static_cast<size_t>(std::floor(scaled));
  piece = std::min(piece, pieces - 1);

  double const u = scaled - static_cast<double>(piece);
  return evaluatePiece(piece, u);
}

double BezierSpline::length() const
{
  return length_;
}

size_t BezierSpline::getPieceCount() const
{
  return (controlPoints_.size() - 1) / 3;
}

Coordinate BezierSpline::evaluatePiece(size_t piece, double u) const
{
  const Coordinate& p0 = controlPoints_[3 * piece];
  const Coordinate& p1 = controlPoints_[3 * piece + 1];
  const Coordinate& p2 = controlPoints_[3 * piece + 2];
  const Coordinate& p3 = controlPoints_[3 * piece + 3];

  // Bernstein form
  double const v = 1.0 - u;
  double const b0 = v * v * v;
  double const b1 = 3.0 * v * v * u;
  double const b2 = 3.0 * v * u * u;
  double const b3 = u * u * u;

  return Coordinate{b0 * p0 + b1 * p1 + b2 * p2 + b3 * p3};
}

}  // namespace scol_sim
