#ifndef SCOL_TRANSFER_COORDINATE_RECORD_HPP
#define SCOL_TRANSFER_COORDINATE_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace scol_transfer
{

/**
 * @brief Database record for a world-space position [m]
 *
 * Used for segment midpoints and contact points. NaN marks "not set", e.g.
 * the point of a trigger event.
 */
struct CoordinateRecord : public cpp_sqlite::BaseTransferObject
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

BOOST_DESCRIBE_STRUCT(CoordinateRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (x, y, z));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_COORDINATE_RECORD_HPP
