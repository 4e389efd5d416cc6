#ifndef SCOL_TRANSFER_VECTOR3D_RECORD_HPP
#define SCOL_TRANSFER_VECTOR3D_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace scol_transfer
{

/**
 * @brief Database record for a direction (contact normals, box sizes)
 */
struct Vector3DRecord : public cpp_sqlite::BaseTransferObject
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

BOOST_DESCRIBE_STRUCT(Vector3DRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (x, y, z));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_VECTOR3D_RECORD_HPP
