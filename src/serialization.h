#ifndef MIRAGE_SERIALIZATION_H
#define MIRAGE_SERIALIZATION_H

#include <Eigen/Dense>

#include <cstdint>
#include <istream>
#include <ostream>

namespace Mirage {

// Raw little-endian-as-host binary helpers for agent blobs. Each returns false on stream failure
// or implausible sizes.
bool write_u32(std::ostream& out, uint32_t value);
bool read_u32(std::istream& in, uint32_t& value);
bool write_eigen_matrix(std::ostream& out, const Eigen::MatrixXf& matrix);
bool read_eigen_matrix(std::istream& in, Eigen::MatrixXf& matrix);
bool write_eigen_vector(std::ostream& out, const Eigen::VectorXf& vector);
bool read_eigen_vector(std::istream& in, Eigen::VectorXf& vector);

} // namespace Mirage

#endif
