#include "serialization.h"

namespace Mirage {

namespace {

// Upper bounds on any stored dimension and element count; guard resize() against corrupt blobs.
constexpr uint64_t kMaxStoredDim = 1u << 20;
constexpr uint64_t kMaxStoredElements = 1u << 24;

bool write_u64(std::ostream& out, uint64_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    return static_cast<bool>(out);
}

bool read_u64(std::istream& in, uint64_t& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

} // namespace

bool write_u32(std::ostream& out, uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    return static_cast<bool>(out);
}

bool read_u32(std::istream& in, uint32_t& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

bool write_eigen_matrix(std::ostream& out, const Eigen::MatrixXf& matrix) {
    if (!write_u64(out, static_cast<uint64_t>(matrix.rows()))) return false;
    if (!write_u64(out, static_cast<uint64_t>(matrix.cols()))) return false;
    if (matrix.size() > 0) {
        out.write(reinterpret_cast<const char*>(matrix.data()), matrix.size() * sizeof(float));
    }
    return static_cast<bool>(out);
}

bool read_eigen_matrix(std::istream& in, Eigen::MatrixXf& matrix) {
    uint64_t rows = 0;
    uint64_t cols = 0;
    if (!read_u64(in, rows) || !read_u64(in, cols)) return false;
    if (rows > kMaxStoredDim || cols > kMaxStoredDim || rows * cols > kMaxStoredElements) return false;
    matrix.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    if (matrix.size() > 0) {
        in.read(reinterpret_cast<char*>(matrix.data()), matrix.size() * sizeof(float));
    }
    return static_cast<bool>(in);
}

bool write_eigen_vector(std::ostream& out, const Eigen::VectorXf& vector) {
    if (!write_u64(out, static_cast<uint64_t>(vector.size()))) return false;
    if (vector.size() > 0) {
        out.write(reinterpret_cast<const char*>(vector.data()), vector.size() * sizeof(float));
    }
    return static_cast<bool>(out);
}

bool read_eigen_vector(std::istream& in, Eigen::VectorXf& vector) {
    uint64_t size = 0;
    if (!read_u64(in, size)) return false;
    if (size > kMaxStoredDim) return false;
    vector.resize(static_cast<Eigen::Index>(size));
    if (vector.size() > 0) {
        in.read(reinterpret_cast<char*>(vector.data()), vector.size() * sizeof(float));
    }
    return static_cast<bool>(in);
}

} // namespace Mirage
