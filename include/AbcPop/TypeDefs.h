#ifndef ABCPOP_TYPEDEFS_H
#define ABCPOP_TYPEDEFS_H

#include <concepts>
#include <limits>
#include <vector>
#include <Eigen/Dense>

typedef double float_type;

// Eigen containers for particle tables: rows are particles, columns are parameters
typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;

template <typename T>
concept NumericType = std::integral<T> or std::floating_point<T>;

namespace ABCPOP {
    // used wherever "no limit" is meaningful (e.g. max_eval)
    inline constexpr size_t UNLIMITED = std::numeric_limits<size_t>::max();
}

#endif // ABCPOP_TYPEDEFS_H
