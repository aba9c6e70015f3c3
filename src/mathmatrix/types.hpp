#ifndef MATHMATRIX_TYPES_HPP
#define MATHMATRIX_TYPES_HPP
#include <concepts>
#include <cstddef>
#include <type_traits>
namespace mathmatrix {
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

// Element types whose cofactors can carry a sign; excludes bool and unsigned
template <typename T>
concept SignedArithmetic = Arithmetic<T> && std::is_signed_v<T>;

// Element types that division and rounding are defined for
template <typename T>
concept FloatingPoint = Arithmetic<T> && std::floating_point<T>;

// Shape of a matrix: (rows, columns)
struct Order {
  size_t rows = 0;
  size_t cols = 0;

  bool operator==(const Order&) const = default;
};

// Forward declarations
template <SignedArithmetic T>
class Determinant;

template <Arithmetic T, typename StoragePolicy>
class Matrix;
}  // namespace mathmatrix
#endif
