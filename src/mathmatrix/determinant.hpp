#ifndef MATHMATRIX_DETERMINANT_HPP
#define MATHMATRIX_DETERMINANT_HPP

#include <cmath>
#include <optional>
#include <utility>
#include <vector>
#include "matrix_error.hpp"
#include "types.hpp"

namespace mathmatrix {

namespace detail {
// Side length of a square holding n items, if n is a perfect square
inline std::optional<size_t> exact_sqrt(size_t n) {
  auto root = static_cast<size_t>(std::sqrt(static_cast<double>(n)));
  while (root * root > n)
    --root;
  while ((root + 1) * (root + 1) <= n)
    ++root;
  if (root * root != n)
    return std::nullopt;
  return root;
}
}  // namespace detail

// ==================== Determinant ====================
// Immutable snapshot of a square grid in row-major order. The value is
// computed by Laplace expansion along the first column, rows taken in
// increasing order, so the floating-point summation order is fixed.
//
// Minors are never materialised: a minor is described by the ordered sets of
// surviving row and column indices into the snapshot.
template <SignedArithmetic T>
class Determinant {
 private:
  using IndexSet = std::vector<size_t>;

  std::vector<T> items_;
  size_t size_;

  Determinant(std::vector<T> items, size_t size)
      : items_(std::move(items)), size_(size) {}

  const T& at(size_t row, size_t col) const { return items_[row * size_ + col]; }

  IndexSet all_indices() const {
    IndexSet indices(size_);
    for (size_t i = 0; i < size_; ++i)
      indices[i] = i;
    return indices;
  }

  static IndexSet without(const IndexSet& indices, size_t position) {
    IndexSet result;
    result.reserve(indices.size() - 1);
    for (size_t k = 0; k < indices.size(); ++k) {
      if (k != position)
        result.push_back(indices[k]);
    }
    return result;
  }

  T expand(const IndexSet& rows, const IndexSet& cols) const {
    const size_t n = rows.size();

    // An empty grid counts as 0 here; minor_value() returns 1 for the empty
    // minor of a 1x1 grid without reaching this branch
    if (n == 0)
      return T{0};

    if (n == 1)
      return at(rows[0], cols[0]);

    if (n == 2) {
      return at(rows[0], cols[0]) * at(rows[1], cols[1]) -
             at(rows[0], cols[1]) * at(rows[1], cols[0]);
    }

    const IndexSet minor_cols = without(cols, 0);
    T value{0};
    for (size_t k = 0; k < n; ++k) {
      const T item = at(rows[k], cols[0]);
      const T minor = expand(without(rows, k), minor_cols);
      if (k % 2 == 0) {
        value += minor * item;
      } else {
        value -= minor * item;
      }
    }
    return value;
  }

  bool in_range(size_t i, size_t j) const noexcept {
    return i != 0 && i <= size_ && j != 0 && j <= size_;
  }

  // Determinant of the grid left after deleting row i and column j (1-based)
  T minor_value(size_t i, size_t j) const {
    // The empty minor of a 1x1 grid counts as 1, so that adj([a]) == [1]
    if (size_ == 1)
      return T{1};
    return expand(without(all_indices(), i - 1), without(all_indices(), j - 1));
  }

 public:
  using value_type = T;

  // Fails with INAPPROPRIATE_NUMBER_OF_ITEMS unless the count is a perfect
  // square
  static Result<Determinant> create(std::vector<T> items) {
    const auto size = detail::exact_sqrt(items.size());
    if (!size)
      return fail<Result<Determinant>>(ErrorCode::INAPPROPRIATE_NUMBER_OF_ITEMS);
    return Determinant(std::move(items), *size);
  }

  size_t size() const noexcept { return size_; }

  const std::vector<T>& items() const noexcept { return items_; }

  T value() const {
    const IndexSet indices = all_indices();
    return expand(indices, indices);
  }

  // Unsigned minor at 1-based (i, j)
  Result<T> minor_determinant(size_t i, size_t j) const {
    if (!in_range(i, j))
      return fail<Result<T>>(ErrorCode::INDEX_OUT_OF_RANGE);
    return minor_value(i, j);
  }

  // Signed minor at 1-based (i, j); the sign is (-1)^i * (-1)^j
  Result<T> cofactor(size_t i, size_t j) const {
    if (!in_range(i, j))
      return fail<Result<T>>(ErrorCode::INDEX_OUT_OF_RANGE);

    const T value = minor_value(i, j);
    const bool negative = (i % 2 == 0) != (j % 2 == 0);
    return negative ? static_cast<T>(-value) : value;
  }
};

}  // namespace mathmatrix
#endif  // MATHMATRIX_DETERMINANT_HPP
