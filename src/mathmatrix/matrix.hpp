#ifndef MATHMATRIX_MATRIX_HPP
#define MATHMATRIX_MATRIX_HPP

#include <omp.h>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "StoragePolicy.hpp"
#include "determinant.hpp"
#include "library_config.hpp"
#include "matrix_error.hpp"
#include "types.hpp"

namespace mathmatrix {

namespace detail {
// Runs body(0) .. body(count - 1). Iterations must be independent and must
// not throw; large loops are shared across an OpenMP team.
template <typename F>
void for_each_index(size_t count, F&& body) {
  if constexpr (OPENMP_ENABLED) {
    const bool parallel = count >= PARALLEL_THRESHOLD && !omp_in_parallel();
#pragma omp parallel for num_threads(ThreadCount) if (parallel)
    for (size_t idx = 0; idx < count; ++idx) {
      body(idx);
    }
  } else {
    for (size_t idx = 0; idx < count; ++idx) {
      body(idx);
    }
  }
}
}  // namespace detail

// ==================== Matrix Class ====================
// Dense row-major matrix. Public coordinates are 1-based: (1, 1) is the top
// left element. Copies are deep.
template <Arithmetic T, typename StoragePolicy = InMemoryStorage<T>>
class Matrix {
 private:
  std::shared_ptr<StorageInterface<T>> storage_;
  Order order_;

  Matrix(std::vector<T> items, Order order)
      : storage_(std::make_shared<StoragePolicy>(std::move(items), order.rows,
                                                 order.cols)),
        order_(order) {}

  bool in_range(size_t i, size_t j) const noexcept {
    return i != 0 && i <= order_.rows && j != 0 && j <= order_.cols;
  }

  template <typename BinaryOp>
  Matrix zip_with(const Matrix& rhs, BinaryOp op) const {
    std::vector<T> items(size());
    const T* a = storage_->data();
    const T* b = rhs.storage_->data();
    detail::for_each_index(items.size(),
                           [&](size_t idx) { items[idx] = op(a[idx], b[idx]); });
    return Matrix(std::move(items), order_);
  }

 public:
  using value_type = T;

  // ===== Constructors =====

  // Default constructor - empty matrix
  Matrix() : storage_(std::make_shared<StoragePolicy>(0, 0)), order_{} {}

  // Size constructor with optional initial value
  Matrix(size_t rows, size_t cols, T init_val = T{})
      : storage_(std::make_shared<StoragePolicy>(rows, cols, init_val)),
        order_{rows, cols} {}

  // Nested initializer list, one inner list per row. Ragged rows throw.
  Matrix(std::initializer_list<std::initializer_list<T>> init) {
    const size_t rows = init.size();
    const size_t cols = rows == 0 ? 0 : init.begin()->size();

    std::vector<T> items;
    items.reserve(rows * cols);
    for (const auto& row : init) {
      if (row.size() != cols)
        throw MatrixException(ErrorCode::INAPPROPRIATE_NUMBER_OF_ITEMS,
                              "Rows of an initializer list differ in length");
      items.insert(items.end(), row.begin(), row.end());
    }

    storage_ = std::make_shared<StoragePolicy>(std::move(items), rows, cols);
    order_ = {rows, cols};
  }

  // Copy constructor (deep copy)
  Matrix(const Matrix& other)
      : storage_(other.storage_->clone()), order_(other.order_) {}

  Matrix(Matrix&& other) noexcept = default;

  Matrix& operator=(const Matrix& other) {
    if (this != &other) {
      storage_ = other.storage_->clone();
      order_ = other.order_;
    }
    return *this;
  }

  Matrix& operator=(Matrix&& other) noexcept = default;

  // ===== Static Factory Methods =====

  // Fails with INAPPROPRIATE_NUMBER_OF_ITEMS unless items.size() equals
  // rows * cols
  static Result<Matrix> from_vector(std::vector<T> items, Order order) {
    if (items.size() != order.rows * order.cols)
      return fail<Result<Matrix>>(ErrorCode::INAPPROPRIATE_NUMBER_OF_ITEMS);
    return Matrix(std::move(items), order);
  }

  // f is called with 1-based (i, j), row by row
  static Matrix generate(const std::function<T(size_t, size_t)>& f,
                         Order order) {
    std::vector<T> items;
    items.reserve(order.rows * order.cols);
    for (size_t i = 1; i <= order.rows; ++i)
      for (size_t j = 1; j <= order.cols; ++j)
        items.push_back(f(i, j));
    return Matrix(std::move(items), order);
  }

  static Matrix row_matrix(std::vector<T> items) {
    const size_t n = items.size();
    return Matrix(std::move(items), Order{1, n});
  }

  static Matrix column_matrix(std::vector<T> items) {
    const size_t n = items.size();
    return Matrix(std::move(items), Order{n, 1});
  }

  static Matrix null_matrix(Order order) {
    return Matrix(order.rows, order.cols, T{0});
  }

  // Arranges the items in a square; the count must be a perfect square
  static Result<Matrix> square_matrix(std::vector<T> items) {
    const auto size = detail::exact_sqrt(items.size());
    if (!size)
      return fail<Result<Matrix>>(ErrorCode::INAPPROPRIATE_NUMBER_OF_ITEMS);
    return Matrix(std::move(items), Order{*size, *size});
  }

  static Matrix diagonal_matrix(const std::vector<T>& items) {
    return generate(
        [&items](size_t i, size_t j) { return i == j ? items[i - 1] : T{0}; },
        Order{items.size(), items.size()});
  }

  static Matrix scalar_matrix(T item, size_t size) {
    return generate([item](size_t i, size_t j) { return i == j ? item : T{0}; },
                    Order{size, size});
  }

  static Matrix identity_matrix(size_t size) {
    return scalar_matrix(T{1}, size);
  }

  // ===== Size Information =====
  Order order() const noexcept { return order_; }
  size_t rows() const noexcept { return order_.rows; }
  size_t cols() const noexcept { return order_.cols; }
  size_t size() const noexcept { return order_.rows * order_.cols; }

  bool empty() const noexcept { return order_.rows == 0 || order_.cols == 0; }
  bool is_square() const noexcept { return order_.rows == order_.cols; }
  bool is_horizontal() const noexcept { return order_.cols > order_.rows; }
  bool is_vertical() const noexcept { return order_.rows > order_.cols; }

  // ===== Element Access =====

  T& operator()(size_t i, size_t j) {
    assert(in_range(i, j) && "Matrix index out of bounds");
    return storage_->get(i - 1, j - 1);
  }

  const T& operator()(size_t i, size_t j) const {
    assert(in_range(i, j) && "Matrix index out of bounds");
    return storage_->get(i - 1, j - 1);
  }

  Result<T> get(size_t i, size_t j) const {
    if (!in_range(i, j))
      return fail<Result<T>>(ErrorCode::INDEX_OUT_OF_RANGE);
    return storage_->get(i - 1, j - 1);
  }

  Result<void> set(size_t i, size_t j, T value) {
    if (!in_range(i, j))
      return fail<Result<void>>(ErrorCode::INDEX_OUT_OF_RANGE);
    storage_->get(i - 1, j - 1) = value;
    return {};
  }

  Result<std::vector<T>> get_row(size_t i) const {
    if (i == 0 || i > order_.rows)
      return fail<Result<std::vector<T>>>(ErrorCode::INDEX_OUT_OF_RANGE);

    std::vector<T> row;
    row.reserve(order_.cols);
    for (size_t j = 0; j < order_.cols; ++j)
      row.push_back(storage_->get(i - 1, j));
    return row;
  }

  Result<std::vector<T>> get_column(size_t j) const {
    if (j == 0 || j > order_.cols)
      return fail<Result<std::vector<T>>>(ErrorCode::INDEX_OUT_OF_RANGE);

    std::vector<T> column;
    column.reserve(order_.rows);
    for (size_t i = 0; i < order_.rows; ++i)
      column.push_back(storage_->get(i, j - 1));
    return column;
  }

  // Convert to std::vector (flattened, row-major)
  std::vector<T> to_vector() const { return storage_->values(); }

  // ===== Elementwise Functions =====

  Matrix map(const std::function<T(T)>& func) const {
    std::vector<T> items(size());
    const T* src = storage_->data();
    detail::for_each_index(items.size(),
                           [&](size_t idx) { items[idx] = func(src[idx]); });
    return Matrix(std::move(items), order_);
  }

  Matrix& apply(const std::function<T(T)>& func) {
    T* dst = storage_->data();
    detail::for_each_index(size(),
                           [&](size_t idx) { dst[idx] = func(dst[idx]); });
    return *this;
  }

  // ===== Derivations =====

  // Diagonal items, top left to bottom right
  Result<std::vector<T>> trace() const {
    if (!is_square())
      return fail<Result<std::vector<T>>>(
          ErrorCode::TRACE_EXISTS_ONLY_FOR_SQUARE_MATRICES);

    std::vector<T> diagonal;
    diagonal.reserve(order_.rows);
    for (size_t i = 0; i < order_.rows; ++i)
      diagonal.push_back(storage_->get(i, i));
    return diagonal;
  }

  Matrix transpose() const {
    return generate([this](size_t i, size_t j) { return (*this)(j, i); },
                    Order{order_.cols, order_.rows});
  }

  // Snapshot of the current values; later changes to this matrix are not
  // seen by the returned determinant. Returns Result<Determinant<T>>.
  auto to_determinant() const
    requires SignedArithmetic<T>
  {
    if (!is_square())
      return fail<Result<Determinant<T>>>(
          ErrorCode::INCORRECT_ORDERS_FOR_OPERATION);
    return Determinant<T>::create(storage_->values());
  }

  Result<T> determinant() const
    requires SignedArithmetic<T>
  {
    auto det = to_determinant();
    if (!det)
      return det.error();
    return det.value().value();
  }

  // Transpose of the matrix of cofactors
  Result<Matrix> adjoint() const
    requires SignedArithmetic<T>
  {
    auto det = to_determinant();
    if (!det)
      return det.error();

    const Determinant<T>& snapshot = det.value();
    return generate(
               [&snapshot](size_t i, size_t j) {
                 return snapshot.cofactor(i, j).value();
               },
               order_)
        .transpose();
  }

  Result<Matrix> inverse() const
    requires FloatingPoint<T>
  {
    auto det = to_determinant();
    if (!det)
      return det.error();

    const T value = det.value().value();
    if constexpr (CHECK_SINGULAR) {
      if (value == T{0})
        return fail<Result<Matrix>>(ErrorCode::SINGULAR_MATRIX);
    }

    auto adj = adjoint();
    if (!adj)
      return adj.error();
    return adj.value() / value;
  }

  Matrix round() const
    requires FloatingPoint<T>
  {
    return map([](T x) { return std::round(x); });
  }

  void round_mut()
    requires FloatingPoint<T>
  {
    apply([](T x) { return std::round(x); });
  }

  // ===== Arithmetic =====

  Result<Matrix> operator+(const Matrix& rhs) const {
    if (order_ != rhs.order_)
      return fail<Result<Matrix>>(ErrorCode::INCORRECT_ORDERS_FOR_OPERATION);
    return zip_with(rhs, std::plus<T>{});
  }

  Result<Matrix> operator-(const Matrix& rhs) const {
    if (order_ != rhs.order_)
      return fail<Result<Matrix>>(ErrorCode::INCORRECT_ORDERS_FOR_OPERATION);
    return zip_with(rhs, std::minus<T>{});
  }

  Result<Matrix> operator*(const Matrix& rhs) const {
    if (order_.cols != rhs.order_.rows)
      return fail<Result<Matrix>>(ErrorCode::INCORRECT_ORDERS_FOR_OPERATION);

    const size_t inner = order_.cols;
    const Order out{order_.rows, rhs.order_.cols};
    std::vector<T> items(out.rows * out.cols);
    const StorageInterface<T>& a = *storage_;
    const StorageInterface<T>& b = *rhs.storage_;

    detail::for_each_index(items.size(), [&](size_t idx) {
      const size_t i = idx / out.cols;
      const size_t j = idx % out.cols;
      T sum{0};
      for (size_t r = 0; r < inner; ++r)
        sum += a.get(i, r) * b.get(r, j);
      items[idx] = sum;
    });
    return Matrix(std::move(items), out);
  }

  Matrix operator*(const T& scalar) const {
    return map([scalar](T x) { return x * scalar; });
  }

  // No zero check: floating-point division by zero yields inf/NaN
  Matrix operator/(const T& scalar) const {
    return map([scalar](T x) { return x / scalar; });
  }

  // The receiver is left untouched when the orders do not match
  Result<Matrix&> operator+=(const Matrix& rhs) {
    auto sum = *this + rhs;
    if (!sum)
      return sum.error();
    *this = std::move(sum).value();
    return *this;
  }

  Result<Matrix&> operator-=(const Matrix& rhs) {
    auto difference = *this - rhs;
    if (!difference)
      return difference.error();
    *this = std::move(difference).value();
    return *this;
  }

  Result<Matrix&> operator*=(const Matrix& rhs) {
    auto product = *this * rhs;
    if (!product)
      return product.error();
    *this = std::move(product).value();
    return *this;
  }

  Matrix& operator*=(const T& scalar) {
    return apply([scalar](T x) { return x * scalar; });
  }

  Matrix& operator/=(const T& scalar) {
    return apply([scalar](T x) { return x / scalar; });
  }

  bool operator==(const Matrix& rhs) const {
    if (order_ != rhs.order_)
      return false;
    return std::equal(storage_->data(), storage_->data() + size(),
                      rhs.storage_->data());
  }

  bool operator!=(const Matrix& rhs) const { return !(*this == rhs); }

  //end of class
};

// ==================== Free Functions ====================

// Items are left aligned and padded to the widest item, one row per line
template <Arithmetic T, typename StoragePolicy>
std::ostream& operator<<(std::ostream& os, const Matrix<T, StoragePolicy>& m) {
  std::vector<std::string> cells;
  cells.reserve(m.size());
  size_t width = 0;
  for (const T& item : m.to_vector()) {
    std::ostringstream cell;
    cell << item;
    cells.push_back(cell.str());
    width = std::max(width, cells.back().size());
  }

  for (size_t idx = 0; idx < cells.size(); ++idx) {
    os << cells[idx] << std::string(width - cells[idx].size(), ' ') << "  ";
    if ((idx + 1) % m.cols() == 0)
      os << "\n";
  }
  return os;
}

// Scalar multiplication (scalar on left side)
template <Arithmetic T, typename StoragePolicy>
Matrix<T, StoragePolicy> operator*(const T& scalar,
                                   const Matrix<T, StoragePolicy>& m) {
  return m * scalar;
}

}  // namespace mathmatrix
#endif  // MATHMATRIX_MATRIX_HPP
