#ifndef MATHMATRIX_STORAGE_POLICY_HPP
#define MATHMATRIX_STORAGE_POLICY_HPP
#include <memory>
#include <utility>
#include <vector>
#include "types.hpp"

namespace mathmatrix {

// ==================== Storage Policies ====================
// Base storage interface. Indices are 0-based; the 1-based public
// coordinates are translated by Matrix.
template <Arithmetic T>
class StorageInterface {
 public:
  virtual ~StorageInterface() = default;

  virtual T& get(size_t row, size_t col) = 0;
  virtual const T& get(size_t row, size_t col) const = 0;

  virtual T* data() noexcept = 0;
  virtual const T* data() const noexcept = 0;

  // Flat row-major copy of every element
  virtual std::vector<T> values() const = 0;

  virtual std::shared_ptr<StorageInterface<T>> clone() const = 0;
};

// Contiguous in-memory storage (row-major), element (r, c) at r * cols + c
template <Arithmetic T>
class InMemoryStorage : public StorageInterface<T> {
 private:
  std::vector<T> data_;
  size_t cols_;

 public:
  InMemoryStorage(size_t rows, size_t cols, T init_val = T{})
      : data_(rows * cols, init_val), cols_(cols) {}

  // Takes ownership of an already row-major buffer of rows * cols items
  InMemoryStorage(std::vector<T> values, size_t rows, size_t cols)
      : data_(std::move(values)), cols_(cols) {
    data_.resize(rows * cols);
  }

  InMemoryStorage(const InMemoryStorage& other) = default;

  T& get(size_t row, size_t col) override { return data_[row * cols_ + col]; }

  const T& get(size_t row, size_t col) const override {
    return data_[row * cols_ + col];
  }

  T* data() noexcept override { return data_.data(); }
  const T* data() const noexcept override { return data_.data(); }

  std::vector<T> values() const override { return data_; }

  std::shared_ptr<StorageInterface<T>> clone() const override {
    return std::make_shared<InMemoryStorage<T>>(*this);
  }
};

}  // namespace mathmatrix
#endif
