#ifndef MATHMATRIX_MATRIX_ERROR_HPP
#define MATHMATRIX_MATRIX_ERROR_HPP

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include "library_config.hpp"

namespace mathmatrix {

// ==============================================
// Core Error Types
// ==============================================

enum class ErrorCode {
  INAPPROPRIATE_NUMBER_OF_ITEMS,          // Item count does not fit the order
  TRACE_EXISTS_ONLY_FOR_SQUARE_MATRICES,  // Trace of a non-square matrix
  INCORRECT_ORDERS_FOR_OPERATION,         // Orders not conformable
  INDEX_OUT_OF_RANGE,                     // 1-based coordinate outside bounds
  SINGULAR_MATRIX                         // Inverse of a zero determinant
};

inline std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::INAPPROPRIATE_NUMBER_OF_ITEMS:
      return "Inappropriate number of items";
    case ErrorCode::TRACE_EXISTS_ONLY_FOR_SQUARE_MATRICES:
      return "Trace exists only for square matrices";
    case ErrorCode::INCORRECT_ORDERS_FOR_OPERATION:
      return "Incorrect orders of matrices for algebraic operations";
    case ErrorCode::INDEX_OUT_OF_RANGE:
      return "Index out of range";
    case ErrorCode::SINGULAR_MATRIX:
      return "Matrix is singular (determinant is zero)";
  }
  return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << to_string(code);
}

class MatrixException : public std::runtime_error {
 public:
  struct Context {
    std::source_location location;
    std::chrono::system_clock::time_point timestamp;
  };

  MatrixException(ErrorCode code, std::string msg, Context ctx)
      : runtime_error(format_msg(msg, code, ctx)),
        m_code(code),
        m_ctx(std::move(ctx)) {}

  MatrixException(
      ErrorCode code, std::string msg,
      std::source_location loc = std::source_location::current())
      : MatrixException(code, std::move(msg),
                        Context{loc, std::chrono::system_clock::now()}) {}

  ErrorCode code() const noexcept { return m_code; }
  const Context& context() const noexcept { return m_ctx; }

 private:
  static std::string format_msg(const std::string& msg, ErrorCode code,
                                const Context& ctx) {
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << ": " << msg << " ("
        << to_string(code) << ")\n"
        << "Location: " << ctx.location.file_name() << ":"
        << ctx.location.line() << "\n"
        << "Function: " << ctx.location.function_name();
    return oss.str();
  }

  ErrorCode m_code;
  Context m_ctx;
};

// ==============================================
// Result Type
// ==============================================

template <typename T>
class Result {
 private:
  std::variant<T, ErrorCode> m_data;

 public:
  Result(T value) : m_data(std::move(value)) {}
  Result(ErrorCode code) : m_data(code) {}

  bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
  bool is_err() const noexcept {
    return std::holds_alternative<ErrorCode>(m_data);
  }

  T& value() & {
    if (!is_ok())
      throw MatrixException(std::get<ErrorCode>(m_data),
                            "Attempt to access value of failed result");
    return std::get<T>(m_data);
  }

  const T& value() const& {
    if (!is_ok())
      throw MatrixException(std::get<ErrorCode>(m_data),
                            "Attempt to access value of failed result");
    return std::get<T>(m_data);
  }

  T&& value() && {
    if (!is_ok())
      throw MatrixException(std::get<ErrorCode>(m_data),
                            "Attempt to access value of failed result");
    return std::get<T>(std::move(m_data));
  }

  ErrorCode error() const noexcept {
    return is_err() ? std::get<ErrorCode>(m_data) : ErrorCode{};
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return is_ok() ? std::get<T>(m_data)
                   : static_cast<T>(std::forward<U>(default_value));
  }

  explicit operator bool() const noexcept { return is_ok(); }

  std::optional<std::string> error_message() const {
    return is_err() ? std::make_optional(std::string(to_string(error())))
                    : std::nullopt;
  }
};

template <typename U>
class Result<U&> {
 public:
  Result(U& value) : m_data(std::ref(value)) {}
  Result(ErrorCode code) : m_data(code) {}

  bool is_ok() const noexcept {
    return std::holds_alternative<std::reference_wrapper<U>>(m_data);
  }
  bool is_err() const noexcept {
    return std::holds_alternative<ErrorCode>(m_data);
  }

  U& value() const {
    if (!is_ok())
      throw MatrixException(std::get<ErrorCode>(m_data),
                            "Attempt to access reference of failed result");
    return std::get<std::reference_wrapper<U>>(m_data).get();
  }

  ErrorCode error() const noexcept {
    return is_err() ? std::get<ErrorCode>(m_data) : ErrorCode{};
  }

  explicit operator bool() const noexcept { return is_ok(); }

 private:
  std::variant<std::reference_wrapper<U>, ErrorCode> m_data;
};

template <>
class Result<void> {
 public:
  Result() = default;
  Result(ErrorCode code) : m_error(code) {}

  bool is_ok() const noexcept { return !m_error.has_value(); }
  bool is_err() const noexcept { return m_error.has_value(); }

  // Throws when the operation failed
  void value() const {
    if (m_error)
      throw MatrixException(*m_error, "Operation failed");
  }

  ErrorCode error() const noexcept { return m_error.value_or(ErrorCode{}); }

  explicit operator bool() const noexcept { return is_ok(); }

  std::optional<std::string> error_message() const {
    return m_error ? std::make_optional(std::string(to_string(*m_error)))
                   : std::nullopt;
  }

 private:
  std::optional<ErrorCode> m_error;
};

// ==============================================
// Error Handling System
// ==============================================

namespace error {

enum class Mode {
  RETURN_CODE,  // Return error results and log them
  SILENT,       // Return error results without logging
  THROW         // Throw MatrixException at the failure site
};

using Handler = std::function<void(ErrorCode, std::string_view)>;

namespace impl {
struct ThreadState {
  Mode mode = Mode::RETURN_CODE;
  Handler handler;
};

inline ThreadState& thread_state() {
  thread_local ThreadState state;
  return state;
}
}  // namespace impl

inline Mode mode() noexcept {
  return impl::thread_state().mode;
}

inline void set_mode(Mode m) noexcept {
  impl::thread_state().mode = m;
}

// A handler replaces the default logging/throwing for the calling thread.
// Pass an empty function to restore the default.
inline void set_handler(Handler handler) {
  impl::thread_state().handler = std::move(handler);
}

// RAII mode control
class ScopedMode {
 public:
  explicit ScopedMode(Mode m) : m_prev(mode()) { set_mode(m); }
  ~ScopedMode() { set_mode(m_prev); }

  ScopedMode(const ScopedMode&) = delete;
  ScopedMode& operator=(const ScopedMode&) = delete;

 private:
  Mode m_prev;
};

}  // namespace error

// ==============================================
// Implementation Details
// ==============================================

namespace detail {

[[noreturn]] inline void throw_error(ErrorCode code, std::string_view msg,
                                     const std::source_location& loc) {
  throw MatrixException(
      code, std::string(msg),
      MatrixException::Context{loc, std::chrono::system_clock::now()});
}

inline void log_error(ErrorCode code, const std::source_location& loc) {
  if constexpr (LOG_ERRORS) {
    std::cerr << "mathmatrix: error " << static_cast<int>(code) << ": "
              << to_string(code) << " (" << loc.file_name() << ":"
              << loc.line() << ")" << std::endl;
  }
}

inline void report(ErrorCode code, const std::source_location& loc) {
  auto& state = error::impl::thread_state();

  if (state.handler) {
    state.handler(code, to_string(code));
    return;
  }

  switch (state.mode) {
    case error::Mode::THROW:
      throw_error(code, to_string(code), loc);
    case error::Mode::RETURN_CODE:
      log_error(code, loc);
      return;
    case error::Mode::SILENT:
      return;
  }
}

}  // namespace detail

// Reports a failure according to the thread's error mode and returns it as R
template <typename R>
R fail(ErrorCode code,
       const std::source_location& loc = std::source_location::current()) {
  detail::report(code, loc);
  return R(code);
}

}  // namespace mathmatrix
#endif  // MATHMATRIX_MATRIX_ERROR_HPP
