#ifndef MATHMATRIX_LIBRARY_CONFIG_HPP
#define MATHMATRIX_LIBRARY_CONFIG_HPP

#include <cstddef>

// Every switch can be overridden on the compiler command line.
#ifndef MATHMATRIX_OPENMP_ENABLED
#define MATHMATRIX_OPENMP_ENABLED true
#endif

#ifndef MATHMATRIX_THREAD_COUNT
#define MATHMATRIX_THREAD_COUNT 2
#endif

// Elementwise loops below this many elements stay on the calling thread
#ifndef MATHMATRIX_PARALLEL_THRESHOLD
#define MATHMATRIX_PARALLEL_THRESHOLD 4096
#endif

#ifndef MATHMATRIX_LOG_ERRORS
#define MATHMATRIX_LOG_ERRORS true
#endif

// When false, inverse() of a singular matrix divides by zero and yields
// inf/NaN entries instead of failing with SINGULAR_MATRIX.
#ifndef MATHMATRIX_CHECK_SINGULAR
#define MATHMATRIX_CHECK_SINGULAR true
#endif

namespace mathmatrix {
static constexpr bool OPENMP_ENABLED = MATHMATRIX_OPENMP_ENABLED;
static constexpr size_t ThreadCount = MATHMATRIX_THREAD_COUNT;
static constexpr size_t PARALLEL_THRESHOLD = MATHMATRIX_PARALLEL_THRESHOLD;
static constexpr bool LOG_ERRORS = MATHMATRIX_LOG_ERRORS;
static constexpr bool CHECK_SINGULAR = MATHMATRIX_CHECK_SINGULAR;
}  // namespace mathmatrix

#endif  // MATHMATRIX_LIBRARY_CONFIG_HPP
