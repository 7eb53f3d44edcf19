// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

//===---------------------------------------------------------------------===//
/// @file
/// Assert macros for internal invariants of the expansion library.
///
/// - for simple binary comparisons like `WAVE_assert(x < y)` the failure
///   message contains the stringified condition and the runtime values of
///   `x` and `y`;
///
/// - `WAVE_assertv(cond, fmt, args...)` appends an `llvm::formatv()`
///   formatted message;
///
/// - `WAVE_debug*` variants are elided unless the build defines
///   WAVE_BUILD_DEBUG (i.e. a `Debug` CMAKE_BUILD_TYPE).
///
/// User-facing failures (bad constraints, malformed declarations) are not
/// asserts: they are returned as `llvm::Error`.
///
/// @see test/unittests/Support/DeathTestAsserts.cpp for usage examples
//===---------------------------------------------------------------------===//

#ifndef WAVE_ASSERTS_H
#define WAVE_ASSERTS_H

#include "llvm/ADT/STLForwardCompat.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <string>
#include <type_traits>
#include <utility>

namespace wave::utils::asserts {

#if !defined(WAVE_ASSERT_DISABLE_ASSERTS)
#if defined(NDEBUG)
#define WAVE_ASSERT_DISABLE_ASSERTS
#endif // NDEBUG
#endif // WAVE_ASSERT_DISABLE_ASSERTS

#if !defined(WAVE_ASSERT_ENABLE_DEBUG_ASSERTS)
#if defined(WAVE_BUILD_DEBUG)
#define WAVE_ASSERT_ENABLE_DEBUG_ASSERTS
#endif // WAVE_BUILD_DEBUG
#endif // WAVE_ASSERT_ENABLE_DEBUG_ASSERTS

// Action taken after the failure message has been reported.
#if !defined(WAVE_ASSERT_FAILURE)
#define WAVE_ASSERT_FAILURE() ::std::abort()
#endif // WAVE_ASSERT_FAILURE

#if !defined(WAVE_ASSERT_REPORT_STREAM)
#define WAVE_ASSERT_REPORT_STREAM() ::llvm::errs()
#endif // WAVE_ASSERT_REPORT_STREAM

//===---------------------------------------------------------------------===//
namespace impl {

// clang-format off

#define WAVE_IMPL_ASSERT_LOC_INFO       __FILE__,__LINE__,__PRETTY_FUNCTION__

#define WAVE_ASSERT_UNLIKELY(condition) __builtin_expect(static_cast<bool>(condition), 0)

// clang-format on

template <typename T>
struct always_false : std::false_type {};

template <typename T>
constexpr bool always_false_v = always_false<T>::value;

template <typename T, typename Stream, typename = void>
struct is_streamable : std::false_type {};

template <typename T, typename Stream>
struct is_streamable<
    T, Stream,
    std::void_t<decltype(std::declval<Stream &>() << std::declval<T>())>>
    : std::true_type {};

template <typename T, typename Stream>
constexpr bool is_streamable_v = is_streamable<T, Stream>::value;

template <typename T, typename Stream>
void print(Stream &os, const T &obj) {
  if constexpr (std::is_null_pointer_v<T>) {
    os << "nullptr";
  } else {
    os << obj;
  }
}

enum class BinaryOp { eq, ne, lt, le, gt, ge };

static inline constexpr const char *kBinaryOpName[]{"==", "!=", "<",
                                                    "<=", ">",  ">="};

template <typename Stream>
void reportPrefix(Stream &os, const char *file, int line, const char *func,
                  const char *condition) {
  os << file << ':' << line << ": " << func << ": Assertion `" << condition
     << "` failed";
}

// NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
template <typename LHS, typename RHS, BinaryOp Op>
struct BinaryExpr {
  LHS lhs;
  RHS rhs;

  template <typename Stream>
  void report(Stream &os, const char *file, int line, const char *func,
              const char *condition, const std::string &message = {}) const {
    reportPrefix(os, file, line, func, condition);
    if constexpr (is_streamable_v<LHS, Stream> &&
                  is_streamable_v<RHS, Stream>) {
      os << ", was `";
      print(os, lhs);
      os << ' ' << kBinaryOpName[llvm::to_underlying(Op)] << ' ';
      print(os, rhs);
      os << '`';
    }
    if (!message.empty()) {
      os << ", " << message;
    }
    os << '\n';
  }
};

template <typename LHS>
struct ExprLHS {
  explicit constexpr ExprLHS(LHS lhs) : lhs{lhs} {}

  // clang-format off
#define WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(op, bop)                            \
  template <typename RHS>                                                      \
  constexpr friend auto operator op(ExprLHS &&exprLHS, const RHS &rhs)         \
      -> BinaryExpr<LHS, const RHS &, BinaryOp::bop> {                         \
    return {exprLHS.lhs, rhs};                                                 \
  }

  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(==, eq)
  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(!=, ne)
  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(<, lt)
  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(<=, le)
  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(>, gt)
  WAVE_IMPL_ASSERT_BINARY_OP_HANDLER(>=, ge)

#undef WAVE_IMPL_ASSERT_BINARY_OP_HANDLER
  // clang-format on

  template <typename Stream>
  void report(Stream &os, const char *file, int line, const char *func,
              const char *condition, const std::string &message = {}) const {
    reportPrefix(os, file, line, func, condition);
    if (!message.empty()) {
      os << ", " << message;
    }
    os << '\n';
  }

  LHS lhs;
};
// NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)

struct ExprDecomposer {
  template <typename T>
  constexpr friend auto operator<=(ExprDecomposer &&,
                                   const T &lhs) -> ExprLHS<const T &> {
    return ExprLHS<const T &>{lhs};
  }
};

} // namespace impl

//===---------------------------------------------------------------------===//
// WAVE_assert*.
//===---------------------------------------------------------------------===//

// clang-format off
#if !defined(WAVE_ASSERT_DISABLE_ASSERTS)

# define WAVE_assert(condition)                                                \
    do {                                                                       \
      if (WAVE_ASSERT_UNLIKELY(!(condition))) {                                \
        (::wave::utils::asserts::impl::ExprDecomposer { } <= condition )       \
          .report(WAVE_ASSERT_REPORT_STREAM(), WAVE_IMPL_ASSERT_LOC_INFO, #condition); \
        WAVE_ASSERT_FAILURE();                                                 \
      }                                                                        \
    } while (false)                                                            \
    /* */

# define WAVE_assertv(condition, /* message[, args...] */...)                  \
    do {                                                                       \
      if (WAVE_ASSERT_UNLIKELY(!(condition))) {                                \
        (::wave::utils::asserts::impl::ExprDecomposer { } <= condition )       \
          .report(WAVE_ASSERT_REPORT_STREAM(), WAVE_IMPL_ASSERT_LOC_INFO, #condition, \
                  llvm::formatv(__VA_ARGS__).str());                           \
        WAVE_ASSERT_FAILURE();                                                 \
      }                                                                        \
    } while (false)                                                            \
    /* */

// 0 <= x < limit
# define WAVE_assert_limit(x, limit) \
    WAVE_assertv(((x) >= 0 && (x) < (limit)), "{0} is not in [0, {1})", x, limit)

#else // WAVE_ASSERT_DISABLE_ASSERTS

# define WAVE_assert(condition)                             ((void)0)
# define WAVE_assertv(condition, /* message[, args] */...)  ((void)0)
# define WAVE_assert_limit(x, limit)                        ((void)0)

#endif // WAVE_ASSERT_DISABLE_ASSERTS

#if defined(WAVE_ASSERT_ENABLE_DEBUG_ASSERTS)

# define WAVE_debug(condition)                              WAVE_assert(condition)
# define WAVE_debugv(condition, /* message[, args] */...)   WAVE_assertv(condition, __VA_ARGS__)

#else // !WAVE_ASSERT_ENABLE_DEBUG_ASSERTS

# define WAVE_debug(condition)                              ((void)0)
# define WAVE_debugv(condition, /* message[, args] */...)   ((void)0)

#endif // WAVE_ASSERT_ENABLE_DEBUG_ASSERTS
// clang-format on

} // namespace wave::utils::asserts

#endif // WAVE_ASSERTS_H
