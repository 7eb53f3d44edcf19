// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_UTILS_H
#define WAVE_UTILS_H

#include "wave/Asserts.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"

#include <cstdint>
#include <functional>
#include <iterator>
#include <numeric>
#include <string>

namespace wave::utils {

template <typename T>
constexpr T ceilDiv(T numerator, T denominator) {
  return (numerator + denominator - 1) / denominator;
}

template <typename Iter>
auto product(const Iter begin, const Iter end) ->
    typename std::iterator_traits<Iter>::value_type {
  using ValueType = typename std::iterator_traits<Iter>::value_type;
  return std::accumulate(begin, end, static_cast<ValueType>(1),
                         std::multiplies<ValueType>());
}

// Row-major strides of `shape`, the last dimension varies fastest.
// Example: [4, 2] -> [2, 1]
template <typename T>
inline llvm::SmallVector<T> calculateStrides(llvm::ArrayRef<T> shape) {
  llvm::SmallVector<T> strides(shape.size());
  T stride = 1;
  for (std::int64_t i = static_cast<std::int64_t>(shape.size()) - 1; i >= 0;
       --i) {
    strides[i] = stride;
    stride *= shape[i];
  }
  return strides;
}

// Invokes `fn` on every point of the index space `[0, shape)` in row-major
// order. A rank-0 shape has exactly one (empty) point.
template <typename Fn>
inline void sample(llvm::ArrayRef<std::int64_t> shape, Fn fn) {
  llvm::SmallVector<std::int64_t, 8> index(shape.size());
  if (shape.empty()) {
    fn(index);
    return;
  }
  llvm::SmallVector<std::int64_t> strides = calculateStrides(shape);
  std::int64_t volume = shape[0] * strides[0];
  for (std::int64_t i = 0; i < volume; ++i) {
    for (unsigned j = 0; j < shape.size(); ++j) {
      index[j] = (i / strides[j]) % shape[j];
    }
    fn(index);
  }
}

// Returns a string that is the concatenation of the string representations of
// Range R elements interleaved with separator. Example: join({1, 2, 3}, ", ")
// -> "1, 2, 3"
template <typename Range>
std::string join(Range &&R, llvm::StringRef separator) {
  return llvm::join(
      llvm::map_range(R, [](auto &v) { return llvm::Twine(v).str(); }),
      separator);
}

} // namespace wave::utils

#endif // WAVE_UTILS_H
