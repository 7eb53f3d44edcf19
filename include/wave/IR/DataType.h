// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_DATATYPE_H
#define WAVE_IR_DATATYPE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <optional>

namespace wave {

/// Element types of buffers, registers and scalar values.
enum class DataType : std::uint8_t {
  f16,
  bf16,
  f32,
  f64,
  i1,
  i8,
  i16,
  i32,
  i64,
  index,
};

inline constexpr std::uint8_t kNumDataTypes =
    static_cast<std::uint8_t>(DataType::index) + 1;

llvm::StringRef getDataTypeName(DataType dtype);

/// Bit width of `dtype`. `index` is reported as 64 bits.
unsigned getBitWidth(DataType dtype);

bool isFloat(DataType dtype);

/// Parses names as printed by `getDataTypeName`.
std::optional<DataType> parseDataType(llvm::StringRef name);

/// Returns true if `dtype` holds one of the enumerators.
inline bool isValidDataType(DataType dtype) {
  return static_cast<std::uint8_t>(dtype) < kNumDataTypes;
}

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, DataType dtype) {
  return os << getDataTypeName(dtype);
}

} // namespace wave

#endif // WAVE_IR_DATATYPE_H
