// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/DataType.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

namespace wave {

llvm::StringRef getDataTypeName(DataType dtype) {
  switch (dtype) {
  case DataType::f16:
    return "f16";
  case DataType::bf16:
    return "bf16";
  case DataType::f32:
    return "f32";
  case DataType::f64:
    return "f64";
  case DataType::i1:
    return "i1";
  case DataType::i8:
    return "i8";
  case DataType::i16:
    return "i16";
  case DataType::i32:
    return "i32";
  case DataType::i64:
    return "i64";
  case DataType::index:
    return "index";
  }
  return "<<invalid>>";
}

unsigned getBitWidth(DataType dtype) {
  switch (dtype) {
  case DataType::i1:
    return 1;
  case DataType::i8:
    return 8;
  case DataType::f16:
  case DataType::bf16:
  case DataType::i16:
    return 16;
  case DataType::f32:
  case DataType::i32:
    return 32;
  case DataType::f64:
  case DataType::i64:
  case DataType::index:
    return 64;
  }
  llvm_unreachable("invalid data type");
}

bool isFloat(DataType dtype) {
  switch (dtype) {
  case DataType::f16:
  case DataType::bf16:
  case DataType::f32:
  case DataType::f64:
    return true;
  default:
    return false;
  }
}

std::optional<DataType> parseDataType(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<DataType>>(name)
      .Case("f16", DataType::f16)
      .Case("bf16", DataType::bf16)
      .Case("f32", DataType::f32)
      .Case("f64", DataType::f64)
      .Case("i1", DataType::i1)
      .Case("i8", DataType::i8)
      .Case("i16", DataType::i16)
      .Case("i32", DataType::i32)
      .Case("i64", DataType::i64)
      .Case("index", DataType::index)
      .Default(std::nullopt);
}

} // namespace wave
