// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/Ops.h"

namespace wave {

llvm::StringRef getOpKindName(OpKind kind) {
  switch (kind) {
  case OpKind::Placeholder:
    return "placeholder";
  case OpKind::IterArg:
    return "iter_arg";
  case OpKind::NewRegister:
    return "register";
  case OpKind::Read:
    return "read";
  case OpKind::Write:
    return "write";
  case OpKind::Unary:
    return "unary";
  case OpKind::Binary:
    return "binary";
  case OpKind::MMA:
    return "mma";
  case OpKind::Reduce:
    return "reduce";
  case OpKind::Reshape:
    return "reshape";
  case OpKind::Iterate:
    return "iterate";
  case OpKind::GetResult:
    return "get_result";
  case OpKind::Output:
    return "output";
  }
  return "<<unknown>>";
}

} // namespace wave
