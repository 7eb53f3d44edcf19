// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Support/Indexing.h"

#include "wave/Asserts.h"

namespace wave {

IndexExpr IndexingContext::getSymbol(llvm::StringRef name) {
  auto [it, inserted] = symbolPositions.try_emplace(name, symbolNames.size());
  if (inserted) {
    symbolNames.push_back(name.str());
  }
  return mlir::getAffineSymbolExpr(it->second, context);
}

std::optional<IndexExpr>
IndexingContext::lookupSymbol(llvm::StringRef name) const {
  auto it = symbolPositions.find(name);
  if (it == symbolPositions.end()) {
    return std::nullopt;
  }
  return mlir::getAffineSymbolExpr(it->second, context);
}

llvm::StringRef IndexingContext::getSymbolName(IndexExpr symbol) const {
  auto symbolExpr = llvm::dyn_cast<mlir::AffineSymbolExpr>(symbol);
  WAVE_assertv(symbolExpr, "expected an index symbol");
  unsigned position = symbolExpr.getPosition();
  WAVE_assert_limit(position, symbolNames.size());
  return symbolNames[position];
}

IndexExpr IndexingContext::getConstant(std::int64_t value) const {
  return mlir::getAffineConstantExpr(value, context);
}

void IndexingContext::bindConstant(IndexExpr symbol, std::int64_t value) {
  auto symbolExpr = llvm::dyn_cast<mlir::AffineSymbolExpr>(symbol);
  WAVE_assertv(symbolExpr, "only index symbols can be bound");
  bindings[symbolExpr.getPosition()] = value;
}

bool IndexingContext::isBound(IndexExpr symbol) const {
  auto symbolExpr = llvm::dyn_cast_or_null<mlir::AffineSymbolExpr>(symbol);
  return symbolExpr && bindings.count(symbolExpr.getPosition());
}

IndexExpr IndexingContext::substitute(
    IndexExpr expr, llvm::ArrayRef<IndexSubstitution> substitutions) const {
  if (!expr || substitutions.empty()) {
    return expr;
  }
  llvm::DenseMap<mlir::AffineExpr, mlir::AffineExpr> replacements;
  for (const auto &[from, to] : substitutions) {
    replacements[from] = to;
  }
  return expr.replace(replacements);
}

IndexExpr IndexingContext::substituteBindings(IndexExpr expr) const {
  if (!expr || bindings.empty()) {
    return expr;
  }
  llvm::DenseMap<mlir::AffineExpr, mlir::AffineExpr> replacements;
  for (const auto &[position, value] : bindings) {
    replacements[mlir::getAffineSymbolExpr(position, context)] =
        getConstant(value);
  }
  return expr.replace(replacements);
}

std::optional<std::int64_t>
IndexingContext::getStaticValue(IndexExpr expr) const {
  if (!expr) {
    return std::nullopt;
  }
  IndexExpr resolved = substituteBindings(expr);
  if (auto constant = llvm::dyn_cast<mlir::AffineConstantExpr>(resolved)) {
    return constant.getValue();
  }
  return std::nullopt;
}

static const char *getBinaryOpSpelling(mlir::AffineExprKind kind) {
  switch (kind) {
  case mlir::AffineExprKind::Add:
    return " + ";
  case mlir::AffineExprKind::Mul:
    return " * ";
  case mlir::AffineExprKind::FloorDiv:
    return " floordiv ";
  case mlir::AffineExprKind::CeilDiv:
    return " ceildiv ";
  case mlir::AffineExprKind::Mod:
    return " mod ";
  default:
    return " ? ";
  }
}

void IndexingContext::print(llvm::raw_ostream &os, IndexExpr expr) const {
  if (!expr) {
    os << "<<null>>";
    return;
  }
  if (auto constant = llvm::dyn_cast<mlir::AffineConstantExpr>(expr)) {
    os << constant.getValue();
    return;
  }
  if (auto symbol = llvm::dyn_cast<mlir::AffineSymbolExpr>(expr)) {
    if (symbol.getPosition() < symbolNames.size()) {
      os << symbolNames[symbol.getPosition()];
    } else {
      os << 's' << symbol.getPosition();
    }
    return;
  }
  if (auto dim = llvm::dyn_cast<mlir::AffineDimExpr>(expr)) {
    os << 'd' << dim.getPosition();
    return;
  }
  auto binary = llvm::cast<mlir::AffineBinaryOpExpr>(expr);
  auto printOperand = [&](IndexExpr operand) {
    bool nested = llvm::isa<mlir::AffineBinaryOpExpr>(operand);
    if (nested) {
      os << '(';
    }
    print(os, operand);
    if (nested) {
      os << ')';
    }
  };
  printOperand(binary.getLHS());
  os << getBinaryOpSpelling(binary.getKind());
  printOperand(binary.getRHS());
}

std::string IndexingContext::str(IndexExpr expr) const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os, expr);
  return os.str();
}

IndexExpr inferDim(IndexExpr expr) {
  if (!expr) {
    return expr;
  }
  IndexExpr dim;
  expr.walk([&](mlir::AffineExpr subExpr) {
    if (!dim && llvm::isa<mlir::AffineSymbolExpr>(subExpr)) {
      dim = subExpr;
    }
  });
  return dim;
}

llvm::SmallVector<IndexExpr> inferDims(llvm::ArrayRef<IndexExpr> shape) {
  llvm::SmallVector<IndexExpr> dims;
  for (IndexExpr entry : shape) {
    if (IndexExpr dim = inferDim(entry)) {
      dims.push_back(dim);
    }
  }
  return dims;
}

} // namespace wave
