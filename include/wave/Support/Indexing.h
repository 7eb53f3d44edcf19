// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_SUPPORT_INDEXING_H
#define WAVE_SUPPORT_INDEXING_H

#include "mlir/IR/AffineExpr.h"
#include "mlir/IR/MLIRContext.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace wave {

/// Symbolic index expression: an affine (or semi-affine) expression over named
/// index symbols and integer constants.
using IndexExpr = mlir::AffineExpr;

/// A pair `(from, to)` used by substitutions.
using IndexSubstitution = std::pair<IndexExpr, IndexExpr>;

/// Owns the naming of index symbols and their static bindings for one
/// compilation. Symbols are `mlir::AffineSymbolExpr`s whose position is
/// assigned on first use of a name; the same name always yields the same
/// (uniqued) expression.
class IndexingContext {
public:
  explicit IndexingContext(mlir::MLIRContext *context) : context(context) {}

  IndexingContext(const IndexingContext &) = delete;
  IndexingContext &operator=(const IndexingContext &) = delete;

  mlir::MLIRContext *getContext() const { return context; }

  /// Returns the symbol called `name`, creating it if needed.
  IndexExpr getSymbol(llvm::StringRef name);

  /// Returns the symbol called `name` if it has been created.
  std::optional<IndexExpr> lookupSymbol(llvm::StringRef name) const;

  /// Name of a symbol created by this context.
  llvm::StringRef getSymbolName(IndexExpr symbol) const;

  IndexExpr getConstant(std::int64_t value) const;

  /// Binds `symbol` to a static value. Rebinding overwrites.
  void bindConstant(IndexExpr symbol, std::int64_t value);
  bool isBound(IndexExpr symbol) const;
  const llvm::DenseMap<unsigned, std::int64_t> &getBindings() const {
    return bindings;
  }

  /// Replaces every occurrence of the `from` expressions by the matching `to`
  /// expressions. Constant subexpressions are folded.
  IndexExpr substitute(IndexExpr expr,
                       llvm::ArrayRef<IndexSubstitution> substitutions) const;

  /// Substitutes all static bindings into `expr`.
  IndexExpr substituteBindings(IndexExpr expr) const;

  /// Returns the integer value of `expr` once all static bindings are
  /// substituted, or std::nullopt if the result is still symbolic.
  std::optional<std::int64_t> getStaticValue(IndexExpr expr) const;

  void print(llvm::raw_ostream &os, IndexExpr expr) const;
  std::string str(IndexExpr expr) const;

private:
  mlir::MLIRContext *context;
  llvm::StringMap<unsigned> symbolPositions;
  llvm::SmallVector<std::string> symbolNames;
  llvm::DenseMap<unsigned, std::int64_t> bindings;
};

/// Returns true if `expr` is a bare index symbol.
inline bool isIndexSymbol(IndexExpr expr) {
  return expr && llvm::isa<mlir::AffineSymbolExpr>(expr);
}

/// Returns the dimension symbol a shape entry is derived from, e.g. `K` for
/// `K floordiv 2`. Bare symbols map to themselves. Returns a null expression
/// when `expr` contains no symbol.
IndexExpr inferDim(IndexExpr expr);

/// Returns `inferDim` of each entry, skipping entries without a symbol.
llvm::SmallVector<IndexExpr> inferDims(llvm::ArrayRef<IndexExpr> shape);

} // namespace wave

#endif // WAVE_SUPPORT_INDEXING_H
