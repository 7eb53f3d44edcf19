// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_INDEXMAPPING_H
#define WAVE_IR_INDEXMAPPING_H

#include "wave/Support/Indexing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>

namespace wave {

/// Insertion-ordered map from a coordinate symbol to an index expression.
using SymbolsMap = llvm::MapVector<IndexExpr, IndexExpr>;

/// Coordinate transform between an iteration domain and the input and output
/// coordinate spaces of a memory access. The iteration domain is spanned by
/// the iterator symbols `$index0 .. $index<N-1>` and its shape is inferred by
/// unifying each iterator with the coordinate symbol it is mapped to
/// verbatim.
///
/// Instances are immutable; `substitute` returns a new mapping.
class IndexMapping {
public:
  /// Builds a mapping over `numIterators` iterators. Fails if an iterator is
  /// unified with two different coordinate symbols or never appears verbatim
  /// in `inputs` or `outputs`.
  static llvm::Expected<IndexMapping>
  get(IndexingContext &idxc, unsigned numIterators, SymbolsMap inputs,
      SymbolsMap outputs, llvm::ArrayRef<SymbolsMap> dynamicValMappings = {});

  /// Iterator symbol `$index<index>`.
  static IndexExpr iterator(IndexingContext &idxc, unsigned index);

  /// Dynamic value symbol `$dynamic_val<index>`.
  static IndexExpr dynamicVal(IndexingContext &idxc, unsigned index);

  unsigned getNumIterators() const { return iters.size(); }
  unsigned getNumDynamicVals() const { return dynamicValIndices.size(); }

  /// Iterator symbols in position order.
  llvm::ArrayRef<IndexExpr> getIters() const { return iters; }

  /// Position of iterator `symbol`, if it is one of this mapping's iterators.
  std::optional<unsigned> getIterIndex(IndexExpr symbol) const;

  /// Coordinate symbol unified with each iterator.
  llvm::ArrayRef<IndexExpr> getIterationShape() const {
    return iterationShape;
  }

  const SymbolsMap &getInputMapping() const { return inputMapping; }
  const SymbolsMap &getOutputMapping() const { return outputMapping; }
  llvm::ArrayRef<SymbolsMap> getDynamicValMappings() const {
    return dynamicValMappings;
  }

  /// Dynamic value symbols in position order.
  llvm::ArrayRef<IndexExpr> getDynamicValIndices() const {
    return dynamicValIndices;
  }

  /// Coordinate symbols of the input space in declared order.
  llvm::SmallVector<IndexExpr> getInputShape() const;
  /// Coordinate symbols of the output space in declared order.
  llvm::SmallVector<IndexExpr> getOutputShape() const;

  /// Mapped input expressions in declared coordinate order.
  llvm::SmallVector<IndexExpr> mapInputIndices() const;
  /// Mapped input expressions in the order of `symbols`.
  llvm::Expected<llvm::SmallVector<IndexExpr>>
  mapInputIndices(llvm::ArrayRef<IndexExpr> symbols) const;

  llvm::SmallVector<IndexExpr> mapOutputIndices() const;
  llvm::Expected<llvm::SmallVector<IndexExpr>>
  mapOutputIndices(llvm::ArrayRef<IndexExpr> symbols) const;

  /// True if the input mapping reproduces the iterators in order.
  bool isInputIdentity() const;
  /// True if the output mapping reproduces the iterators in order.
  bool isOutputIdentity() const;
  bool isIdentity() const { return isInputIdentity() && isOutputIdentity(); }

  /// Returns a new mapping with `substitutions` applied to every mapped
  /// expression, dynamic value mappings included.
  llvm::Expected<IndexMapping>
  substitute(llvm::ArrayRef<IndexSubstitution> substitutions) const;

  void print(llvm::raw_ostream &os) const;

private:
  explicit IndexMapping(IndexingContext &idxc) : idxc(&idxc) {}

  llvm::Expected<llvm::SmallVector<IndexExpr>>
  mapIndices(const SymbolsMap &mapping,
             llvm::ArrayRef<IndexExpr> symbols) const;

  IndexingContext *idxc;
  llvm::SmallVector<IndexExpr> iters;
  llvm::SmallVector<IndexExpr> iterationShape;
  SymbolsMap inputMapping;
  SymbolsMap outputMapping;
  llvm::SmallVector<SymbolsMap> dynamicValMappings;
  llvm::SmallVector<IndexExpr> dynamicValIndices;
};

} // namespace wave

#endif // WAVE_IR_INDEXMAPPING_H
