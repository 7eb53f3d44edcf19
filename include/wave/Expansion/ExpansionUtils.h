// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_EXPANSION_EXPANSIONUTILS_H
#define WAVE_EXPANSION_EXPANSIONUTILS_H

#include "wave/Expansion/DimScaling.h"
#include "wave/IR/DimQuery.h"
#include "wave/IR/Graph.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/SmallVector.h"

#include <cstdint>
#include <optional>
#include <string>

namespace wave {

/// Describes one expansion request: which replica of a node is wanted and, for
/// operands of a reshape, which of its source queries is being resolved.
struct ExpansionMetadata {
  /// The node is coordinate independent and is used as is.
  bool doNotExpand = false;
  DimQuery dimQuery;
  /// Terminal clone of an MMA accumulation chain.
  bool lastMmaNode = false;

  // Reshape operands only.
  std::optional<DimQuery> sourceDimQuery;
  std::optional<unsigned> numQueries;
  std::optional<unsigned> queryIndex;
};

/// Row-major strides of the scaling factors in insertion order, the last
/// dimension varies fastest.
/// Example: {M: 4, N: 2} -> [2, 1]
llvm::SmallVector<std::int64_t> computeStrides(const DimScaling &scaling);

/// The dims of `dims` that have a scaling factor, in the order of `dims`.
llvm::SmallVector<IndexExpr> getIndexedDims(const DimScaling &scaling,
                                            llvm::ArrayRef<IndexExpr> dims);
llvm::SmallVector<IndexExpr> getIndexedDims(const DimScaling &scaling,
                                            const Op &op);

/// Every replica coordinate over the indexed dims of `dims`, in row-major
/// order. Returns a single empty query when no dim is scaled.
llvm::SmallVector<DimQuery> enumerateDimQueries(const DimScaling &scaling,
                                                llvm::ArrayRef<IndexExpr> dims);

/// Position of `query` in the order of `enumerateDimQueries`.
std::int64_t linearizeDimQuery(const DimScaling &scaling,
                               const DimQuery &query);

/// Kernel arguments, scalars and structural ops are never cloned.
bool isExpandable(const Op &op);

/// Name of the clone of `op` at `query`, e.g. `read_shared_M:0_N:1`. Dims
/// with long names are abbreviated to their first four characters and `*`.
std::string getExpandedName(const Graph &graph, const Op &op,
                            const DimQuery &query);

/// Source coordinates of the argument of `reshape` needed by its replica at
/// `query`. Splitting a dim maps the replica to the one source covering it,
/// merging maps it to the contiguous range of sources it concatenates.
llvm::SmallVector<DimQuery> getReshapeDimQueries(const ReshapeOp &reshape,
                                                 const DimQuery &query);

/// Erases the original nodes made dead by expansion, walking backward from
/// `leaves` through operands. Nodes rejected by `isOriginal` and kernel
/// arguments, scalars, iterates and outputs are kept.
void removeOriginalNodes(Graph &graph, llvm::ArrayRef<NodeId> leaves,
                         llvm::function_ref<bool(NodeId)> isOriginal);

/// Erases `NewRegisterOp`s without users.
void removeUnusedRegisters(Graph &graph);

/// Erases `IterArgOp`s without users.
void removeUnusedIterArgs(Graph &graph);

} // namespace wave

#endif // WAVE_EXPANSION_EXPANSIONUTILS_H
