// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_EXPANSION_DIMSCALING_H
#define WAVE_EXPANSION_DIMSCALING_H

#include "wave/Constraints/Constraints.h"
#include "wave/IR/Graph.h"

#include "llvm/ADT/MapVector.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>

namespace wave {

/// Number of replicas each dimension of an operation expands into, in the
/// order the dimensions were resolved.
using DimScaling = llvm::MapVector<IndexExpr, std::int64_t>;

/// Computes the expansion factor of every dimension of `node`.
///
/// For each workgroup or tiling constraint on a dimension the node has a
/// nonzero vector width for, the factor is
/// `ceil(tileSize / (waveCount * vectorSize))` where `waveCount` is the
/// hardware waves per block along the workgroup dimension (workgroup dims
/// past 2 share the last entry), or 1 for tiling constraints. When the node's shape uses a derived expression of the
/// dimension (e.g. `K floordiv 2`), the tile size is substituted into that
/// expression. Indexing dims without a constraint get
/// `ceil(extent / vectorSize)` when their extent is static, as does the
/// reduction dim of a `ReduceOp`.
///
/// Fails when there is not exactly one hardware constraint or when a tile
/// size or wave count is not statically known. A tile size that does not
/// divide evenly is reported as a warning on `warnings` and rounded up.
llvm::Expected<DimScaling>
resolveDimensionScaling(const Graph &graph, NodeId node,
                        const ConstraintSet &constraints,
                        llvm::raw_ostream &warnings = llvm::errs());

} // namespace wave

#endif // WAVE_EXPANSION_DIMSCALING_H
