// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_CONSTRAINTS_CONSTRAINTSETUP_H
#define WAVE_CONSTRAINTS_CONSTRAINTSETUP_H

#include "wave/Constraints/Constraints.h"
#include "wave/IR/Graph.h"

#include "llvm/ADT/MapVector.h"
#include "llvm/Support/Error.h"

#include <array>
#include <cstdint>

namespace wave {

// Setup steps run once on a kernel's constraints before expansion. They fill
// the fields derived from other constraints and from the graph.

/// Creates the induction symbol `$ARG<axis>` of every iterate and stores it
/// on the tiling constraints of that axis.
llvm::MapVector<NodeId, IndexExpr> createInductionVars(Graph &graph,
                                                       ConstraintSet &constraints);

/// Derives wave ids and waves per block of the wave constraints from the
/// workgroup constraints on the same dims. Fills the hardware constraint's
/// waves per block when it was not declared.
llvm::Error initializeWaveConstraints(ConstraintSet &constraints,
                                      IndexingContext &idxc);

/// Sets the trip count of every iterate from the tiling constraint on its
/// axis.
void initializeReductions(Graph &graph, const ConstraintSet &constraints);

/// Replicates the constraints of every alias target on its source and binds
/// the source statically when the target is static.
void initializeSymbolicConstraints(ConstraintSet &constraints,
                                   IndexingContext &idxc);

/// Number of workgroups along each grid dimension. Workgroup dims beyond the
/// third fold into the third.
llvm::Expected<std::array<std::int64_t, 3>>
inferGridShape(const ConstraintSet &constraints, const IndexingContext &idxc);

/// Gives every shaped operation without declared vector shapes the hardware
/// constraint's vector shapes.
llvm::Error assignVectorShapes(Graph &graph, const ConstraintSet &constraints);

} // namespace wave

#endif // WAVE_CONSTRAINTS_CONSTRAINTSETUP_H
