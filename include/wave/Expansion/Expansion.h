// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_EXPANSION_EXPANSION_H
#define WAVE_EXPANSION_EXPANSION_H

#include "wave/Constraints/Constraints.h"
#include "wave/Expansion/DimScaling.h"
#include "wave/Expansion/ExpansionUtils.h"
#include "wave/IR/Graph.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace wave {

struct ExpansionOptions {
  /// Erase the original nodes and the registers and iteration arguments left
  /// without users.
  bool removeDeadNodes = true;
  /// Check that every remaining node carries a replica coordinate. Only
  /// applies together with `removeDeadNodes`.
  bool verify = true;
};

/// State of one expansion of a graph. Every node is cloned at most once per
/// replica coordinate; the clones of a node are inserted right after it in
/// creation order.
class ExpansionSession {
public:
  ExpansionSession(Graph &graph, const ConstraintSet &constraints);

  ExpansionSession(const ExpansionSession &) = delete;
  ExpansionSession &operator=(const ExpansionSession &) = delete;

  /// Expands every sink, iterate and graph output of the root region.
  llvm::Error expandAll();

  /// Returns the clone of `node` at `query` projected onto the dims `node` is
  /// scaled along, creating it and the clones it depends on if needed.
  llvm::Expected<NodeId> expandNode(NodeId node, const DimQuery &query);

  /// Clones of `node` at every replica coordinate, in row-major order.
  llvm::Expected<llvm::SmallVector<NodeId>> expandAllCoordinates(NodeId node);

  /// Scaling of `node`, resolved on first use.
  llvm::Expected<const DimScaling &> getScaling(NodeId node);

  std::optional<NodeId> lookupClone(NodeId node, const DimQuery &query) const;
  unsigned getNumClones() const { return memo.size(); }

  bool isOriginal(NodeId node) const { return node < numOriginal; }
  llvm::ArrayRef<NodeId> getLeafNodes() const { return leaves; }

  /// Cleanup once all clones exist.
  void removeDeadNodes();

private:
  using MemoKey = std::pair<NodeId, DimQuery::Key>;

  /// Loop-carried values of an iterate, flattened over their replicas.
  struct IterateInfo {
    llvm::SmallVector<NodeId> iterArgs;
    /// First flattened index of each init.
    llvm::SmallVector<std::int64_t> offsets;
    llvm::SmallVector<llvm::SmallVector<DimQuery>> queries;
  };

  llvm::Expected<DimQuery> normalizeQuery(NodeId node, const DimQuery &query);

  llvm::Expected<NodeId> resolveOperand(NodeId operand,
                                        const ExpansionMetadata &metadata);
  llvm::Expected<llvm::SmallVector<NodeId>>
  resolveOperands(NodeId node, ExpansionMetadata &metadata);
  llvm::Expected<llvm::SmallVector<NodeId>>
  resolveMMAOperands(NodeId node, ExpansionMetadata &metadata);
  llvm::Expected<llvm::SmallVector<NodeId>>
  resolveReduceOperands(NodeId node, const ExpansionMetadata &metadata);
  llvm::Expected<llvm::SmallVector<NodeId>>
  resolveReshapeOperands(NodeId node, const ExpansionMetadata &metadata);

  NodeId createClone(NodeId node, const ExpansionMetadata &metadata,
                     llvm::ArrayRef<NodeId> operands);

  llvm::Expected<const IterateInfo &> getIterateInfo(NodeId iterate);
  llvm::Expected<std::int64_t> getFlattenedIndex(NodeId iterate,
                                                 unsigned index,
                                                 const DimQuery &query);
  llvm::Error expandIterate(NodeId iterate);
  llvm::Error expandRegion(RegionId region);
  llvm::Error expandOutput(NodeId output);

  Graph &graph;
  const ConstraintSet &constraints;
  NodeId numOriginal;

  std::map<MemoKey, NodeId> memo;
  std::map<NodeId, DimScaling> scalings;
  std::map<NodeId, IterateInfo> iterates;
  llvm::DenseMap<NodeId, NodeId> lastClone;
  llvm::DenseSet<NodeId> expandedIterates;
  llvm::SmallVector<NodeId> leaves;
};

/// Rewrites `graph` in place so that every operation is replicated once per
/// replica coordinate of the dims it is scaled along, as derived from
/// `constraints`. Fails on an invalid constraint set or on a quantity that is
/// not statically known.
llvm::Error expandGraph(Graph &graph, const ConstraintSet &constraints,
                        ExpansionOptions options = {});

/// Fails if a remaining operation other than a kernel argument, scalar,
/// iterate or output has no replica coordinate.
llvm::Error verifyExpandedGraph(const Graph &graph);

} // namespace wave

#endif // WAVE_EXPANSION_EXPANSION_H
