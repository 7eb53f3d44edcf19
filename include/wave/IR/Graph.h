// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_GRAPH_H
#define WAVE_IR_GRAPH_H

#include "wave/IR/Ops.h"
#include "wave/Support/Indexing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <utility>
#include <vector>

namespace wave {

/// Arena of operations addressed by stable `NodeId`s. Operations live in
/// ordered regions: the root region and one body region per `IterateOp`.
/// Erased operations keep their slot so that ids are never reused.
class Graph {
public:
  static constexpr RegionId kRootRegion = 0;

  explicit Graph(IndexingContext &idxc);

  Graph(const Graph &) = delete;
  Graph &operator=(const Graph &) = delete;

  IndexingContext &getIndexingContext() const { return *idxc; }

  /// Creates an empty region owned by `parent` (an `IterateOp`).
  RegionId createRegion(NodeId parent);
  NodeId getRegionParent(RegionId region) const;
  unsigned getNumRegions() const { return regions.size(); }

  /// Appends `op` to `region` and registers it as a user of its operands.
  NodeId append(RegionId region, std::unique_ptr<Op> op);

  /// Inserts `op` right after `anchor`, in the region of `anchor`.
  NodeId insertAfter(NodeId anchor, std::unique_ptr<Op> op);

  /// Inserts a copy of `original` right after `anchor`. The copy has the same
  /// operands and no users.
  NodeId cloneAfter(NodeId original, NodeId anchor);

  /// Number of arena slots, erased operations included.
  unsigned size() const { return ops.size(); }

  Op &getOp(NodeId id);
  const Op &getOp(NodeId id) const;

  template <typename OpT>
  OpT &getOpAs(NodeId id) {
    return llvm::cast<OpT>(getOp(id));
  }
  template <typename OpT>
  const OpT &getOpAs(NodeId id) const {
    return llvm::cast<OpT>(getOp(id));
  }

  void setOperand(NodeId user, unsigned index, NodeId value);
  void setOperands(NodeId user, llvm::ArrayRef<NodeId> values);

  /// Removes `id` from the graph. The operation must not have users.
  void erase(NodeId id);

  /// Live operations of `region` in order.
  llvm::SmallVector<NodeId> getRegionOps(RegionId region) const;

  /// Live operations of all regions: an iterate's body follows the iterate.
  llvm::SmallVector<NodeId> getAllOps() const;

  /// Calls `fn` on every operation of `getAllOps()` that is still live when
  /// it is reached. `fn` may erase operations.
  void walk(llvm::function_ref<void(Op &)> fn);

  /// The `OutputOp` terminating `region`, or kInvalidNodeId.
  NodeId getRegionOutput(RegionId region) const;

  void print(llvm::raw_ostream &os) const;

private:
  struct Region {
    NodeId parent = kInvalidNodeId;
    NodeId first = kInvalidNodeId;
    NodeId last = kInvalidNodeId;
  };

  NodeId add(std::unique_ptr<Op> op);
  void addUses(NodeId user);
  void removeUse(NodeId value, NodeId user);
  void collectOps(RegionId region, llvm::SmallVectorImpl<NodeId> &result) const;
  void printRegion(llvm::raw_ostream &os, RegionId region,
                   unsigned indent) const;

  IndexingContext *idxc;
  std::vector<std::unique_ptr<Op>> ops;
  llvm::SmallVector<Region> regions;
};

/// Kernel argument index and dimension position a shape symbol can be read
/// from at launch time. The first memory placeholder declaring a symbol wins.
using SymbolArgumentMap =
    llvm::MapVector<IndexExpr, std::pair<unsigned, unsigned>>;

SymbolArgumentMap getSymbolArgumentMap(const Graph &graph);

} // namespace wave

#endif // WAVE_IR_GRAPH_H
