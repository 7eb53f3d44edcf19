// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_BUILDER_H
#define WAVE_IR_BUILDER_H

#include "wave/IR/Graph.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace wave {

/// Creates operations at the end of the current insertion region and derives
/// their result types and indexing dimensions from their operands.
class GraphBuilder {
public:
  explicit GraphBuilder(Graph &graph)
      : graph(graph), insertionRegion(Graph::kRootRegion) {}

  Graph &getGraph() const { return graph; }

  RegionId getInsertionRegion() const { return insertionRegion; }
  void setInsertionRegion(RegionId region) { insertionRegion = region; }

  /// Memory kernel argument.
  NodeId placeholder(llvm::StringRef name, ShapedType type);
  /// Scalar kernel argument.
  NodeId placeholder(llvm::StringRef name, DataType dtype);

  NodeId newRegister(llvm::StringRef name, ShapedType type, double value);

  NodeId read(llvm::StringRef name, NodeId memory,
              std::optional<std::int64_t> elementsPerThread = std::nullopt,
              std::optional<IndexMapping> mapping = std::nullopt);

  NodeId write(llvm::StringRef name, NodeId value, NodeId memory,
               std::optional<std::int64_t> elementsPerThread = std::nullopt,
               std::optional<IndexMapping> mapping = std::nullopt);

  NodeId unary(llvm::StringRef name, llvm::StringRef function, NodeId operand);

  NodeId binary(llvm::StringRef name, llvm::StringRef function, NodeId lhs,
                NodeId rhs);

  /// `acc + lhs * rhs^T`; the reduction dimension is the first dimension of
  /// `lhs` that `acc` does not index.
  NodeId mma(llvm::StringRef name, NodeId lhs, NodeId rhs, NodeId acc);

  NodeId reduce(llvm::StringRef name, llvm::StringRef function, NodeId source,
                IndexExpr dim, std::optional<NodeId> init = std::nullopt);

  NodeId reshape(llvm::StringRef name, NodeId arg,
                 VectorShapes targetVectorShape);

  /// Creates an iterate over `axis` with a new body region holding one
  /// `IterArgOp` per init value. Use `setInsertionRegion` with
  /// `IterateOp::getBody()` to populate the body.
  NodeId iterate(llvm::StringRef name, IndexExpr axis,
                 llvm::ArrayRef<NodeId> inits);

  /// Loop-carried arguments of `iterate` in init order.
  llvm::SmallVector<NodeId> getIterArgs(NodeId iterate) const;

  NodeId getResult(llvm::StringRef name, NodeId iterate, unsigned index);

  NodeId output(llvm::ArrayRef<NodeId> values);

private:
  template <typename OpT>
  std::unique_ptr<OpT> makeOp(llvm::StringRef name,
                              llvm::ArrayRef<NodeId> operands) const;

  NodeId insert(std::unique_ptr<Op> op);

  const ShapedType &getShapedType(NodeId id) const;

  /// Indexing dims of `dims` followed by those of `extra` not yet present.
  static llvm::SmallVector<IndexExpr>
  mergeDims(llvm::ArrayRef<IndexExpr> dims, llvm::ArrayRef<IndexExpr> extra);

  Graph &graph;
  RegionId insertionRegion;
  unsigned numArgs = 0;
};

} // namespace wave

#endif // WAVE_IR_BUILDER_H
